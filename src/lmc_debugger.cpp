#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include "lmc_assembler.h"
#include "lmc_decoder.h"
#include "lmc_lexer.h"

// Include own header
#include "lmc_debugger.h"

Tracer::Tracer(Machine& target, std::istream& input, std::ostream& console)
    : machine(target), in(input), out(console), output(std::make_shared<IntWriter>(false, "\n")) {
    machine.setInput(std::make_shared<StreamReader>(in, &out));
    machine.setOutput(output);
}

void Tracer::reportState() {
    out << formatRegisters(machine);
    if (machine.runState() == RunState::HALTED) {
        out << "Program halted" << std::endl;
    } else if (machine.runState() == RunState::ABORTED) {
        out << "Program aborted: " << machine.errorMessage() << std::endl;
    }
}

void Tracer::step(long long count) {
    if (machine.runState() != RunState::RUNNING) {
        out << "Machine is " << runStateName(machine.runState()) << ", reset to run again" << std::endl;
        return;
    }
    for (long long i = 0; i < count && machine.runState() == RunState::RUNNING; ++i) {
        machine.singleStep();
    }
    reportState();
}

void Tracer::continueRun() {
    if (machine.runState() != RunState::RUNNING) {
        out << "Machine is " << runStateName(machine.runState()) << ", reset to run again" << std::endl;
        return;
    }
    long long taken = 0;
    do {
        machine.singleStep();
        taken++;
        if (breakpoints.count(machine.getPC()) && machine.runState() == RunState::RUNNING) {
            out << "Breakpoint hit at " << machine.getPC() << std::endl;
            break;
        }
    } while (machine.runState() == RunState::RUNNING && taken < stepBudget);

    if (machine.runState() == RunState::RUNNING && taken >= stepBudget) {
        out << "Stopped after " << taken << " steps" << std::endl;
    }
    reportState();
}

void Tracer::decompile(int address, int count) {
    for (int i = 0; i < count; ++i) {
        int addr = (address + i) % MEMORY_SIZE;
        int word = machine.readMemory(addr);
        out << (addr == machine.getPC() ? "=> " : "   ")
            << (addr < 10 ? "0" : "") << addr << " | " << word << " | " << disassembleWord(word) << std::endl;
    }
}

void Tracer::printHelp() {
    out << "Tracer commands:" << std::endl;
    out << "    help - Show this message" << std::endl;
    out << "    step <amount> - step one instruction or <amount> instructions" << std::endl;
    out << "    s <amount> - aliases of step <amount>" << std::endl;
    out << "    continue - run until the program stops or a breakpoint is hit" << std::endl;
    out << "    c - aliases of continue" << std::endl;
    out << "    breakpoint (addr) - toggle a breakpoint at addr" << std::endl;
    out << "    b (addr) - aliases of breakpoint (addr)" << std::endl;
    out << "    decompile <addr> <size> - show <size> words at the PC or <addr> if given" << std::endl;
    out << "    d - aliases of decompile <addr> <size>" << std::endl;
    out << "    regs - registers and flags" << std::endl;
    out << "    memory - memory dump" << std::endl;
    out << "    m - aliases of memory" << std::endl;
    out << "    output - values written by OUT so far" << std::endl;
    out << "    reset - registers back to power-on values, memory kept" << std::endl;
    out << "    r - aliases of reset" << std::endl;
    out << "    exit - quit the tracer" << std::endl;
    out << "    q - aliases of exit" << std::endl;
}

static int parseArgument(const std::string& text, int low, int high) {
    int value = 0;
    if (!parseDecimal(text, value) || value < low || value > high) {
        throw std::invalid_argument("Expected a number in [" + std::to_string(low) + " ... " +
                                    std::to_string(high) + "], got '" + text + "'");
    }
    return value;
}

bool Tracer::handleCommand(const std::vector<std::string>& tokens) {
    const std::string& cmd = tokens[0];
    if (cmd == "step" || cmd == "s") {
        step(tokens.size() > 1 ? parseArgument(tokens[1], 1, 1000000) : 1);
    } else if (cmd == "continue" || cmd == "c") {
        continueRun();
    } else if (cmd == "breakpoint" || cmd == "b") {
        if (tokens.size() < 2) {
            out << "Missing addr" << std::endl;
            return true;
        }
        int addr = parseArgument(tokens[1], 0, MEMORY_SIZE - 1);
        if (breakpoints.erase(addr)) {
            out << "Removed breakpoint at " << addr << std::endl;
        } else {
            breakpoints.insert(addr);
            out << "Put breakpoint at " << addr << std::endl;
        }
    } else if (cmd == "decompile" || cmd == "d") {
        int addr = tokens.size() > 1 ? parseArgument(tokens[1], 0, MEMORY_SIZE - 1) : machine.getPC();
        int size = tokens.size() > 2 ? parseArgument(tokens[2], 1, MEMORY_SIZE) : 1;
        decompile(addr, size);
    } else if (cmd == "regs") {
        out << formatRegisters(machine);
    } else if (cmd == "memory" || cmd == "m") {
        out << formatMemory(machine);
    } else if (cmd == "output") {
        out << output->str() << std::endl;
    } else if (cmd == "reset" || cmd == "r") {
        machine.reset();
        output->reset();
        reportState();
    } else if (cmd == "exit" || cmd == "q") {
        out << "Goodbye!" << std::endl;
        return false;
    } else if (cmd == "help") {
        printHelp();
    } else {
        out << "Unknown command: " << cmd << std::endl;
    }
    return true;
}

void Tracer::run() {
    out << "\nWelcome to the LMC tracer. Run help for a list of all commands\n";
    reportState();
    while (true) {
        out << prompt << std::flush;
        std::string input;
        if (!std::getline(in, input)) break;

        if (input.empty())
            input = prevCmd;
        else
            prevCmd = input;

        std::vector<std::string> tokens;
        std::istringstream ss(input);
        std::string token;
        while (ss >> token) tokens.push_back(token);
        if (tokens.empty()) continue;

        try {
            if (!handleCommand(tokens)) break;
        } catch (const std::invalid_argument& e) {
            out << e.what() << std::endl;
        }
    }
}

int lmc_tracer_main(int argc, char* argv[], bool debug) {
    if (argc < 1) {
        std::cerr << "Tracer Usage: <program.lmc|image.bin>" << std::endl;
        return 1;
    }

    try {
        Machine machine;
        machine.setDebugMode(debug);
        machine.load(loadProgram(argv[0], debug));

        Tracer tracer(machine, std::cin, std::cout);
        if (const char* ps1 = std::getenv("LMC_TRACER_PS1")) tracer.setPrompt(ps1);
        tracer.run();
        return machine.runState() == RunState::ABORTED ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
