#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "lmc_assembler.h"
#include "lmc_decoder.h"
#include "lmc_lexer.h"

// Include own header
#include "lmc_machine.h"

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::RUNNING: return "RUNNING";
        case RunState::HALTED: return "HALTED";
        case RunState::ABORTED: return "ABORTED";
    }
    return "?";
}

// --- Machine Method Definitions ---

void Machine::load(const MemoryImage& image) {
    validateImage(image);
    for (const auto& entry : image) {
        mar = entry.address;
        mdr = entry.value;
        mem[mar] = mdr;
    }
    reset();

    if (debugMode) {
        std::cout << "[Debug][Machine] Loaded " << image.size() << " words\n";
    }
}

void Machine::reset() {
    pc = 0;
    acc = 0;
    mar = 0;
    mdr = 0;
    cir = InstructionDigits{};
    carryDigit = 0;
    setFlags();
    state = RunState::RUNNING;
    lastError = MachineError::NONE;
    errorText.clear();
    stepCount = 0;
}

void Machine::clear() {
    mem.fill(0);
    reset();
}

int Machine::readMemory(int address) const {
    if (!isValidAddress(address)) {
        throw std::out_of_range("Memory read out of bounds at address: " + std::to_string(address));
    }
    return mem[address];
}

void Machine::setFlags() {
    zeroFlag = acc == 0;
    nonNegativeFlag = acc < WORD_BASE / 2;
}

void Machine::truncateAccumulator() {
    carryDigit = acc / WORD_BASE;
    acc %= WORD_BASE;
}

void Machine::abortWith(MachineError error, const std::string& message) {
    lastError = error;
    errorText = message;
    state = RunState::ABORTED;
    if (debugMode) {
        std::cout << "[Debug][Machine]   Aborted: " << message << "\n";
    }
}

void Machine::fetch() {
    mar = pc;
    mdr = mem[mar];
    pc = (pc + 1) % MEMORY_SIZE;
}

void Machine::decode() {
    cir = splitWord(mdr);
    mar = cir.address;
    mdr = mem[mar];
}

void Machine::execute() {
    Opcode opcode = decodeOpcode(cir.opcode, cir.address);
    switch (opcode) {
        case Opcode::HLT:
            state = RunState::HALTED;
            break;
        case Opcode::ADD:
            acc += mdr;
            truncateAccumulator();
            break;
        case Opcode::SUB:
            acc += WORD_BASE - mdr;
            truncateAccumulator();
            break;
        case Opcode::STA:
            mdr = acc;
            mem[mar] = mdr;
            break;
        case Opcode::LDA:
            acc = mdr;
            break;
        case Opcode::BRA:
            pc = mar;
            break;
        case Opcode::BRZ:
            if (zeroFlag) pc = mar;
            break;
        case Opcode::BRP:
            if (nonNegativeFlag) pc = mar;
            break;
        case Opcode::INP: {
            std::optional<int> value;
            if (input) value = input->next();
            if (!value) {
                abortWith(MachineError::END_OF_INPUT, "End of input");
                return;
            }
            if (!isValidWord(*value)) {
                abortWith(MachineError::INPUT_OUT_OF_RANGE,
                      "Input out of range (0.." + std::to_string(WORD_BASE - 1) + "): " + std::to_string(*value));
                return;
            }
            acc = *value;
            break;
        }
        case Opcode::OUT:
            if (output) output->emit(acc);
            break;
        case Opcode::BAD:
            abortWith(MachineError::BAD_INSTRUCTION,
                  "Bad instruction (" + std::to_string(cir.opcode) + ", " + std::to_string(cir.address) + ")");
            return;
    }
    setFlags();
}

void Machine::singleStep() {
    if (state != RunState::RUNNING) return;

    int currentPC = pc;
    fetch();
    decode();
    execute();
    stepCount++;

    if (debugMode) {
        std::cout << "[Debug][Machine] PC: " << currentPC << ": " << disassemble(cir.opcode, cir.address)
                  << " -> ACC=" << acc << " MAR=" << mar << " MDR=" << mdr
                  << " Z=" << zeroFlag << " P=" << nonNegativeFlag << "\n";
    }
}

void Machine::run() {
    while (state == RunState::RUNNING) {
        singleStep();
    }
}

bool Machine::run(long long maxSteps) {
    for (long long i = 0; i < maxSteps && state == RunState::RUNNING; ++i) {
        singleStep();
    }
    return state == RunState::RUNNING;
}

// --- Standalone Run Main Function Definition ---

int lmc_machine_main(int argc, char* argv[], bool debug) {
    std::string programFile;
    bool signedOutput = false;
    long long maxSteps = 100000;
    std::vector<int> inputs;
    bool haveInputs = false;

    // argv[0] here is the *first argument* after "-r", not the program name
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--signed") {
            signedOutput = true;
        } else if (arg == "--unsigned") {
            signedOutput = false;
        } else if (arg == "--max-steps" && i + 1 < argc) {
            int value = 0;
            if (!parseDecimal(argv[++i], value) || value <= 0) {
                std::cerr << "Invalid step budget: " << argv[i] << std::endl;
                return 1;
            }
            maxSteps = value;
        } else if (programFile.empty()) {
            programFile = arg;
        } else {
            int value = 0;
            if (!parseDecimal(arg, value) || value < -WORD_BASE / 2 || value >= WORD_BASE / 2) {
                std::cerr << "Input must be a number in [-500 ... 499]: " << arg << std::endl;
                return 1;
            }
            inputs.push_back(value);
            haveInputs = true;
        }
    }

    if (programFile.empty()) {
        std::cerr << "Run Usage: <program.lmc|image.bin> [inputs...] [--signed] [--max-steps N]" << std::endl;
        return 1;
    }

    try {
        Machine machine;
        machine.setDebugMode(debug);
        machine.load(loadProgram(programFile, debug));

        // Interactive runs prompt on stdin and print each OUT as it happens,
        // so there is no collected output to report afterwards
        std::shared_ptr<IntWriter> collected;
        if (haveInputs) {
            collected = std::make_shared<IntWriter>(signedOutput);
            machine.setInput(std::make_shared<IntReader>(inputs));
            machine.setOutput(collected);
        } else {
            machine.setInput(std::make_shared<StreamReader>(std::cin, &std::cout));
            machine.setOutput(std::make_shared<StreamWriter>(std::cout, signedOutput));
        }

        if (machine.run(maxSteps)) {
            std::cerr << "Error: Step budget of " << maxSteps << " exhausted";
            if (collected) std::cerr << ", output so far: " << collected->str();
            std::cerr << std::endl;
            return 1;
        }
        if (machine.runState() == RunState::ABORTED) {
            std::cerr << "Error: " << machine.errorMessage() << std::endl;
            return 1;
        }
        if (collected) {
            std::cout << "OK " << collected->str() << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
