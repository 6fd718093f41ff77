#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include "lmc_assembler.h"
#include "lmc_machine.h"
#include "lmc_decoder.h"

#define CLR_RESET   "\033[0m"
#define CLR_HEX    "\033[1;35m"
#define CLR_COMMENT "\033[1;90m"
#define CLR_FRAME   "\033[1;35m"
#define CLR_TITLE   "\033[1;36m"
#define CLR_TEXT    "\033[1;32m"

std::string disassemble(int opcode, int address) {
    std::ostringstream ss;
    switch (decodeOpcode(opcode, address)) {
        case Opcode::HLT: return "HLT";
        case Opcode::ADD: ss << "ADD "; break;
        case Opcode::SUB: ss << "SUB "; break;
        case Opcode::STA: ss << "STA "; break;
        case Opcode::LDA: ss << "LDA "; break;
        case Opcode::BRA: ss << "BRA "; break;
        case Opcode::BRZ: ss << "BRZ "; break;
        case Opcode::BRP: ss << "BRP "; break;
        case Opcode::INP: return "INP";
        case Opcode::OUT: return "OUT";
        case Opcode::BAD:
            return "??? (" + std::to_string(opcode) + ", " + std::to_string(address) + ")";
    }
    ss << std::setw(2) << std::setfill('0') << address;
    return ss.str();
}

std::string disassembleWord(int word) {
    InstructionDigits digits = splitWord(word);
    return disassemble(digits.opcode, digits.address);
}

std::string formatMemory(const Machine& machine) {
    const Machine::Memory& mem = machine.memory();
    std::ostringstream ss;
    ss << "MEMORY ";
    for (int col = 0; col < 10; ++col) ss << std::setw(6) << col;
    ss << "\n" << std::string(7 + 6 * 10, '-') << "\n";
    for (int row = 0; row < MEMORY_SIZE; row += 10) {
        ss << std::setw(4) << row << ":  ";
        for (int col = 0; col < 10; ++col) {
            ss << std::setw(6) << mem[row + col];
        }
        ss << "\n";
    }
    ss << std::string(7 + 6 * 10, '-') << "\n";
    InstructionDigits cir = machine.getCIR();
    ss << "        Current instruction: " << disassemble(cir.opcode, cir.address) << "\n";
    return ss.str();
}

std::string formatRegisters(const Machine& machine) {
    std::ostringstream ss;
    InstructionDigits cir = machine.getCIR();
    ss << std::setfill('0')
       << "PC=" << std::setw(2) << machine.getPC()
       << "  ACC=" << std::setw(3) << machine.getACC()
       << "  MAR=" << std::setw(2) << machine.getMAR()
       << "  MDR=" << std::setw(3) << machine.getMDR()
       << "  CIR=" << cir.opcode << " " << std::setw(2) << cir.address
       << std::setfill(' ') << " (" << disassemble(cir.opcode, cir.address) << ")\n";
    ss << "Z=" << machine.isZero() << "  P=" << machine.isNonNegative()
       << "  C=" << machine.getCarry()
       << "  State=" << runStateName(machine.runState());
    if (!machine.errorMessage().empty()) ss << "  Error: " << machine.errorMessage();
    ss << "\n";
    return ss.str();
}

std::string formatListing(const MemoryImage& image, const std::map<std::string, int>& labels) {
    std::ostringstream ss;
    for (const auto& entry : image) {
        ss << std::setw(2) << std::setfill('0') << entry.address << "  "
           << std::setw(3) << entry.value << "  " << std::setfill(' ')
           << std::setw(12) << std::left << disassembleWord(entry.value) << std::right;
        for (const auto& label : labels) {
            if (label.second == entry.address) ss << " ; " << label.first;
        }
        ss << "\n";
    }
    return ss.str();
}

static std::string repeatGlyph(const char* glyph, size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) out += glyph;
    return out;
}

std::string formatBox(const std::string& title, const std::vector<std::string>& lines, bool colour) {
    const char* frame = colour ? CLR_FRAME : "";
    const char* reset = colour ? CLR_RESET : "";
    size_t width = title.size();
    for (const auto& line : lines) width = std::max(width, line.size());

    const std::string bar = repeatGlyph("═", width + 2);
    auto row = [&](const std::string& text, const char* textColour) {
        return std::string(frame) + "║ " + (colour ? textColour : "") + text +
               std::string(width - text.size(), ' ') + frame + " ║" + reset + "\n";
    };

    std::ostringstream ss;
    ss << frame << "╔" << bar << "╗" << reset << "\n";
    ss << row(title, CLR_TITLE);
    ss << frame << "╠" << bar << "╣" << reset << "\n";
    for (const auto& line : lines) ss << row(line, CLR_TEXT);
    ss << frame << "╚" << bar << "╝" << reset << "\n";
    return ss.str();
}

int decoder_main(int argc, char* argv[], bool debug) {
    if (argc < 1) {
        std::cerr << "Usage: -u <image.bin|program.lmc>" << std::endl;
        return 1;
    }
    std::string path = argv[0];

    try {
        std::map<std::string, int> labels;
        MemoryImage image;
        if (path.size() > 4 && path.substr(path.size() - 4) == ".bin") {
            image = readImageFile(path, debug);
        } else {
            // Sources keep their labels for the listing
            Assembler assembler;
            assembler.setDebugMode(debug);
            image = assembler.assemble(readSourceFile(path));
            labels = assembler.labels();
        }

        std::cout << CLR_HEX << "Image: " << path << " (" << image.size() << " words)" << CLR_RESET << "\n";
        std::cout << CLR_COMMENT << "AD  WRD  INSTRUCTION" << CLR_RESET << "\n";
        std::cout << formatListing(image, labels);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
