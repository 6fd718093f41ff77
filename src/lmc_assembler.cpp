#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <algorithm> // Required for std::transform
#include <cctype>

#if __has_include(<filesystem>)
    #include <filesystem>
    namespace fs = std::filesystem;
#elif __has_include(<experimental/filesystem>)
    #include <experimental/filesystem>
    namespace fs = std::experimental::filesystem;
#else
    #error "Neither <filesystem> nor <experimental/filesystem> is available."
#endif

#include "lmc_assembler.h"
#include "word_types.h"

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text;
}

static int opcodeBase(Operation op) {
    switch (op) {
        case Operation::ADD: return OPBASE_ADD;
        case Operation::SUB: return OPBASE_SUB;
        case Operation::STA: return OPBASE_STA;
        case Operation::LDA: return OPBASE_LDA;
        case Operation::BRA: return OPBASE_BRA;
        case Operation::BRZ: return OPBASE_BRZ;
        case Operation::BRP: return OPBASE_BRP;
        default:
            throw std::logic_error("Operation has no opcode base");
    }
}

void Assembler::reset() {
    labelMap.clear();
    emitted.clear();
    location = 0;
}

void Assembler::defineLabel(const Token& label) {
    std::string name = toLower(label.text);
    if (labelMap.count(name)) {
        throw AssemblyError(AssemblyErrorKind::DUPLICATE_LABEL,
                            "Label '" + label.text + "' already defined at address " + std::to_string(labelMap.at(name)),
                            label.line, label.column);
    }
    if (!isValidAddress(location)) {
        throw AssemblyError(AssemblyErrorKind::ADDRESS_OUT_OF_RANGE,
                            "Label '" + label.text + "' bound past address 99, at location " + std::to_string(location),
                            label.line, label.column);
    }
    labelMap[name] = location;
    if (debugMode) {
        std::cout << "[Debug][Assembler] Label " << name << " = " << location << "\n";
    }
}

void Assembler::emit(const ParsedLine& line, EmittedValue value) {
    if (!isValidAddress(location)) {
        throw AssemblyError(AssemblyErrorKind::ADDRESS_OUT_OF_RANGE,
                            "Program does not fit in memory, location " + std::to_string(location) + " is past address 99",
                            line.mnemonic.line, line.mnemonic.column);
    }
    emitted.push_back({location, std::move(value)});
    location++;
}

void Assembler::assembleLine(const ParsedLine& line) {
    if (line.label) defineLabel(*line.label);

    switch (line.operation) {
        case Operation::ORG: {
            int address = 0;
            parseDecimal(line.operand->text, address);
            location = address;
            break;
        }
        case Operation::DAT: {
            int value = 0;
            if (line.operand) {
                const Token& token = *line.operand;
                if (!parseDecimal(token.text, value) || value < -999 || value > 999) {
                    throw AssemblyError(AssemblyErrorKind::VALUE_OUT_OF_RANGE,
                                        "Value " + token.text + " out of range [-999 ... +999]",
                                        token.line, token.column);
                }
            }
            emit(line, LiteralWord{toUnsigned(value)});
            break;
        }
        case Operation::HLT:
            emit(line, LiteralWord{0});
            break;
        case Operation::INP:
            emit(line, LiteralWord{WORD_INP});
            break;
        case Operation::OUT:
            emit(line, LiteralWord{WORD_OUT});
            break;
        case Operation::ADD: case Operation::SUB: case Operation::STA: case Operation::LDA:
        case Operation::BRA: case Operation::BRZ: case Operation::BRP: {
            const Token& operand = *line.operand;
            PendingRef ref;
            ref.opcodeBase = opcodeBase(line.operation);
            ref.line = operand.line;
            ref.column = operand.column;
            if (operand.type == TokenType::LABEL) {
                ref.target = operand.text;
            } else {
                int address = 0;
                parseDecimal(operand.text, address);
                ref.target = address;
            }
            emit(line, ref);
            break;
        }
    }
}

int Assembler::resolveTarget(const PendingRef& ref) const {
    if (const int* address = std::get_if<int>(&ref.target)) return *address;

    const std::string& label = std::get<std::string>(ref.target);
    auto it = labelMap.find(toLower(label));
    if (it == labelMap.end()) {
        throw AssemblyError(AssemblyErrorKind::UNDEFINED_LABEL, "Undefined label '" + label + "'", ref.line, ref.column);
    }
    return it->second;
}

MemoryImage Assembler::resolve() const {
    MemoryImage image;
    image.reserve(emitted.size());
    for (const auto& word : emitted) {
        if (const LiteralWord* literal = std::get_if<LiteralWord>(&word.value)) {
            image.push_back({word.address, literal->value});
        } else {
            const PendingRef& ref = std::get<PendingRef>(word.value);
            image.push_back({word.address, ref.opcodeBase + resolveTarget(ref)});
        }
    }
    return image;
}

MemoryImage Assembler::assemble(const std::string& source) {
    reset();
    // First pass: bind labels, emit literals and placeholders
    for (const auto& line : parseSource(source)) {
        assembleLine(line);
    }
    // Second pass: fix up references now that every label is known
    MemoryImage image = resolve();
    if (debugMode) {
        std::cout << "[Debug][Assembler] " << image.size() << " words, " << labelMap.size() << " labels\n";
    }
    return image;
}

MemoryImage assemble(const std::string& source) {
    Assembler assembler;
    return assembler.assemble(source);
}

std::string readSourceFile(const std::string& path) {
    std::ifstream fileStream(path);
    if (!fileStream) {
        throw std::runtime_error("Could not open source file: " + path);
    }
    std::ostringstream buffer;
    buffer << fileStream.rdbuf();
    return buffer.str();
}

MemoryImage loadProgram(const std::string& path, bool debug) {
    if (fs::path(path).extension() == ".bin") {
        return readImageFile(path, debug);
    }
    Assembler assembler;
    assembler.setDebugMode(debug);
    return assembler.assemble(readSourceFile(path));
}

int lmc_assembler_main(int argc, char* argv[], bool debug) {
    if (argc < 1) {
        std::cerr << "Assembler Usage: <source.lmc> [output.bin]" << std::endl;
        return 1;
    }

    std::string sourceFile = argv[0];
    std::string outputFile;
    if (argc > 1) {
        outputFile = argv[1];
    } else {
        fs::path inputPath(sourceFile);
        outputFile = (inputPath.parent_path() / (inputPath.stem().string() + ".bin")).string();
    }

    try {
        Assembler assembler;
        assembler.setDebugMode(debug);
        MemoryImage image = assembler.assemble(readSourceFile(sourceFile));
        writeImageFile(image, outputFile, debug);

        std::cout << "Assembly successful: " << sourceFile << " -> " << outputFile << std::endl;
    } catch (const AssemblyError& e) {
        std::cerr << "Assembly Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
