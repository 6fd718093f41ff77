#ifndef LMC_ASSEMBLER_H
#define LMC_ASSEMBLER_H

#include <map>
#include <string>
#include <variant>
#include <vector>
#include "common_defs.h"
#include "lmc_image.h"
#include "lmc_lexer.h"

// A word whose value is already known
struct LiteralWord {
    int value = 0;
};

// A memory-referencing instruction waiting for its address
struct PendingRef {
    int opcodeBase = 0;                     // 100, 200, ... 800
    std::variant<int, std::string> target;  // literal address or label name
    int line = 0;
    int column = 0;
};

using EmittedValue = std::variant<LiteralWord, PendingRef>;

struct EmittedWord {
    int address = 0;
    EmittedValue value;
};

class Assembler {
    std::map<std::string, int> labelMap; // lower-cased label -> address
    std::vector<EmittedWord> emitted;
    int location = 0;
    bool debugMode = false;

    // Private methods
    void defineLabel(const Token& label);
    void emit(const ParsedLine& line, EmittedValue value);
    void assembleLine(const ParsedLine& line);
    int resolveTarget(const PendingRef& ref) const;
    MemoryImage resolve() const;

public:
    void setDebugMode(bool debug) { debugMode = debug; }
    void reset();

    // Throws AssemblyError on the first problem; no partial image is produced
    MemoryImage assemble(const std::string& source);

    // Labels bound by the last assemble() call
    const std::map<std::string, int>& labels() const { return labelMap; }
};

MemoryImage assemble(const std::string& source);

std::string readSourceFile(const std::string& path);

// Assemble a source file, or read an image file if the path ends in .bin
MemoryImage loadProgram(const std::string& path, bool debug = false);

// Declare the standalone main function for the assembler
int lmc_assembler_main(int argc, char* argv[], bool debug);

#endif // LMC_ASSEMBLER_H
