#ifndef LMC_DECODER_H
#define LMC_DECODER_H

#include <map>
#include <string>
#include <vector>
#include "lmc_image.h"

class Machine;

// Mnemonic and operand for a decoded word, e.g. "ADD 42", "INP", "??? (4, 12)"
std::string disassemble(int opcode, int address);
std::string disassembleWord(int word);

// 10x10 grid of memory words plus the current instruction
std::string formatMemory(const Machine& machine);
// Registers, flags, run state and error of a machine
std::string formatRegisters(const Machine& machine);
// One line per image entry: address, word, disassembly and any label at that address
std::string formatListing(const MemoryImage& image, const std::map<std::string, int>& labels = {});

// Framed panel with a title row, one row per line; colour adds ANSI escapes
std::string formatBox(const std::string& title, const std::vector<std::string>& lines, bool colour = true);

int decoder_main(int argc, char* argv[], bool debug);

#endif // LMC_DECODER_H
