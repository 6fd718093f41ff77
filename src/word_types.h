#ifndef WORD_TYPES_H
#define WORD_TYPES_H

#include "common_defs.h"

// Tens-complement in base 1000: 0..499 are non-negative, 500..999 stand for -500..-1.
inline int toUnsigned(int value) {
    return value < 0 ? WORD_BASE + value : value;
}

inline int toSigned(int word) {
    return word >= WORD_BASE / 2 ? word - WORD_BASE : word;
}

inline bool isValidWord(int value) {
    return value >= 0 && value < WORD_BASE;
}

inline bool isValidAddress(int address) {
    return address >= 0 && address < MEMORY_SIZE;
}

// Current instruction register contents: the decoded digits of a word
struct InstructionDigits {
    int opcode = 0;  // hundreds digit
    int address = 0; // tens and units
};

inline InstructionDigits splitWord(int word) {
    return {word / MEMORY_SIZE, word % MEMORY_SIZE};
}

inline Opcode decodeOpcode(int code, int address) {
    switch (code) {
        case 0: return Opcode::HLT;
        case 1: return Opcode::ADD;
        case 2: return Opcode::SUB;
        case 3: return Opcode::STA;
        case 5: return Opcode::LDA;
        case 6: return Opcode::BRA;
        case 7: return Opcode::BRZ;
        case 8: return Opcode::BRP;
        case 9:
            if (address == 1) return Opcode::INP;
            if (address == 2) return Opcode::OUT;
            return Opcode::BAD;
        default:
            return Opcode::BAD;
    }
}

#endif // WORD_TYPES_H
