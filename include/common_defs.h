#ifndef COMMON_DEFS_H
#define COMMON_DEFS_H

#include <cstdint> // Required for uint types

// --- API Export/Import Macros ---
#ifdef _WIN32
    #ifdef LMC_DLL_EXPORT
        #define LMC_API __declspec(dllexport) // Export for DLL
    #else
        #define LMC_API __declspec(dllimport) // Import for client
    #endif
#else
    #define LMC_API __attribute__((visibility("default"))) // GCC/Clang
#endif
// --- End API Macros ---

#define MEMORY_SIZE 100   // words, addresses 00..99
#define WORD_BASE 1000    // three decimal digits per word
#define IMAGE_MAGIC 0x31434D4C // "LMC1" in ASCII (little-endian)
#define IMAGE_VERSION 1

// Header of an assembled image file, followed by entryCount ImageRecords
#pragma pack(push, 1)
struct ImageHeader {
    uint32_t magic = IMAGE_MAGIC;
    uint16_t version = IMAGE_VERSION;
    uint16_t reserved = 0; // Padding/Reserved for future use
    uint32_t entryCount = 0;
};

struct ImageRecord {
    uint8_t address = 0;
    uint16_t value = 0;
};
#pragma pack(pop)

// Decoded operation of a machine word. Codes 1..8 are value / 100,
// INP and OUT share code 9 and are told apart by the address digits.
enum class Opcode : uint8_t {
    HLT, // 0xx
    ADD, // 1xx
    SUB, // 2xx
    STA, // 3xx
    LDA, // 5xx
    BRA, // 6xx
    BRZ, // 7xx
    BRP, // 8xx
    INP, // 901
    OUT, // 902
    BAD  // 4xx, 9xx other than 901/902
};

// Opcode bases used when assembling memory-referencing instructions
#define OPBASE_ADD 100
#define OPBASE_SUB 200
#define OPBASE_STA 300
#define OPBASE_LDA 500
#define OPBASE_BRA 600
#define OPBASE_BRZ 700
#define OPBASE_BRP 800
#define WORD_INP 901
#define WORD_OUT 902

#endif // COMMON_DEFS_H
