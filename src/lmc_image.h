#ifndef LMC_IMAGE_H
#define LMC_IMAGE_H

#include <string>
#include <vector>
#include "common_defs.h"

// One assembled word and where it goes
struct ImageEntry {
    int address = 0; // 0..99
    int value = 0;   // 0..999

    bool operator==(const ImageEntry& other) const {
        return address == other.address && value == other.value;
    }
};

// Assembler output in emission order, consumed by Machine::load
using MemoryImage = std::vector<ImageEntry>;

// Throws std::out_of_range on the first entry that does not fit the machine
void validateImage(const MemoryImage& image);

void writeImageFile(const MemoryImage& image, const std::string& path, bool debug = false);
MemoryImage readImageFile(const std::string& path, bool debug = false);

#endif // LMC_IMAGE_H
