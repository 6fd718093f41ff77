#include "lmc_image.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include "word_types.h"

void validateImage(const MemoryImage& image) {
    for (const auto& entry : image) {
        if (!isValidAddress(entry.address)) {
            throw std::out_of_range("Image address " + std::to_string(entry.address) + " outside memory [0 ... 99]");
        }
        if (!isValidWord(entry.value)) {
            throw std::out_of_range("Image value " + std::to_string(entry.value) + " at address " +
                                    std::to_string(entry.address) + " outside word range [0 ... 999]");
        }
    }
}

void writeImageFile(const MemoryImage& image, const std::string& path, bool debug) {
    validateImage(image);

    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("Cannot open output file: " + path);

    ImageHeader header;
    header.entryCount = static_cast<uint32_t>(image.size());
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));

    for (const auto& entry : image) {
        ImageRecord record;
        record.address = static_cast<uint8_t>(entry.address);
        record.value = static_cast<uint16_t>(entry.value);
        out.write(reinterpret_cast<const char*>(&record), sizeof(record));
    }
    if (!out) throw std::runtime_error("Failed to write image file: " + path);

    if (debug) {
        std::cout << "[Debug][Image] Wrote " << image.size() << " words to " << path << "\n";
    }
}

MemoryImage readImageFile(const std::string& path, bool debug) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open image file: " + path);

    ImageHeader header;
    if (!in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
        throw std::runtime_error("Failed to read header from image file: " + path);
    }
    if (header.magic != IMAGE_MAGIC) {
        throw std::runtime_error("Invalid magic number in image file. Not an LMC image.");
    }
    if (header.version != IMAGE_VERSION) {
        throw std::runtime_error("Unsupported image version: " + std::to_string(header.version) +
                                 " (Supported version: " + std::to_string(IMAGE_VERSION) + ")");
    }

    MemoryImage image;
    image.reserve(header.entryCount);
    for (uint32_t i = 0; i < header.entryCount; ++i) {
        ImageRecord record;
        if (!in.read(reinterpret_cast<char*>(&record), sizeof(record))) {
            throw std::runtime_error("Image file truncated after " + std::to_string(i) + " of " +
                                     std::to_string(header.entryCount) + " records");
        }
        image.push_back({record.address, record.value});
    }

    in.peek();
    if (!in.eof()) {
        std::cerr << "Warning: Extra data found in image file after " << header.entryCount << " records." << std::endl;
    }

    validateImage(image);

    if (debug) {
        std::cout << "[Debug][Image] Loading image from: " << path << "\n";
        std::cout << "[Debug][Image]   Header - Magic: 0x" << std::hex << header.magic
                  << ", Version: " << std::dec << header.version
                  << ", Entries: " << header.entryCount << "\n";
    }
    return image;
}
