#include <iostream>
#include <string>
#include <vector>

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
#include "lmc_debugger.h"
#include "lmc_decoder.h"
#include "lmc_machine.h"


static void printUsage() {
    std::vector<std::string> usageContent = {
        "Usage: lmc [mode] [options] [file] [inputs...]",
        "Modes:",
        "  -a  Assemble a .lmc file to a .bin image.",
        "  -r  Run a .lmc file or .bin image.",
        "  -u  List/disassemble an image or source file.",
        "  -t  Step through a program interactively.",
        "Options:",
        "  -d, --debug      Enable debug mode.",
        "  --signed         Print output as signed numbers (-r).",
        "  --max-steps N    Stop runaway programs after N steps (-r).",
        "Examples:",
        "  lmc -a add.lmc",
        "  lmc -r add.lmc 17 4",
        "  lmc -r sub.bin 4 17 --signed",
        "  lmc add.lmc 17 4"
    };
    std::cout << formatBox("LMC Usage", usageContent);
}

int main(int argc, char* argv[]) {
    // --- Debug Flag Handling ---
    bool enableDebug = false;
    std::vector<char*> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--debug") {
            enableDebug = true;
        } else {
            args.push_back(argv[i]);
        }
    }
    // --- End Debug Flag Handling ---

    if (args.empty()) {
        std::cerr << "Error: No mode or file specified.\n";
        printUsage();
        return 1;
    }

    std::string mode = args[0];
    int modeArgc = static_cast<int>(args.size()) - 1;
    char** modeArgv = args.data() + 1;

    if (mode == "-a") {
        return lmc_assembler_main(modeArgc, modeArgv, enableDebug);
    } else if (mode == "-r") {
        return lmc_machine_main(modeArgc, modeArgv, enableDebug);
    } else if (mode == "-u") {
        return decoder_main(modeArgc, modeArgv, enableDebug);
    } else if (mode == "-t") {
        return lmc_tracer_main(modeArgc, modeArgv, enableDebug);
    } else if (mode == "-h" || mode == "--help") {
        printUsage();
        return 0;
    } else if (fs::path(mode).extension() == ".lmc" || fs::path(mode).extension() == ".asm" ||
               fs::path(mode).extension() == ".bin") {
        // Run the file directly, remaining args are inputs and run options
        return lmc_machine_main(static_cast<int>(args.size()), args.data(), enableDebug);
    } else {
        std::cerr << "Unknown mode or file: " << mode << "\n";
        return 1;
    }
}
