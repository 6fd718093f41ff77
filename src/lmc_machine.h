#ifndef LMC_MACHINE_H
#define LMC_MACHINE_H

#include <array>
#include <memory>
#include <string>
#include "common_defs.h"
#include "lmc_image.h"
#include "lmc_io.h"
#include "word_types.h"

enum class RunState {
    RUNNING,
    HALTED,  // HLT executed, normal termination
    ABORTED  // runtime error, see Machine::errorMessage()
};

enum class MachineError {
    NONE,
    END_OF_INPUT,
    INPUT_OUT_OF_RANGE,
    BAD_INSTRUCTION
};

class Machine {
public:
    using Memory = std::array<int, MEMORY_SIZE>;

private:
    Memory mem{};
    int pc = 0;
    int acc = 0;
    int mar = 0;
    int mdr = 0;
    InstructionDigits cir;
    int carryDigit = 0;
    bool zeroFlag = true;
    bool nonNegativeFlag = true;
    RunState state = RunState::RUNNING;
    MachineError lastError = MachineError::NONE;
    std::string errorText;
    long long stepCount = 0;
    bool debugMode = false;

    std::shared_ptr<InputSource> input;
    std::shared_ptr<OutputSink> output;

    // Private methods
    void fetch();
    void decode();
    void execute();
    void abortWith(MachineError error, const std::string& message);
    void truncateAccumulator();
    void setFlags();

public:
    Machine() = default;

    // Writes every entry, then reset(). Throws std::out_of_range for an
    // entry outside the machine; memory is left untouched in that case.
    void load(const MemoryImage& image);
    // Registers, flags and run state to power-on values; memory is kept
    void reset();
    // Zero memory, then reset()
    void clear();

    // One fetch-decode-execute cycle; no-op unless RUNNING
    void singleStep();
    // singleStep() until the machine halts or aborts
    void run();
    // As run(), but gives up after maxSteps cycles; true if still RUNNING
    bool run(long long maxSteps);

    void setInput(std::shared_ptr<InputSource> source) { input = std::move(source); }
    void setOutput(std::shared_ptr<OutputSink> sink) { output = std::move(sink); }
    void setDebugMode(bool enabled) { debugMode = enabled; }

    int getPC() const { return pc; }
    int getACC() const { return acc; }
    int getMAR() const { return mar; }
    int getMDR() const { return mdr; }
    InstructionDigits getCIR() const { return cir; }
    int getCarry() const { return carryDigit; }
    bool isZero() const { return zeroFlag; }
    bool isNonNegative() const { return nonNegativeFlag; }
    RunState runState() const { return state; }
    MachineError error() const { return lastError; }
    const std::string& errorMessage() const { return errorText; }
    long long steps() const { return stepCount; }

    const Memory& memory() const { return mem; }
    int readMemory(int address) const;
};

const char* runStateName(RunState state);

// Declare the standalone main function for running a program
int lmc_machine_main(int argc, char* argv[], bool debug);

#endif // LMC_MACHINE_H
