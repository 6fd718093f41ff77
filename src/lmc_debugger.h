#ifndef LMC_DEBUGGER_H
#define LMC_DEBUGGER_H

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "lmc_io.h"
#include "lmc_machine.h"

// Interactive console stepper over a loaded machine. Commands are read
// line by line from `in`; INP values are read from the same stream.
class Tracer {
    Machine& machine;
    std::istream& in;
    std::ostream& out;
    std::shared_ptr<IntWriter> output;
    std::set<int> breakpoints;
    std::string prevCmd;
    std::string prompt = "> ";
    long long stepBudget = 100000;

    bool handleCommand(const std::vector<std::string>& tokens);
    void step(long long count);
    void continueRun();
    void decompile(int address, int count);
    void printHelp();
    void reportState();

public:
    Tracer(Machine& target, std::istream& input, std::ostream& console);

    void setPrompt(const std::string& ps1) { prompt = ps1; }
    void setStepBudget(long long budget) { stepBudget = budget; }
    const std::set<int>& activeBreakpoints() const { return breakpoints; }
    const IntWriter& outputs() const { return *output; }

    // Runs until `exit`/`q` or the input stream ends
    void run();
};

int lmc_tracer_main(int argc, char* argv[], bool debug);

#endif // LMC_DEBUGGER_H
