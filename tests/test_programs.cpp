#include <gtest/gtest.h>

#include "lmc_assembler.h"
#include "lmc_machine.h"

static const char* addProgram = R"(
        inp
        sta a
        inp
        add a
        out
        hlt
    a   dat
)";

static const char* subProgram = R"(
        inp
        sta a
        inp
        sta b
        lda a
        sub b
        out
        hlt
    a   dat
    b   dat
)";

// Runs source with the given inputs and returns the machine's output
static std::vector<int> runProgram(Machine& machine, const std::string& source,
                                   const std::vector<int>& inputs, bool signedOutput = false) {
    machine.clear();
    machine.load(assemble(source));
    machine.setInput(std::make_shared<IntReader>(inputs));
    auto output = std::make_shared<IntWriter>(signedOutput);
    machine.setOutput(output);
    machine.run();
    return output->data();
}

struct ArithmeticCase {
    int a;
    int b;
    int result;
};

class AddProgram : public ::testing::TestWithParam<ArithmeticCase> {};

TEST_P(AddProgram, AddsTwoUnsignedNumbers) {
    const ArithmeticCase& c = GetParam();
    Machine machine;
    EXPECT_EQ(runProgram(machine, addProgram, {c.a, c.b}), std::vector<int>{c.result});
    EXPECT_EQ(machine.runState(), RunState::HALTED);
}

INSTANTIATE_TEST_SUITE_P(Sums, AddProgram, ::testing::Values(
    ArithmeticCase{0, 1, 1},
    ArithmeticCase{1, 0, 1},
    ArithmeticCase{1, 498, 499},
    ArithmeticCase{499, 499, 998},
    ArithmeticCase{17, 4, 21},
    ArithmeticCase{20, 22, 42},
    ArithmeticCase{999, 1, 0}
));

class SubProgram : public ::testing::TestWithParam<ArithmeticCase> {};

TEST_P(SubProgram, SubtractsBFromA) {
    const ArithmeticCase& c = GetParam();
    Machine machine;
    EXPECT_EQ(runProgram(machine, subProgram, {c.a, c.b}, true), std::vector<int>{c.result});
}

INSTANTIATE_TEST_SUITE_P(Differences, SubProgram, ::testing::Values(
    ArithmeticCase{0, 1, -1},
    ArithmeticCase{1, 0, 1},
    ArithmeticCase{1, 1, 0},
    ArithmeticCase{1, 498, -497},
    ArithmeticCase{499, 499, 0},
    ArithmeticCase{17, 4, 13},
    ArithmeticCase{4, 17, -13},
    ArithmeticCase{20, 22, -2},
    ArithmeticCase{999, 1, -2}
));

TEST(Programs, AddScenario) {
    Machine machine;
    EXPECT_EQ(runProgram(machine, addProgram, {17, 4}), std::vector<int>{21});
}

TEST(Programs, SignedSubtractScenario) {
    Machine machine;
    EXPECT_EQ(runProgram(machine, subProgram, {4, 17}, true), std::vector<int>{-13});
}

TEST(Programs, DatOutOfRangeRejected) {
    EXPECT_THROW(assemble("dat 1000\n"), AssemblyError);
    EXPECT_THROW(assemble("dat -1000\n"), AssemblyError);
}

TEST(Programs, RunningPastLastInputAborts) {
    Machine machine;
    std::vector<int> output;
    EXPECT_NO_THROW(output = runProgram(machine, addProgram, {17}));
    EXPECT_TRUE(output.empty());
    EXPECT_EQ(machine.runState(), RunState::ABORTED);
    EXPECT_EQ(machine.error(), MachineError::END_OF_INPUT);
    EXPECT_EQ(machine.errorMessage(), "End of input");
}

TEST(Programs, CountdownLoop) {
    const char* countdown = R"(
    // print n, n-1, ... 1
            inp
    loop    brz done
            out
            sub one
            bra loop
    done    hlt
    one     dat 1
    )";
    Machine machine;
    EXPECT_EQ(runProgram(machine, countdown, {4}), (std::vector<int>{4, 3, 2, 1}));
    EXPECT_EQ(machine.runState(), RunState::HALTED);
}

TEST(Programs, MaximumOfTwo) {
    const char* maximum = R"(
            INP
            STA first
            INP
            STA second
            SUB first
            BRP secondbig
            LDA first
            OUT
            HLT
    secondbig LDA second
            OUT
            HLT
    first   DAT
    second  DAT
    )";
    Machine machine;
    EXPECT_EQ(runProgram(machine, maximum, {12, 30}), std::vector<int>{30});
    EXPECT_EQ(runProgram(machine, maximum, {30, 12}), std::vector<int>{30});
    EXPECT_EQ(runProgram(machine, maximum, {7, 7}), std::vector<int>{7});
}

TEST(Programs, NegativeDataWord) {
    const char* negate = R"(
            lda minus
            out
            hlt
    minus   dat -42
    )";
    Machine machine;
    EXPECT_EQ(runProgram(machine, negate, {}, true), std::vector<int>{-42});
}

TEST(Programs, OrgPlacesDataAway) {
    const char* relocated = R"(
            lda value
            out
            hlt
            org 90
    value   dat 77
    )";
    Machine machine;
    EXPECT_EQ(runProgram(machine, relocated, {}), std::vector<int>{77});
    EXPECT_EQ(machine.readMemory(90), 77);
}

TEST(Programs, SelfModifyingStore) {
    // Overwrites the HLT at 'stop' with OUT, then falls into it
    const char* program = R"(
            lda outop
            sta stop
            lda value
    stop    hlt
            hlt
    outop   dat 902
    value   dat 5
    )";
    Machine machine;
    EXPECT_EQ(runProgram(machine, program, {}), std::vector<int>{5});
}

TEST(Programs, ResetAndRerun) {
    Machine machine;
    machine.load(assemble(addProgram));
    auto output = std::make_shared<IntWriter>();
    machine.setOutput(output);

    machine.setInput(std::make_shared<IntReader>(std::vector<int>{1, 2}));
    machine.run();
    machine.reset();
    machine.setInput(std::make_shared<IntReader>(std::vector<int>{3, 4}));
    machine.run();
    EXPECT_EQ(output->data(), (std::vector<int>{3, 7}));
}

TEST(Programs, IndependentMachinesShareNothing) {
    Machine first;
    Machine second;
    EXPECT_EQ(runProgram(first, addProgram, {1, 2}), std::vector<int>{3});
    EXPECT_EQ(runProgram(second, addProgram, {10, 20}), std::vector<int>{30});
    EXPECT_EQ(first.readMemory(6), 1);
    EXPECT_EQ(second.readMemory(6), 10);
}
