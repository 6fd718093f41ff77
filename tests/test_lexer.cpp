#include <gtest/gtest.h>

#include "lmc_lexer.h"

TEST(Lexer, ClassifiesTokensWithPositions) {
    std::vector<Token> tokens = tokenizeLine("loop  add\tcount", 3);
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::LABEL);
    EXPECT_EQ(tokens[0].text, "loop");
    EXPECT_EQ(tokens[0].line, 3);
    EXPECT_EQ(tokens[0].column, 1);
    EXPECT_EQ(tokens[1].type, TokenType::MNEMONIC);
    EXPECT_EQ(tokens[1].column, 7);
    EXPECT_EQ(tokens[2].type, TokenType::LABEL);
    EXPECT_EQ(tokens[2].column, 11);
    EXPECT_EQ(tokens[3].type, TokenType::END_OF_LINE);
}

TEST(Lexer, NumbersAndAddresses) {
    std::vector<Token> tokens = tokenizeLine("dat -13 42 +7", 1);
    EXPECT_EQ(tokens[1].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[2].type, TokenType::ADDRESS);
    EXPECT_EQ(tokens[3].type, TokenType::NUMBER);
}

TEST(Lexer, StripsBothCommentStyles) {
    EXPECT_EQ(tokenizeLine("  # only a comment", 1).size(), 1u);
    EXPECT_EQ(tokenizeLine("// another", 1).size(), 1u);
    EXPECT_EQ(tokenizeLine("out // print it", 1).size(), 2u);
    EXPECT_EQ(tokenizeLine("hlt# stop", 1).size(), 2u);
}

TEST(Lexer, MnemonicsAreCaseInsensitive) {
    EXPECT_EQ(lookupMnemonic("lda"), Operation::LDA);
    EXPECT_EQ(lookupMnemonic("Brz"), Operation::BRZ);
    EXPECT_EQ(lookupMnemonic("COB"), Operation::HLT);
    EXPECT_FALSE(lookupMnemonic("jmp").has_value());
}

TEST(Lexer, UnrecognizedTokenCarriesPosition) {
    try {
        tokenizeLine("   add $5", 7);
        FAIL() << "expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.kind(), AssemblyErrorKind::SYNTAX);
        EXPECT_EQ(e.line(), 7);
        EXPECT_EQ(e.column(), 8);
    }
}

TEST(Parser, SkipsBlankAndCommentLines) {
    std::vector<ParsedLine> lines = parseSource("\n   \n# header\ninp\n\n// tail\nout\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].operation, Operation::INP);
    EXPECT_EQ(lines[0].lineNumber, 4);
    EXPECT_EQ(lines[1].operation, Operation::OUT);
    EXPECT_EQ(lines[1].lineNumber, 7);
}

TEST(Parser, LabelAndOperand) {
    std::vector<ParsedLine> lines = parseSource("start LDA value\nvalue DAT\n");
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_TRUE(lines[0].label.has_value());
    EXPECT_EQ(lines[0].label->text, "start");
    EXPECT_EQ(lines[0].operation, Operation::LDA);
    ASSERT_TRUE(lines[0].operand.has_value());
    EXPECT_EQ(lines[0].operand->text, "value");
    EXPECT_EQ(lines[1].operation, Operation::DAT);
    EXPECT_FALSE(lines[1].operand.has_value());
}

TEST(Parser, LiteralAddressOperand) {
    std::vector<ParsedLine> lines = parseSource("sta 07\nbra 99\n");
    EXPECT_EQ(lines[0].operand->type, TokenType::ADDRESS);
    EXPECT_EQ(lines[1].operand->text, "99");
}

static AssemblyError parseError(const std::string& source) {
    try {
        parseSource(source);
    } catch (const AssemblyError& e) {
        return e;
    }
    throw std::logic_error("no error for: " + source);
}

TEST(Parser, RejectsMultipleOperations) {
    AssemblyError e = parseError("inp out\n");
    EXPECT_EQ(e.kind(), AssemblyErrorKind::SYNTAX);
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.column(), 5);
}

TEST(Parser, RejectsMissingOperand) {
    EXPECT_EQ(parseError("add\n").kind(), AssemblyErrorKind::SYNTAX);
    EXPECT_EQ(parseError("org\n").kind(), AssemblyErrorKind::SYNTAX);
}

TEST(Parser, RejectsOperandOnNoOperandInstruction) {
    AssemblyError e = parseError("\nhlt 5\n");
    EXPECT_EQ(e.kind(), AssemblyErrorKind::SYNTAX);
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(e.column(), 5);
}

TEST(Parser, RejectsLabelWithoutOperation) {
    AssemblyError e = parseError("inp\nlonely\n");
    EXPECT_EQ(e.kind(), AssemblyErrorKind::SYNTAX);
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(e.column(), 1);
}

TEST(Parser, RejectsTwoLabels) {
    EXPECT_EQ(parseError("one two dat\n").kind(), AssemblyErrorKind::SYNTAX);
}

TEST(Parser, RejectsAddressOutOfRange) {
    AssemblyError e = parseError("lda 100\n");
    EXPECT_EQ(e.kind(), AssemblyErrorKind::ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(e.column(), 5);
    EXPECT_EQ(parseError("org 250\n").kind(), AssemblyErrorKind::ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(parseError("add -1\n").kind(), AssemblyErrorKind::ADDRESS_OUT_OF_RANGE);
}

TEST(Parser, OrgRequiresLiteral) {
    EXPECT_EQ(parseError("org start\n").kind(), AssemblyErrorKind::SYNTAX);
}

TEST(Parser, ErrorMessageIncludesPosition) {
    AssemblyError e = parseError("inp\n  foo bar\n");
    EXPECT_NE(std::string(e.what()).find("line 2, column 7"), std::string::npos);
}
