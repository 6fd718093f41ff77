#ifndef LMC_LEXER_H
#define LMC_LEXER_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class TokenType {
    LABEL,    // identifier that is not a mnemonic
    MNEMONIC, // HLT, ADD, ... (case-insensitive)
    ADDRESS,  // unsigned decimal literal
    NUMBER,   // decimal literal with an explicit sign
    END_OF_LINE
};

struct Token {
    TokenType type = TokenType::END_OF_LINE;
    std::string text;
    int line = 0;   // 1-based
    int column = 0; // 1-based
};

enum class Operation {
    HLT, ADD, SUB, STA, LDA, BRA, BRZ, BRP, INP, OUT, DAT, ORG
};

// One source line: optional label definition followed by exactly one operation
struct ParsedLine {
    int lineNumber = 0;
    std::optional<Token> label;
    Token mnemonic;
    Operation operation = Operation::HLT;
    std::optional<Token> operand;
};

enum class AssemblyErrorKind {
    SYNTAX,
    DUPLICATE_LABEL,
    UNDEFINED_LABEL,
    VALUE_OUT_OF_RANGE,
    ADDRESS_OUT_OF_RANGE
};

class AssemblyError : public std::runtime_error {
    AssemblyErrorKind errorKind;
    std::string message;
    int errorLine;
    int errorColumn;

public:
    AssemblyError(AssemblyErrorKind kind, const std::string& msg, int line, int column);

    AssemblyErrorKind kind() const { return errorKind; }
    const std::string& detail() const { return message; }
    int line() const { return errorLine; }
    int column() const { return errorColumn; }
};

// Operation for a mnemonic (any case), or nullopt if the word is not one
std::optional<Operation> lookupMnemonic(const std::string& word);

// Split one line into tokens; comments (# or //) are dropped, the list
// always ends with an END_OF_LINE token. Throws AssemblyError on a bad token.
std::vector<Token> tokenizeLine(const std::string& line, int lineNumber);

// Parse a whole program. Blank and comment-only lines produce no entry.
std::vector<ParsedLine> parseSource(const std::string& source);

// Parse an unsigned or signed decimal token; false if it does not fit an int
bool parseDecimal(const std::string& text, int& value);

#endif // LMC_LEXER_H
