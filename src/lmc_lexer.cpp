#include "lmc_lexer.h"

#include <algorithm> // Required for std::transform
#include <cctype>
#include <sstream>
#include <unordered_map>

AssemblyError::AssemblyError(AssemblyErrorKind kind, const std::string& msg, int line, int column)
    : std::runtime_error(msg + " at line " + std::to_string(line) + ", column " + std::to_string(column)),
      errorKind(kind), message(msg), errorLine(line), errorColumn(column) {}

std::optional<Operation> lookupMnemonic(const std::string& word) {
    std::string upper = word;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    static const std::unordered_map<std::string, Operation> mnemonicMap = {
        {"HLT", Operation::HLT}, {"COB", Operation::HLT},
        {"ADD", Operation::ADD}, {"SUB", Operation::SUB},
        {"STA", Operation::STA}, {"LDA", Operation::LDA},
        {"BRA", Operation::BRA}, {"BRZ", Operation::BRZ}, {"BRP", Operation::BRP},
        {"INP", Operation::INP}, {"OUT", Operation::OUT},
        {"DAT", Operation::DAT}, {"ORG", Operation::ORG}
    };
    auto it = mnemonicMap.find(upper);
    if (it == mnemonicMap.end()) return std::nullopt;
    return it->second;
}

bool parseDecimal(const std::string& text, int& value) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        pos++;
    }
    if (pos == text.size()) return false;
    long long result = 0;
    for (; pos < text.size(); ++pos) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) return false;
        result = result * 10 + (text[pos] - '0');
        if (result > 1000000000LL) return false;
    }
    value = static_cast<int>(negative ? -result : result);
    return true;
}

static bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static Token classifyWord(const std::string& word, int lineNumber, int column) {
    Token token;
    token.text = word;
    token.line = lineNumber;
    token.column = column;

    if (isIdentifierStart(word[0])) {
        if (!std::all_of(word.begin(), word.end(), isIdentifierChar)) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, "Unrecognized token '" + word + "'", lineNumber, column);
        }
        token.type = lookupMnemonic(word) ? TokenType::MNEMONIC : TokenType::LABEL;
        return token;
    }

    bool isSigned = word[0] == '+' || word[0] == '-';
    const size_t digitsStart = isSigned ? 1 : 0;
    if (word.size() > digitsStart &&
        std::all_of(word.begin() + digitsStart, word.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        token.type = isSigned ? TokenType::NUMBER : TokenType::ADDRESS;
        return token;
    }

    throw AssemblyError(AssemblyErrorKind::SYNTAX, "Unrecognized token '" + word + "'", lineNumber, column);
}

std::vector<Token> tokenizeLine(const std::string& line, int lineNumber) {
    // Comments run to end of line
    size_t end = line.size();
    size_t hash = line.find('#');
    size_t slashes = line.find("//");
    if (hash != std::string::npos) end = std::min(end, hash);
    if (slashes != std::string::npos) end = std::min(end, slashes);

    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < end) {
        if (std::isspace(static_cast<unsigned char>(line[pos]))) {
            pos++;
            continue;
        }
        size_t start = pos;
        while (pos < end && !std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        tokens.push_back(classifyWord(line.substr(start, pos - start), lineNumber, static_cast<int>(start) + 1));
    }

    Token eol;
    eol.type = TokenType::END_OF_LINE;
    eol.line = lineNumber;
    eol.column = static_cast<int>(end) + 1;
    tokens.push_back(eol);
    return tokens;
}

static bool takesAddressOperand(Operation op) {
    switch (op) {
        case Operation::ADD: case Operation::SUB: case Operation::STA: case Operation::LDA:
        case Operation::BRA: case Operation::BRZ: case Operation::BRP:
            return true;
        default:
            return false;
    }
}

static void checkAddressLiteral(const Token& token) {
    int value = 0;
    if (token.type != TokenType::ADDRESS || !parseDecimal(token.text, value) || value >= 100) {
        throw AssemblyError(AssemblyErrorKind::ADDRESS_OUT_OF_RANGE,
                            "Address " + token.text + " out of range [00 ... 99]", token.line, token.column);
    }
}

static ParsedLine parseTokens(const std::vector<Token>& tokens, int lineNumber) {
    ParsedLine parsed;
    parsed.lineNumber = lineNumber;
    size_t idx = 0;

    if (tokens[idx].type == TokenType::LABEL) {
        parsed.label = tokens[idx++];
        if (tokens[idx].type == TokenType::END_OF_LINE) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, "Label '" + parsed.label->text + "' has no operation",
                                parsed.label->line, parsed.label->column);
        }
    }

    const Token& mnemonic = tokens[idx++];
    if (mnemonic.type != TokenType::MNEMONIC) {
        throw AssemblyError(AssemblyErrorKind::SYNTAX, "Expected an instruction, got '" + mnemonic.text + "'",
                            mnemonic.line, mnemonic.column);
    }
    parsed.mnemonic = mnemonic;
    parsed.operation = *lookupMnemonic(mnemonic.text);

    const Token& next = tokens[idx];
    if (takesAddressOperand(parsed.operation)) {
        if (next.type == TokenType::END_OF_LINE) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, "Missing operand for " + mnemonic.text, next.line, next.column);
        }
        if (next.type == TokenType::MNEMONIC) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, "Expected an address or label, got '" + next.text + "'",
                                next.line, next.column);
        }
        if (next.type != TokenType::LABEL) checkAddressLiteral(next);
        parsed.operand = next;
        idx++;
    } else if (parsed.operation == Operation::ORG) {
        if (next.type == TokenType::END_OF_LINE) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, "Missing address for " + mnemonic.text, next.line, next.column);
        }
        if (next.type == TokenType::LABEL || next.type == TokenType::MNEMONIC) {
            throw AssemblyError(AssemblyErrorKind::SYNTAX, mnemonic.text + " requires an address literal, got '" + next.text + "'",
                                next.line, next.column);
        }
        checkAddressLiteral(next);
        parsed.operand = next;
        idx++;
    } else if (parsed.operation == Operation::DAT) {
        if (next.type == TokenType::ADDRESS || next.type == TokenType::NUMBER) {
            parsed.operand = next;
            idx++;
        }
    }

    const Token& trailing = tokens[idx];
    if (trailing.type != TokenType::END_OF_LINE) {
        throw AssemblyError(AssemblyErrorKind::SYNTAX, "Unexpected '" + trailing.text + "' after " + mnemonic.text,
                            trailing.line, trailing.column);
    }
    return parsed;
}

std::vector<ParsedLine> parseSource(const std::string& source) {
    std::vector<ParsedLine> lines;
    std::istringstream stream(source);
    std::string line;
    int lineNumber = 0;
    while (std::getline(stream, line)) {
        lineNumber++;
        std::vector<Token> tokens = tokenizeLine(line, lineNumber);
        if (tokens.size() == 1) continue; // blank or comment only
        lines.push_back(parseTokens(tokens, lineNumber));
    }
    return lines;
}
