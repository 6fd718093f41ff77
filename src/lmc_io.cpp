#include "lmc_io.h"

#include <sstream>
#include "lmc_lexer.h"
#include "word_types.h"

IntReader::IntReader(std::vector<int> values) : cards(std::move(values)) {}

std::optional<int> IntReader::next() {
    if (position >= cards.size()) return std::nullopt;
    return toUnsigned(cards[position++]);
}

IntWriter::IntWriter(bool isSigned, std::string sep) : signedOutput(isSigned), separator(std::move(sep)) {}

void IntWriter::emit(int value) {
    cards.push_back(signedOutput ? toSigned(value) : value);
}

std::string IntWriter::str() const {
    std::ostringstream ss;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) ss << separator;
        ss << cards[i];
    }
    return ss.str();
}

StreamReader::StreamReader(std::istream& input, std::ostream* promptStream) : in(input), prompt(promptStream) {}

std::optional<int> StreamReader::next() {
    std::string word;
    while (true) {
        if (prompt) *prompt << "Input> " << std::flush;
        if (!(in >> word)) return std::nullopt;
        // Swallow the newline ending the last number on a line so line-based readers
        // sharing the stream do not see an empty line
        if (in.peek() == '\n') in.get();
        int value = 0;
        if (parseDecimal(word, value)) return toUnsigned(value);
        std::cerr << "Not a number: " << word << std::endl;
    }
}

StreamWriter::StreamWriter(std::ostream& output, bool isSigned) : out(output), signedOutput(isSigned) {}

void StreamWriter::emit(int value) {
    out << (signedOutput ? toSigned(value) : value) << std::endl;
}
