#ifndef LMC_IO_H
#define LMC_IO_H

#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Supplies INP values (0..999); nullopt means the input is exhausted.
// May block; the machine waits inside the INP instruction until it returns.
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual std::optional<int> next() = 0;
};

// Receives every OUT value as an unsigned word
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void emit(int value) = 0;
};

// Feeds a fixed list of signed numbers, converted to tens-complement
class IntReader : public InputSource {
    std::vector<int> cards;
    size_t position = 0;

public:
    explicit IntReader(std::vector<int> values = {});
    std::optional<int> next() override;
    size_t remaining() const { return cards.size() - position; }
};

// Collects output words, optionally converted back to signed numbers
class IntWriter : public OutputSink {
    std::vector<int> cards;
    bool signedOutput;
    std::string separator;

public:
    explicit IntWriter(bool isSigned = false, std::string sep = ", ");
    void emit(int value) override;
    void reset() { cards.clear(); }
    const std::vector<int>& data() const { return cards; }
    std::string str() const;
};

// Reads one signed decimal number per request from a stream
class StreamReader : public InputSource {
    std::istream& in;
    std::ostream* prompt;

public:
    explicit StreamReader(std::istream& input, std::ostream* promptStream = nullptr);
    std::optional<int> next() override;
};

// Writes each output word on its own line
class StreamWriter : public OutputSink {
    std::ostream& out;
    bool signedOutput;

public:
    explicit StreamWriter(std::ostream& output, bool isSigned = false);
    void emit(int value) override;
};

#endif // LMC_IO_H
