#pragma once

#include <optional>
#include <string>

// Source of interactive input lines.
class LineReader {
public:
    virtual ~LineReader() = default;

    // One line without its newline, or nullopt at end of input.
    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
    virtual void add_history(const std::string& line) = 0;
};

// GNU readline with in-memory history.
class ReadlineReader : public LineReader {
public:
    std::optional<std::string> read_line(const std::string& prompt) override;
    void add_history(const std::string& line) override;
};
