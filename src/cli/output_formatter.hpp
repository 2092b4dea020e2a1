#pragma once

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

// OutputFormatter: turns raw per-host output chunks into complete,
// host-labelled lines.
//
// Each host keeps one leftover buffer. feed() prepends it, emits every
// complete line and keeps the final fragment for the next chunk. A
// fragment still pending when the run ends is never printed.
class OutputFormatter {
public:
    OutputFormatter(std::ostream& out, std::size_t label_width, bool color);

    // Complete lines (without "\n") found after appending chunk.
    std::vector<std::string> feed(const std::string& host, const std::string& chunk);

    // "<host padded to label width> <line>", host in cyan when colored.
    std::string render(const std::string& host, const std::string& line) const;

    // feed() and write every rendered line.
    void print(const std::string& host, const std::string& chunk);

    // Unterminated output held for host.
    const std::string& pending(const std::string& host) const;

private:
    std::ostream& out_;
    std::size_t label_width_;
    bool color_;
    std::unordered_map<std::string, std::string> buffers_;
};
