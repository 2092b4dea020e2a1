#include "output_formatter.hpp"
#include "theme.hpp"

OutputFormatter::OutputFormatter(std::ostream& out, std::size_t label_width, bool color)
    : out_(out), label_width_(label_width), color_(color) {}

std::vector<std::string> OutputFormatter::feed(const std::string& host,
                                               const std::string& chunk) {
    std::vector<std::string> lines;
    std::string& buf = buffers_[host];
    buf += chunk;

    std::size_t cursor = 0;
    for (;;) {
        std::size_t nl = buf.find('\n', cursor);
        if (nl == std::string::npos) break;
        lines.push_back(buf.substr(cursor, nl - cursor));
        cursor = nl + 1;
    }
    buf.erase(0, cursor);
    return lines;
}

std::string OutputFormatter::render(const std::string& host, const std::string& line) const {
    std::string padding;
    if (host.size() < label_width_) padding.assign(label_width_ - host.size(), ' ');
    std::string label = color_ ? theme::cyan(host) : host;
    return label + padding + " " + line;
}

void OutputFormatter::print(const std::string& host, const std::string& chunk) {
    for (const auto& line : feed(host, chunk)) {
        out_ << render(host, line) << "\n";
    }
    out_.flush();
}

const std::string& OutputFormatter::pending(const std::string& host) const {
    static const std::string empty;
    auto it = buffers_.find(host);
    return it == buffers_.end() ? empty : it->second;
}
