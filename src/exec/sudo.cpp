#include "sudo.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <cctype>
#include <cstring>

std::string fixup_sudo(const std::string& command) {
    static const std::string word = "sudo";
    if (command.compare(0, word.size(), word) != 0) return command;
    if (command.size() > word.size() &&
        !std::isspace(static_cast<unsigned char>(command[word.size()]))) {
        return command;  // sudoedit, sudo_wrapper, ...
    }
    return word + " -p '" + SUDO_PROMPT_MARKER + "'" + command.substr(word.size());
}

bool contains_sudo_prompt(const std::string& chunk) {
    const std::size_t len = std::strlen(SUDO_PROMPT_MARKER);
    std::size_t pos = chunk.find(SUDO_PROMPT_MARKER);
    while (pos != std::string::npos) {
        if (pos == 0 || chunk[pos - 1] == '\n') return true;
        pos = chunk.find(SUDO_PROMPT_MARKER, pos + len);
    }
    return false;
}

PasswordCache::PasswordCache(PasswordPrompt prompt) : prompt_(std::move(prompt)) {}

const std::string& PasswordCache::get() {
    if (!password_) {
        if (!prompt_) {
            throw ExecutionError("sudo asked for a password but no terminal is available");
        }
        password_ = prompt_(SUDO_PASSWORD_PROMPT);
    }
    return *password_;
}
