#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// Rewrite a leading `sudo` so its password prompt is SUDO_PROMPT_MARKER:
//   "sudo ls" -> "sudo -p 'fleetsh sudo password: ' ls"
// Commands not starting with the word `sudo` are returned unchanged.
std::string fixup_sudo(const std::string& command);

// True when the marker appears at the start of any line in chunk.
bool contains_sudo_prompt(const std::string& chunk);

// PasswordCache: asks for the sudo password the first time it is needed
// and hands out the same answer afterwards.
class PasswordCache {
public:
    explicit PasswordCache(PasswordPrompt prompt);

    const std::string& get();
    bool cached() const { return password_.has_value(); }

private:
    PasswordPrompt prompt_;
    std::optional<std::string> password_;
};
