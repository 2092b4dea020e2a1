#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Settings from ~/.fleetsh/config.yaml. Every field is optional: the
// command line overrides whatever is set here.
class Config {
public:
    // Load ~/.fleetsh/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path. A missing file yields defaults.
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::optional<std::string>& ssh_user() const { return ssh_user_; }
    const std::optional<std::string>& ssh_attribute() const { return ssh_attribute_; }
    const std::optional<int>& ssh_port() const { return ssh_port_; }
    const std::optional<std::string>& ssh_gateway() const { return ssh_gateway_; }
    const std::optional<std::string>& identity_file() const { return identity_file_; }
    const std::optional<bool>& host_key_verify() const { return host_key_verify_; }
    const std::optional<int>& concurrency() const { return concurrency_; }
    const std::optional<ErrorPolicy>& on_error() const { return on_error_; }
    const std::optional<std::string>& inventory() const { return inventory_; }
    const TmuxConfig& tmux() const { return tmux_; }

public:
    Config() = default;

private:
    std::optional<std::string> ssh_user_;
    std::optional<std::string> ssh_attribute_;
    std::optional<int> ssh_port_;
    std::optional<std::string> ssh_gateway_;
    std::optional<std::string> identity_file_;
    std::optional<bool> host_key_verify_;
    std::optional<int> concurrency_;
    std::optional<ErrorPolicy> on_error_;
    std::optional<std::string> inventory_;
    TmuxConfig tmux_;

    friend class ConfigParser;
};

// Parse "skip" / "raise". Returns nullopt for anything else.
std::optional<ErrorPolicy> parse_error_policy(const std::string& value);

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
fs::path get_default_inventory_path();
