#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Parsed command line: `fleetsh [options] QUERY COMMAND...`
struct CliOptions {
    std::optional<int> concurrency;
    std::optional<std::string> attribute;
    bool manual = false;
    std::optional<std::string> ssh_user;
    std::optional<std::string> ssh_password;
    std::optional<int> ssh_port;
    std::optional<std::string> ssh_gateway;
    bool forward_agent = false;
    std::optional<std::string> identity_file;
    std::optional<bool> host_key_verify;
    std::optional<ErrorPolicy> on_error;
    std::optional<std::string> inventory;
    bool color = true;
    bool verbose = false;
    bool help = false;
    bool version = false;

    std::string query;
    std::string command;   // remaining words joined by spaces
};

// Options are recognized up to the first word of COMMAND; everything from
// there on belongs to the remote command ("ls -la" keeps its -la).
Result<CliOptions> parse_options(const std::vector<std::string>& args);

void print_usage();
