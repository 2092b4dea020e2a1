#pragma once

#include <stdexcept>
#include <string>

// Base for every error fleetsh reports to the operator. kind() is the
// class name shown in "Failed to connect to HOST -- Kind: message".
class FleetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual const char* kind() const noexcept { return "FleetError"; }
};

// No usable targets, missing attribute, bad inventory. Exit code 10.
class ConfigurationError : public FleetError {
public:
    using FleetError::FleetError;
    const char* kind() const noexcept override { return "ConfigurationError"; }
};

// Per-host transport failure. Gated by the pool's error policy.
class ConnectionError : public FleetError {
public:
    ConnectionError(std::string host, const std::string& message)
        : FleetError(message), host_(std::move(host)) {}

    const std::string& host() const { return host_; }
    const char* kind() const noexcept override { return "ConnectionError"; }

private:
    std::string host_;
};

// Credentials rejected by the server.
class AuthenticationError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
    const char* kind() const noexcept override { return "AuthenticationError"; }
};

// The remote end refused to start the command. Fatal for the run.
class ExecutionError : public FleetError {
public:
    using FleetError::FleetError;
    const char* kind() const noexcept override { return "ExecutionError"; }
};

// A launcher (tmux, screen, cssh, ...) is missing or failed.
class ExternalToolError : public FleetError {
public:
    using FleetError::FleetError;
    const char* kind() const noexcept override { return "ExternalToolError"; }
};
