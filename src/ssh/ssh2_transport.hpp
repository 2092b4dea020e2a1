#pragma once

#include <memory>
#include <mutex>
#include <core/types.hpp>
#include "remote_host.hpp"
#include "host_session.hpp"

// Ssh2Transport: the libssh2-backed Transport. Owns the gateway session
// (when one is configured) and routes every target connection through it.
class Ssh2Transport : public Transport {
public:
    Ssh2Transport();
    ~Ssh2Transport() override;

    Ssh2Transport(const Ssh2Transport&) = delete;
    Ssh2Transport& operator=(const Ssh2Transport&) = delete;

    void set_gateway(const HostSpec& gateway) override;
    std::unique_ptr<RemoteHost> connect(const HostSpec& spec) override;
    void close() override;

private:
    std::mutex gateway_mutex_;
    std::shared_ptr<HostSession> gateway_;
};
