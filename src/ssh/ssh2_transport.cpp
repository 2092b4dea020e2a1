#include "ssh2_transport.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>

namespace {

// libssh2_init is not thread-safe; run it once before any session exists.
void ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        throw ConnectionError("", "Failed to initialize libssh2");
    }
}

} // namespace

Ssh2Transport::Ssh2Transport() = default;

Ssh2Transport::~Ssh2Transport() {
    close();
}

void Ssh2Transport::set_gateway(const HostSpec& gateway) {
    ensure_libssh2_init();

    auto session = std::make_shared<HostSession>(gateway);
    session->connect();
    log_debug(fmt::format("Gateway {} established", gateway.display()));

    std::shared_ptr<HostSession> previous;
    {
        std::lock_guard<std::mutex> lock(gateway_mutex_);
        previous = std::move(gateway_);
        gateway_ = std::move(session);
    }
    if (previous) previous->close();
}

std::unique_ptr<RemoteHost> Ssh2Transport::connect(const HostSpec& spec) {
    ensure_libssh2_init();

    std::shared_ptr<HostSession> gateway;
    {
        std::lock_guard<std::mutex> lock(gateway_mutex_);
        gateway = gateway_;
    }

    auto session = std::make_unique<HostSession>(spec);
    session->connect(gateway.get());
    return session;
}

void Ssh2Transport::close() {
    std::shared_ptr<HostSession> gateway;
    {
        std::lock_guard<std::mutex> lock(gateway_mutex_);
        gateway = std::move(gateway_);
    }
    if (gateway) gateway->close();
}
