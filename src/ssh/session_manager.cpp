#include "session_manager.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace {

HostSpec make_spec(const std::string& target, const SessionOptions& options) {
    HostSpec spec;
    spec.host = target;
    spec.user = options.user;
    if (options.port) spec.port = *options.port;
    if (options.identity_file) spec.identity_file = expand_user_path(*options.identity_file);
    spec.password = options.password;
    spec.forward_agent = options.forward_agent;
    spec.verify_host_key = options.verify_host_key;
    return spec;
}

} // namespace

SessionManager::SessionManager(Transport& transport, PasswordPrompt prompt)
    : transport_(transport), prompt_(std::move(prompt)) {}

SessionManager::~SessionManager() {
    close();
}

// ── Registration ─────────────────────────────────────────────

void SessionManager::configure(const ResolvedTargets& resolved,
                               const SessionOptions& options) {
    if (resolved.targets.empty()) {
        if (resolved.matched == 0) {
            throw ConfigurationError("No nodes returned from search!");
        }
        throw ConfigurationError(fmt::format(
            "{} {} found, but does not have the required attribute to establish "
            "the connection. Try setting another attribute to open the connection "
            "using --attribute.",
            resolved.matched, resolved.matched > 1 ? "nodes" : "node"));
    }

    policy_ = options.on_error;
    concurrency_ = options.concurrency;
    for (const auto& target : resolved.targets) {
        add(target, options);
    }
}

void SessionManager::add(const std::string& target, const SessionOptions& options) {
    log_debug(fmt::format("Adding {}", target));
    specs_.push_back(make_spec(target, options));
    if (target.size() > longest_) longest_ = target.size();
}

// ── Gateway ──────────────────────────────────────────────────

void SessionManager::via(const std::string& host, const std::string& user,
                         const SessionOptions& options) {
    HostSpec gateway = make_spec(host, options);
    gateway.user = user.empty() ? platform::user_name() : user;

    try {
        transport_.set_gateway(gateway);
        return;
    } catch (const AuthenticationError& e) {
        log_debug(fmt::format("Gateway {} rejected credentials: {}", gateway.display(), e.what()));
    }

    std::string prompt = fmt::format("Enter the password for {}@{}: ", gateway.user, host);
    gateway.password = prompt_ ? prompt_(prompt) : std::string();
    transport_.set_gateway(gateway);
}

// ── Connection ───────────────────────────────────────────────

void SessionManager::connect() {
    std::vector<std::unique_ptr<RemoteHost>> slots(specs_.size());
    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::atomic<std::size_t> next{0};
    std::atomic<bool> abort{false};

    auto worker = [&] {
        for (;;) {
            if (abort.load()) return;
            std::size_t i = next.fetch_add(1);
            if (i >= specs_.size()) return;

            const HostSpec& spec = specs_[i];
            try {
                slots[i] = transport_.connect(spec);
            } catch (const ConnectionError& e) {
                if (policy_ == ErrorPolicy::kRaise) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    abort.store(true);
                    return;
                }
                log_warn(fmt::format("Failed to connect to {} -- {}: {}",
                                     spec.host, e.kind(), e.what()));
                log_debug(fmt::format("{} ({}:{}) connect failure: {}",
                                      spec.display(), spec.host, spec.port, e.what()));
            } catch (const std::exception&) {
                // Anything else is not a per-host failure; stop the pool.
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                abort.store(true);
                return;
            }
        }
    };

    std::size_t workers = specs_.size();
    if (concurrency_ > 0 && static_cast<std::size_t>(concurrency_) < workers) {
        workers = static_cast<std::size_t>(concurrency_);
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) t.join();

    if (first_error) {
        for (auto& host : slots) {
            if (host) host->close();
        }
        std::rethrow_exception(first_error);
    }

    for (auto& host : slots) {
        if (!host) continue;
        by_host_[host->host()] = host.get();
        hosts_.push_back(std::move(host));
    }
    log_info(fmt::format("Connected to {} of {} hosts", hosts_.size(), specs_.size()));
}

void SessionManager::close() {
    if (closed_) return;
    closed_ = true;

    by_host_.clear();
    for (auto& host : hosts_) host->close();
    hosts_.clear();
    transport_.close();
}

// ── Lookup ───────────────────────────────────────────────────

RemoteHost* SessionManager::find(const std::string& host) const {
    auto it = by_host_.find(host);
    return it == by_host_.end() ? nullptr : it->second;
}

std::vector<RemoteHost*> SessionManager::hosts() const {
    std::vector<RemoteHost*> out;
    out.reserve(hosts_.size());
    for (const auto& host : hosts_) out.push_back(host.get());
    return out;
}
