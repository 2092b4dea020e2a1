#include "execution_engine.hpp"
#include <cli/output_formatter.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <ssh/session_manager.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <thread>
#include <poll.h>

namespace {

struct RunningCommand {
    RemoteHost* host;
    std::unique_ptr<ExecChannel> channel;
    bool done = false;
};

// Starts `command` on every host at once, one worker per host. Slot i
// holds host i's channel, or the error its exec raised. Workers that have
// not begun yet skip their host after a fatal error.
void start_channels(const std::string& command, const std::vector<RemoteHost*>& hosts,
                    bool raise,
                    std::vector<std::unique_ptr<ExecChannel>>& channels,
                    std::vector<std::exception_ptr>& errors) {
    channels.resize(hosts.size());
    errors.resize(hosts.size());
    std::atomic<bool> abort{false};

    auto worker = [&](std::size_t i) {
        if (abort.load()) return;
        try {
            channels[i] = hosts[i]->exec(command);
        } catch (const ConnectionError&) {
            errors[i] = std::current_exception();
            if (raise) abort.store(true);
        } catch (const std::exception&) {
            errors[i] = std::current_exception();
            abort.store(true);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(hosts.size());
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) t.join();
}

} // namespace

ExecutionEngine::ExecutionEngine(SessionManager& sessions, OutputFormatter& formatter,
                                 PasswordPrompt prompt)
    : sessions_(sessions), formatter_(formatter), password_(std::move(prompt)) {}

int ExecutionEngine::run(const std::string& command) {
    return run(command, sessions_.hosts());
}

int ExecutionEngine::run(const std::string& command, const std::vector<RemoteHost*>& subset) {
    result_ = CommandResult{};
    const std::string cmd = fixup_sudo(command);
    const bool raise = sessions_.policy() == ErrorPolicy::kRaise;

    auto host_failed = [&](RemoteHost* host, const ConnectionError& e) {
        if (raise) throw;
        log_warn(fmt::format("Lost connection to {} -- {}: {}", host->host(), e.kind(), e.what()));
        result_.errors.push_back(fmt::format("{}: {}", host->host(), e.what()));
    };

    // ── Start ────────────────────────────────────────────────
    std::vector<std::unique_ptr<ExecChannel>> channels;
    std::vector<std::exception_ptr> errors;
    start_channels(cmd, subset, raise, channels, errors);

    std::vector<RunningCommand> running;
    running.reserve(subset.size());
    for (std::size_t i = 0; i < subset.size(); ++i) {
        if (errors[i]) {
            // A refused exec is not a ConnectionError and ends the run here
            try {
                std::rethrow_exception(errors[i]);
            } catch (const ConnectionError& e) {
                host_failed(subset[i], e);
            }
            continue;
        }
        if (channels[i]) running.push_back({subset[i], std::move(channels[i])});
    }
    log_debug(fmt::format("Started '{}' on {} host(s)", cmd, running.size()));

    // ── Event loop ───────────────────────────────────────────
    std::size_t active = running.size();
    std::vector<struct pollfd> fds;

    while (active > 0) {
        if (platform::interrupted()) {
            log_warn("Interrupted, closing channels");
            result_.exit_status = EXIT_INTERRUPTED;
            return result_.exit_status;
        }

        bool progressed = false;
        for (auto& rc : running) {
            if (rc.done) continue;

            std::string chunk;
            ExecChannel::Status status;
            try {
                status = rc.channel->read(chunk);
                if (status == ExecChannel::Status::kData) {
                    const std::string& host = rc.host->host();
                    // The marker may open this chunk even after a partial line,
                    // or be split across two reads
                    bool prompt = contains_sudo_prompt(chunk) ||
                                  contains_sudo_prompt(formatter_.pending(host) + chunk);
                    formatter_.print(host, chunk);
                    if (prompt) {
                        formatter_.print(host, "\n");
                        rc.channel->write(password_.get() + "\n");
                    }
                }
            } catch (const ConnectionError& e) {
                rc.done = true;
                --active;
                rc.channel.reset();
                host_failed(rc.host, e);
                progressed = true;
                continue;
            }

            if (status == ExecChannel::Status::kIdle) continue;
            progressed = true;
            if (status == ExecChannel::Status::kData) continue;

            // kClosed
            rc.done = true;
            --active;
            if (auto code = rc.channel->exit_status()) {
                result_.exit_status = std::max(result_.exit_status, *code);
                log_debug(fmt::format("{} exited with {}", rc.host->host(), *code));
            }
        }

        if (progressed || active == 0) continue;

        fds.clear();
        for (const auto& rc : running) {
            if (rc.done) continue;
            int fd = rc.channel->wait_fd();
            if (fd < 0) continue;
            fds.push_back({fd, rc.channel->wait_events(), 0});
        }
        if (fds.empty()) {
            platform::sleep_ms(1);
        } else {
            ::poll(fds.data(), fds.size(), EVENT_LOOP_POLL_MS);
        }
    }

    return result_.exit_status;
}
