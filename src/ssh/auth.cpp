#include "auth.hpp"
#include "session_io.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace {

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        // libssh2 frees responses with its own allocator (default: free)
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

class AuthRun {
public:
    AuthRun(LIBSSH2_SESSION* session, socket_t sock, const HostSpec& target)
        : session_(session), sock_(sock), target_(target),
          deadline_(std::chrono::steady_clock::now() +
                    std::chrono::seconds(target.timeout > 0 ? target.timeout
                                                            : SSH_CONNECT_TIMEOUT_SECS)) {}

    // Call fn until it stops returning EAGAIN. Returns its final result.
    template <typename Fn>
    int retry(Fn fn) {
        int rc;
        while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline_) {
                throw ConnectionError(target_.host, "Timed out during authentication");
            }
            wait_session(session_, sock_, 100);
        }
        return rc;
    }

    std::string methods() {
        const std::string& user = target_.user;
        char* auth_list = nullptr;
        while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                                  static_cast<unsigned int>(user.length()))) == nullptr) {
            if (libssh2_userauth_authenticated(session_)) return "";
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return "";
            }
            if (std::chrono::steady_clock::now() >= deadline_) {
                throw ConnectionError(target_.host, "Timed out listing authentication methods");
            }
            wait_session(session_, sock_, 100);
        }
        return auth_list;
    }

    bool try_key_file(const std::string& path) {
        const std::string& user = target_.user;
        std::string passphrase = target_.password.value_or("");
        int rc = retry([&] {
            return libssh2_userauth_publickey_fromfile_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                nullptr, path.c_str(), passphrase.c_str());
        });
        log_debug(fmt::format("{}: publickey {} -> {}", target_.host, path, rc));
        return rc == 0;
    }

    bool try_agent() {
        LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
        if (!agent) return false;

        bool ok = false;
        if (libssh2_agent_connect(agent) == 0 &&
            libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (!ok && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                int rc = retry([&] {
                    return libssh2_agent_userauth(agent, target_.user.c_str(), identity);
                });
                log_debug(fmt::format("{}: agent key {} -> {}", target_.host,
                                      identity->comment ? identity->comment : "?", rc));
                ok = (rc == 0);
                prev = identity;
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
        return ok;
    }

    bool try_password() {
        const std::string& user = target_.user;
        const std::string& password = *target_.password;
        int rc = retry([&] {
            return libssh2_userauth_password_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                password.c_str(), static_cast<unsigned int>(password.length()), nullptr);
        });
        log_debug(fmt::format("{}: password -> {}", target_.host, rc));
        return rc == 0;
    }

    bool try_keyboard_interactive() {
        KbdAuthData kbd_data;
        kbd_data.password = *target_.password;
        kbd_data.prompt_round = 0;

        void** abstract = libssh2_session_abstract(session_);
        void* saved = *abstract;
        *abstract = &kbd_data;

        const std::string& user = target_.user;
        int rc = retry([&] {
            return libssh2_userauth_keyboard_interactive_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                kbd_callback);
        });
        *abstract = saved;
        log_debug(fmt::format("{}: keyboard-interactive -> {}", target_.host, rc));
        return rc == 0;
    }

private:
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    const HostSpec& target_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace

std::vector<std::string> default_identity_files() {
    std::vector<std::string> files;
    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        auto path = platform::home_dir() / ".ssh" / name;
        if (std::filesystem::exists(path)) files.push_back(path.string());
    }
    return files;
}

std::vector<AuthAttempt> plan_authentication(const HostSpec& target,
                                            const std::string& methods) {
    std::vector<AuthAttempt> plan;
    auto offered = [&](const char* method) {
        return methods.empty() || methods.find(method) != std::string::npos;
    };

    if (offered("publickey")) {
        if (target.identity_file) {
            plan.push_back({AuthMethod::kKeyFile, expand_user_path(*target.identity_file)});
        } else {
            plan.push_back({AuthMethod::kAgent, ""});
            for (const auto& key : default_identity_files()) {
                plan.push_back({AuthMethod::kKeyFile, key});
            }
        }
    }

    if (target.password) {
        if (offered("password")) plan.push_back({AuthMethod::kPassword, ""});
        if (methods.find("keyboard-interactive") != std::string::npos) {
            plan.push_back({AuthMethod::kKeyboardInteractive, ""});
        }
    }
    return plan;
}

void authenticate_session(LIBSSH2_SESSION* session, socket_t sock,
                          const HostSpec& target) {
    AuthRun auth(session, sock, target);

    std::string methods = auth.methods();
    if (libssh2_userauth_authenticated(session)) return;  // "none" accepted
    log_debug(fmt::format("{}: auth methods: {}", target.host, methods));

    for (const auto& attempt : plan_authentication(target, methods)) {
        bool ok = false;
        switch (attempt.method) {
        case AuthMethod::kAgent:               ok = auth.try_agent(); break;
        case AuthMethod::kKeyFile:             ok = auth.try_key_file(attempt.key_file); break;
        case AuthMethod::kPassword:            ok = auth.try_password(); break;
        case AuthMethod::kKeyboardInteractive: ok = auth.try_keyboard_interactive(); break;
        }
        if (ok) return;
    }

    if (target.identity_file) {
        throw AuthenticationError(target.host,
            fmt::format("Authentication failed for {} with identity file {}",
                        target.display(), expand_user_path(*target.identity_file)));
    }
    throw AuthenticationError(target.host,
        fmt::format("Authentication failed for {} (server offered: {})",
                    target.display(), methods.empty() ? "unknown" : methods));
}
