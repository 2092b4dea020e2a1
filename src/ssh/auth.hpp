#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

enum class AuthMethod {
    kAgent,
    kKeyFile,
    kPassword,
    kKeyboardInteractive,
};

struct AuthAttempt {
    AuthMethod method;
    std::string key_file;   // kKeyFile only
};

// The attempts authenticate_session makes, in order, given the methods
// the server offered (comma-separated, empty when unknown):
//   1. the identity file alone when one is set (keys-only), otherwise
//      the ssh-agent keys and then the default keys under ~/.ssh
//   2. password (when one was given)
//   3. keyboard-interactive, answering every prompt with the password
std::vector<AuthAttempt> plan_authentication(const HostSpec& target,
                                            const std::string& methods);

// User authentication over an already-handshaken libssh2 session.
// Throws AuthenticationError when every attempt was rejected,
// ConnectionError on transport failure.
void authenticate_session(LIBSSH2_SESSION* session, socket_t sock,
                          const HostSpec& target);

// Private key files tried when no identity file is configured.
std::vector<std::string> default_identity_files();
