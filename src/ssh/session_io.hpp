#pragma once

#include <string>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Block until the socket is ready in whichever direction libssh2 last
// reported it was waiting on. Returns false on timeout.
bool wait_session(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms);

// poll() events matching libssh2's current block directions.
// Falls back to POLLIN when libssh2 is not waiting on anything.
short session_poll_events(LIBSSH2_SESSION* session);

// Last libssh2 error message for the session, or fallback.
std::string session_error(LIBSSH2_SESSION* session, const std::string& fallback);
