#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 if it did not exit normally.
    int wait();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stdout_capture);
};

// Spawn a child process.
// stdout_capture: if non-empty, redirect the child's stdout to this file.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_capture = "");

// Run a command line through /bin/sh -c and wait. Returns its exit code.
int run_shell(const std::string& command);

// Run a command line through /bin/sh -c and capture stdout.
// Returns its exit code.
int capture_shell(const std::string& command, std::string& output);

// Replace the current process with /bin/sh -c command.
// Only returns if exec failed; the return value is errno.
int exec_shell(const std::string& command);

} // namespace platform
