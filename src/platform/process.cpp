#include "process.hpp"
#include "platform.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    pid_ = -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_capture) {
    ProcessHandle handle;

    // Build argv before fork: no allocation in the child
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        if (!stdout_capture.empty()) {
            int fd = open(stdout_capture.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                close(fd);
            }
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

int run_shell(const std::string& command) {
    auto handle = spawn("/bin/sh", {"-c", command});
    if (!handle.valid()) return -1;
    return handle.wait();
}

int capture_shell(const std::string& command, std::string& output) {
    auto capture = temp_file("fleetsh_capture");
    auto handle = spawn("/bin/sh", {"-c", command}, capture.string());
    if (!handle.valid()) return -1;
    int rc = handle.wait();

    std::ifstream in(capture);
    std::stringstream ss;
    ss << in.rdbuf();
    output = ss.str();
    in.close();

    std::error_code ec;
    std::filesystem::remove(capture, ec);
    return rc;
}

int exec_shell(const std::string& command) {
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    return errno;
}

} // namespace platform
