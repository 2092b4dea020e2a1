#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <random>
#include <csignal>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

std::string user_name() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;
    if (struct passwd* pw = getpwuid(getuid())) return pw->pw_name;
    return "";
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                         std::to_string(dist(rng)));
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

// ── Interrupt flag ───────────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_sigint;
static bool g_handler_installed = false;

static void sigint_handler(int) {
    g_interrupt_flag = 1;
}

void install_interrupt_handler() {
    if (g_handler_installed) return;
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_sigint);
    g_handler_installed = true;
}

void remove_interrupt_handler() {
    if (!g_handler_installed) return;
    sigaction(SIGINT, &g_old_sigint, nullptr);
    g_handler_installed = false;
}

bool interrupted() {
    return g_interrupt_flag != 0;
}

} // namespace platform
