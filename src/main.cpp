#include <iostream>
#include <string>
#include <vector>
#include "cli/fleetsh_cli.hpp"
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_options(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        return EXIT_FATAL;
    }
    CliOptions opts = parsed.value;

    if (opts.version) {
        std::cout << theme::color::BOLD << "fleetsh" << theme::color::RESET
                  << theme::color::DIM << " version " FLEETSH_VERSION
                  << theme::color::RESET << "\n";
        return 0;
    }
    if (opts.help) {
        print_usage();
        return 0;
    }
    if (opts.verbose) {
        set_console_log_level(LogLevel::kDebug);
    }

    auto config = Config::load();
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        std::cerr << theme::step("Fix or remove " + get_config_path().string());
        return EXIT_NO_TARGETS;
    }

    return run_reporting_errors([&] {
        FleetshCLI cli(opts, config.value);
        return cli.run();
    }, std::cerr);
}
