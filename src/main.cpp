#include "application.hpp"
#include "config.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gpudash::tui;

namespace {

// The screen belongs to ncurses while running; repeat problems once it's gone
void echo_problems() {
    for (const auto& entry : Logger::instance().get_logs_at_least(LogLevel::WARN)) {
        std::cerr << entry.format_line() << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "gpudash";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLine cmd;
    try {
        cmd = parse_command_line(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage(program);
        return 2;
    }

    if (cmd.action == CommandAction::HELP) {
        std::cout << usage(program);
        return 0;
    }

    LOG_INFO("main", "gpudash starting...");

    try {
        Config config = resolve_config(cmd);

        Logger::instance().set_min_level(config.log_level);
        if (!config.log_file.empty() && !Logger::instance().set_output_file(config.log_file)) {
            LOG_WARN("main", "Cannot open log file: " + config.log_file);
        }

        Application app(std::move(config));
        app.init();
        app.run();
        app.shutdown();
    } catch (const std::exception& e) {
        // Application's destructor has already restored the terminal
        LOG_CRITICAL("main", std::string("Fatal error: ") + e.what());
        echo_problems();
        return 1;
    }

    LOG_INFO("main", "gpudash shutting down...");
    echo_problems();
    return 0;
}
