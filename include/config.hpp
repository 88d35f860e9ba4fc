#pragma once

#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gpudash::tui {

using json = nlohmann::json;

struct Config {
    int poll_interval_ms = 500;
    int mock_device_count = 1;
    std::string replay_file;   // empty selects the mock sampler
    std::string log_file;      // empty keeps logs in memory only
    LogLevel log_level = LogLevel::INFO;

    // Overlay keys from a JSON object onto this config.
    // Throws std::runtime_error on wrong types or out-of-range values.
    void apply_json(const json& doc);

    // Missing file is an error here; callers decide whether a config file is optional
    static Config load_file(const std::string& path);
};

enum class CommandAction {
    RUN,
    HELP
};

struct CommandLine {
    CommandAction action = CommandAction::RUN;
    std::optional<std::string> config_path;
    std::optional<std::string> replay_file;
    std::optional<std::string> log_file;
    std::optional<int> poll_interval_ms;
};

// Throws std::invalid_argument on unknown options or missing values
CommandLine parse_command_line(const std::vector<std::string>& args);

// Config file first, then command-line overrides
Config resolve_config(const CommandLine& cmd);

std::string usage(const std::string& program);

} // namespace gpudash::tui
