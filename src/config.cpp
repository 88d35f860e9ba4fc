#include "config.hpp"
#include <format>
#include <fstream>
#include <stdexcept>

namespace gpudash::tui {

namespace {

int positive_int(const json& value, const std::string& key, int min_value) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::format("'{}' must be an integer", key));
    }
    auto v = value.get<long long>();
    if (v < min_value || v > 1'000'000) {
        throw std::runtime_error(std::format("'{}' out of range: {}", key, v));
    }
    return static_cast<int>(v);
}

std::string string_value(const json& value, const std::string& key) {
    if (!value.is_string()) {
        throw std::runtime_error(std::format("'{}' must be a string", key));
    }
    return value.get<std::string>();
}

std::string take_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

} // namespace

void Config::apply_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("config root must be an object");
    }

    for (const auto& [key, value] : doc.items()) {
        if (key == "poll_interval_ms") {
            poll_interval_ms = positive_int(value, key, 1);
        } else if (key == "mock_device_count") {
            mock_device_count = positive_int(value, key, 1);
        } else if (key == "replay_file") {
            replay_file = string_value(value, key);
        } else if (key == "log_file") {
            log_file = string_value(value, key);
        } else if (key == "log_level") {
            auto name = string_value(value, key);
            auto level = parse_log_level(name);
            if (!level) {
                throw std::runtime_error("unknown log_level: " + name);
            }
            log_level = *level;
        } else {
            LOG_WARN("Config", "Ignoring unknown key: " + key);
        }
    }
}

Config Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    Config config;
    try {
        config.apply_json(json::parse(in));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("Invalid JSON in {}: {}", path, e.what()));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("Invalid config {}: {}", path, e.what()));
    }

    LOG_INFO("Config", "Loaded " + path);
    return config;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cmd.action = CommandAction::HELP;
        } else if (arg == "-c" || arg == "--config") {
            cmd.config_path = take_value(args, i);
        } else if (arg == "--replay") {
            cmd.replay_file = take_value(args, i);
        } else if (arg == "--log-file") {
            cmd.log_file = take_value(args, i);
        } else if (arg == "--interval") {
            auto text = take_value(args, i);
            int ms = 0;
            try {
                size_t used = 0;
                ms = std::stoi(text, &used);
                if (used != text.size()) {
                    throw std::invalid_argument(text);
                }
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid --interval value: " + text);
            }
            if (ms <= 0) {
                throw std::invalid_argument("--interval must be positive");
            }
            cmd.poll_interval_ms = ms;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    return cmd;
}

Config resolve_config(const CommandLine& cmd) {
    Config config = cmd.config_path ? Config::load_file(*cmd.config_path) : Config{};

    if (cmd.replay_file) config.replay_file = *cmd.replay_file;
    if (cmd.log_file) config.log_file = *cmd.log_file;
    if (cmd.poll_interval_ms) config.poll_interval_ms = *cmd.poll_interval_ms;

    return config;
}

std::string usage(const std::string& program) {
    return std::format(
        "Usage: {} [options]\n"
        "\n"
        "Options:\n"
        "  -c, --config PATH   JSON config file\n"
        "      --replay PATH   replay telemetry frames from a JSON file\n"
        "      --interval MS   sampling interval in milliseconds (default 500)\n"
        "      --log-file PATH append log output to a file\n"
        "  -h, --help          show this help\n",
        program);
}

} // namespace gpudash::tui
