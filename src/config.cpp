#include "tunnelwatch/config.hpp"
#include "tunnelwatch/detail/parse.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>

namespace tunnelwatch {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

bool is_known_level(const std::string& name) {
    // from_str maps anything unknown to off, so "off" must be checked by name
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // anonymous namespace

void load_config_from_env(Config& config) {
    if (auto v = env("OPENVPN_STATUS_PATH")) config.status_path = *v;
    if (auto v = env("OPENVPN_LOG_PATH")) config.log_path = *v;
    if (auto v = env("SERVER_NAME")) config.server.name = *v;
    if (auto v = env("SERVER_LOCATION")) config.server.location = *v;
    if (auto v = env("LOG_LEVEL")) config.log_level = *v;
    if (auto v = env("TUNNELWATCH_STATE_PATH")) config.state_path = *v;
    if (auto v = env("TUNNELWATCH_EVENTS_PATH")) config.events_path = *v;

    if (auto v = env("LOG_INTERVAL")) {
        if (auto secs = detail::parse_unsigned<uint32_t>(*v)) {
            config.poll_interval = std::chrono::seconds(*secs);
        } else {
            spdlog::warn("Ignoring invalid LOG_INTERVAL '{}'", *v);
        }
    }

    if (auto v = env("TUNNELWATCH_FORMAT")) {
        if (auto format = parse_output_format(*v)) {
            config.output_format = *format;
        } else {
            spdlog::warn("Ignoring unknown TUNNELWATCH_FORMAT '{}'", *v);
        }
    }

    if (auto v = env("TUNNELWATCH_NOTIFY_HEARTBEATS")) {
        config.notify_heartbeats = (*v == "1" || *v == "true" || *v == "yes");
    }
}

std::vector<std::string> validate_config(const Config& config) {
    std::vector<std::string> problems;

    if (config.status_path.empty()) {
        problems.push_back("status path is empty");
    }
    if (config.log_path.empty()) {
        problems.push_back("log path is empty");
    }
    if (config.poll_interval.count() <= 0) {
        problems.push_back("poll interval must be at least 1 second");
    }
    if (!is_known_level(config.log_level)) {
        problems.push_back(fmt::format("unknown log level '{}'", config.log_level));
    }

    return problems;
}

std::string describe_config(const Config& config) {
    std::string out;
    out += fmt::format("Status path: {}\n", config.status_path);
    out += fmt::format("Log path: {}\n", config.log_path);
    out += fmt::format("Server: {} ({})\n", config.server.name, config.server.location);
    out += fmt::format("Poll interval: {}s\n", config.poll_interval.count());
    out += fmt::format("Log level: {}\n", config.log_level);
    out += fmt::format("State file: {}\n", config.state_path.empty() ? "(none)" : config.state_path);
    out += fmt::format("Events: {} as {}\n",
                       config.events_path.empty() ? "stdout" : config.events_path,
                       config.output_format == OutputFormat::Json ? "json" : "text");
    out += fmt::format("Heartbeat alerts: {}\n", config.notify_heartbeats ? "on" : "off");
    return out;
}

} // namespace tunnelwatch
