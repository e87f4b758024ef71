// tunnelwatch: OpenVPN connection event daemon
// Polls the status file and server log, derives connection events and
// writes them as text or JSON lines

#include <tunnelwatch/tunnelwatch.hpp>
#include <tunnelwatch/detail/parse.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int) {
    g_running = 0;
}

struct Options {
    tunnelwatch::Config config;
    bool once = false;
    bool show_config = false;
    bool no_notify = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Derives connect/disconnect/authenticated/auth_failed events from an\n"
              << "OpenVPN status file and server log.\n"
              << "\n"
              << "Options:\n"
              << "  -s, --status <path>     Status file (status-version 2)\n"
              << "  -l, --log <path>        Server log file\n"
              << "  -i, --interval <sec>    Poll interval in seconds (default: 60)\n"
              << "  -o, --output <file>     Append events to file (default: stdout)\n"
              << "  -f, --format <fmt>      Event format: text, json (default: text)\n"
              << "  -S, --state <file>      Persist poll state across restarts\n"
              << "  -n, --server-name <n>   Server name tag\n"
              << "  -L, --location <loc>    Server location tag\n"
              << "  -v, --log-level <lvl>   trace, debug, info, warn, error\n"
              << "      --heartbeat-alerts  Also alert on authenticated heartbeats\n"
              << "      --no-notify         Disable alerts\n"
              << "      --once              Run a single cycle and exit\n"
              << "      --show-config       Print effective configuration and exit\n"
              << "  -h, --help              Show this help\n"
              << "\n"
              << "Environment (overridden by options):\n"
              << "  OPENVPN_STATUS_PATH, OPENVPN_LOG_PATH, SERVER_NAME, SERVER_LOCATION,\n"
              << "  LOG_INTERVAL, LOG_LEVEL, TUNNELWATCH_STATE_PATH, TUNNELWATCH_EVENTS_PATH,\n"
              << "  TUNNELWATCH_FORMAT, TUNNELWATCH_NOTIFY_HEARTBEATS\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " -s /run/openvpn/status.log -l /var/log/openvpn/server.log\n"
              << "  " << prog << " -f json -o events.jsonl -S /var/lib/tunnelwatch/state\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    tunnelwatch::load_config_from_env(opts.config);

    auto need_value = [&](int& i, const std::string& arg) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            opts.help = true;
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        else if (arg == "-s" || arg == "--status") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.status_path = v;
        }
        else if (arg == "-l" || arg == "--log") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.log_path = v;
        }
        else if (arg == "-i" || arg == "--interval") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            auto secs = tunnelwatch::detail::parse_unsigned<uint32_t>(v);
            if (!secs) {
                std::cerr << "Error: invalid interval '" << v << "'\n";
                opts.help = true;
                return opts;
            }
            opts.config.poll_interval = std::chrono::seconds(*secs);
        }
        else if (arg == "-o" || arg == "--output") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.events_path = v;
        }
        else if (arg == "-f" || arg == "--format") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            auto format = tunnelwatch::parse_output_format(v);
            if (!format) {
                std::cerr << "Error: unknown format '" << v << "'\n";
                opts.help = true;
                return opts;
            }
            opts.config.output_format = *format;
        }
        else if (arg == "-S" || arg == "--state") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.state_path = v;
        }
        else if (arg == "-n" || arg == "--server-name") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.server.name = v;
        }
        else if (arg == "-L" || arg == "--location") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.server.location = v;
        }
        else if (arg == "-v" || arg == "--log-level") {
            const char* v = need_value(i, arg);
            if (!v) return opts;
            opts.config.log_level = v;
        }
        else if (arg == "--heartbeat-alerts") {
            opts.config.notify_heartbeats = true;
        }
        else if (arg == "--no-notify") {
            opts.no_notify = true;
        }
        else if (arg == "--once") {
            opts.once = true;
        }
        else if (arg == "--show-config") {
            opts.show_config = true;
        }
        else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            opts.help = true;
            return opts;
        }
    }

    return opts;
}

int run(const Options& opts) {
    const tunnelwatch::Config& config = opts.config;

    tunnelwatch::EventDerivationEngine engine(config);

    if (!config.state_path.empty()) {
        if (auto state = tunnelwatch::load_state(config.state_path)) {
            spdlog::info("Restored state from {}: log offset {}, {} clients, {} sessions",
                         config.state_path, state->cursor.log_offset,
                         state->cursor.previous_clients.size(), state->registry.size());
            engine.restore(std::move(state->cursor), std::move(state->registry));
        }
    }

    // Event output stream
    std::ofstream file_out;
    std::ostream* out = &std::cout;
    if (!config.events_path.empty()) {
        file_out.open(config.events_path, std::ios::out | std::ios::app);
        if (!file_out) {
            spdlog::error("Cannot open output file '{}'", config.events_path);
            return 1;
        }
        out = &file_out;
    }

    tunnelwatch::StreamEventSink event_sink(*out, config.output_format);
    std::unique_ptr<tunnelwatch::NotificationSink> notifier;
    if (!opts.no_notify) {
        notifier = std::make_unique<tunnelwatch::LogNotificationSink>();
    }

    tunnelwatch::Monitor monitor(engine, &event_sink, notifier.get());
    monitor.set_notify_heartbeats(config.notify_heartbeats);

    spdlog::info("Starting tunnelwatch for {} ({}), polling every {}s",
                 config.server.name, config.server.location, config.poll_interval.count());

    uint64_t event_count = 0;
    auto next = std::chrono::steady_clock::now();

    while (g_running) {
        if (auto report = monitor.run_cycle()) {
            event_count += report->events.size();
        }

        if (!config.state_path.empty() && !tunnelwatch::save_state(config.state_path, engine)) {
            spdlog::warn("Poll state not saved; a restart will rescan from the previous state");
        }

        if (opts.once) break;

        // Sleep in short slices so signals stop the loop promptly
        next += config.poll_interval;
        while (g_running && std::chrono::steady_clock::now() < next) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    spdlog::info("Stopping tunnelwatch after {} cycles, {} events", monitor.cycles(), event_count);
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Options opts = parse_args(argc, argv);

    if (opts.help) {
        print_usage(argv[0]);
        return 1;
    }

    auto problems = tunnelwatch::validate_config(opts.config);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return 1;
    }

    if (opts.show_config) {
        std::cout << tunnelwatch::describe_config(opts.config);
        return 0;
    }

    // Log to stderr so events on stdout stay machine-readable
    auto logger = spdlog::stderr_color_mt("tunnelwatch");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(opts.config.log_level));
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");

    return run(opts);
}
