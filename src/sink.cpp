#include "tunnelwatch/sink.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <vector>

namespace tunnelwatch {

namespace {

std::string json_escape(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 10);
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

bool has_username(const std::optional<std::string>& username) {
    return username && !username->empty() && *username != UNDEF_USERNAME;
}

} // anonymous namespace

Alert Alert::from_event(const ConnectionEvent& event) {
    Alert alert;
    alert.event_type = event.event_type;
    alert.client_ip = event.client_ip;
    alert.username = event.username;
    alert.virtual_ip = event.virtual_ip;
    alert.server_name = event.server_name;
    alert.client_port = event.client_port;
    return alert;
}

RenderedAlert render_alert(const Alert& alert) {
    RenderedAlert out;

    switch (alert.event_type) {
        case EventType::Connect:
            out.title = "OpenVPN User Connected";
            break;
        case EventType::Disconnect:
            out.title = "OpenVPN User Disconnected";
            break;
        case EventType::AuthFailed:
            out.title = "OpenVPN Auth Failed";
            out.priority = 1;
            break;
        case EventType::Authenticated:
            out.title = "OpenVPN Authenticated";
            break;
    }

    std::vector<std::string> lines;
    if (has_username(alert.username)) {
        lines.push_back(fmt::format("User: {}", *alert.username));
    }
    if (alert.client_port != 0) {
        lines.push_back(fmt::format("IP: {}:{}", alert.client_ip, alert.client_port));
    } else {
        lines.push_back(fmt::format("IP: {}", alert.client_ip));
    }
    if (alert.virtual_ip) {
        lines.push_back(fmt::format("Virtual IP: {}", *alert.virtual_ip));
    }
    if (!alert.server_name.empty()) {
        lines.push_back(fmt::format("Server: {}", alert.server_name));
    }

    out.message = fmt::format("{}", fmt::join(lines, "\n"));
    return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t), ms);
}

std::string to_json(const ConnectionEvent& event) {
    std::string out;
    out.reserve(256);

    out += fmt::format("{{\"timestamp\":\"{}\"", format_timestamp(event.timestamp));
    out += fmt::format(",\"event_type\":\"{}\"", to_string(event.event_type));
    out += fmt::format(",\"client_ip\":\"{}\"", json_escape(event.client_ip));
    out += fmt::format(",\"client_port\":{}", event.client_port);
    if (event.username) {
        out += fmt::format(",\"username\":\"{}\"", json_escape(*event.username));
    }
    if (event.virtual_ip) {
        out += fmt::format(",\"virtual_ip\":\"{}\"", json_escape(*event.virtual_ip));
    }
    if (event.bytes_received) {
        out += fmt::format(",\"bytes_received\":{}", *event.bytes_received);
    }
    if (event.bytes_sent) {
        out += fmt::format(",\"bytes_sent\":{}", *event.bytes_sent);
    }
    if (!event.server_name.empty()) {
        out += fmt::format(",\"server_name\":\"{}\"", json_escape(event.server_name));
    }
    if (!event.server_location.empty()) {
        out += fmt::format(",\"server_location\":\"{}\"", json_escape(event.server_location));
    }
    out += "}";
    return out;
}

std::string to_text(const ConnectionEvent& event) {
    // Compact: "@ts type ip:port user=... vip=... rx=... tx=..."
    std::string out = fmt::format("@{} {} {}:{}", format_timestamp(event.timestamp),
                                  to_string(event.event_type), event.client_ip, event.client_port);
    if (event.username) out += fmt::format(" user={}", *event.username);
    if (event.virtual_ip) out += fmt::format(" vip={}", *event.virtual_ip);
    if (event.bytes_received) out += fmt::format(" rx={}", *event.bytes_received);
    if (event.bytes_sent) out += fmt::format(" tx={}", *event.bytes_sent);
    return out;
}

// StreamEventSink implementation

StreamEventSink::StreamEventSink(std::ostream& out, OutputFormat format)
    : out_(out)
    , format_(format)
{
}

bool StreamEventSink::write(const ConnectionEvent& event) {
    switch (format_) {
        case OutputFormat::Json:
            out_ << to_json(event) << "\n";
            break;
        case OutputFormat::Text:
            out_ << to_text(event) << "\n";
            break;
    }
    out_.flush();

    if (!out_) {
        return false;
    }
    written_++;
    return true;
}

// LogNotificationSink implementation

bool LogNotificationSink::notify(const Alert& alert) {
    RenderedAlert rendered = render_alert(alert);
    auto level = rendered.priority >= 1 ? spdlog::level::warn : spdlog::level::info;
    std::string flat = rendered.message;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    spdlog::log(level, "[alert] {} | {}", rendered.title, flat);
    return true;
}

} // namespace tunnelwatch
