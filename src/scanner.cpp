#include "tunnelwatch/scanner.hpp"
#include "tunnelwatch/detail/parse.hpp"

#include <spdlog/spdlog.h>

namespace tunnelwatch {

namespace {

// Literal text each pattern must contain, checked before any regex runs
constexpr std::string_view LOGIN_MARKER = "Peer Connection Initiated";
constexpr std::string_view LOGOUT_MARKER = "SIGTERM[soft,remote-exit]";
constexpr std::string_view AUTH_FAILED_MARKER = "TLS Auth Error";

// Bytes of context kept before a marker; bounds regex backtracking on huge lines
constexpr size_t MATCH_WINDOW = 256;

// The marker and up to MATCH_WINDOW bytes before it, or empty if absent
std::string_view window_at(std::string_view line, std::string_view marker) {
    size_t pos = line.find(marker);
    if (pos == std::string_view::npos) return {};
    size_t start = pos > MATCH_WINDOW ? pos - MATCH_WINDOW : 0;
    return line.substr(start, pos + marker.size() - start);
}

bool search(std::string_view window, std::cmatch& m, const std::regex& re) {
    if (window.empty()) return false;
    return std::regex_search(window.data(), window.data() + window.size(), m, re);
}

SessionKey make_key(const std::csub_match& ip, const std::csub_match& port) {
    SessionKey key;
    key.client_ip = ip.str();
    key.client_port = detail::parse_unsigned<uint16_t>(
        std::string_view(port.first, static_cast<size_t>(port.length()))).value_or(0);
    return key;
}

} // anonymous namespace

std::string_view to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::Login: return "login";
        case SignalKind::Logout: return "logout";
        case SignalKind::AuthFailed: return "auth_failed";
    }
    return "unknown";
}

LogScanner::LogScanner()
    : login_re_(R"((\d+\.\d+\.\d+\.\d+):(\d+)\s+\[([^\]]+)\]\s+Peer Connection Initiated)")
    , logout_re_(R"(([^/\s]+)/(\d+\.\d+\.\d+\.\d+):(\d+)\s+SIGTERM\[soft,remote-exit\])")
    , auth_failed_re_(R"((\d+\.\d+\.\d+\.\d+):(\d+)\s+TLS Auth Error)")
{
}

std::optional<LogSignal> LogScanner::match_line(std::string_view line) const {
    line = detail::chomp(line);
    if (line.empty()) return std::nullopt;

    std::cmatch m;

    if (search(window_at(line, LOGIN_MARKER), m, login_re_)) {
        LogSignal signal;
        signal.kind = SignalKind::Login;
        signal.key = make_key(m[1], m[2]);
        signal.username = m[3].str();
        return signal;
    }

    if (search(window_at(line, LOGOUT_MARKER), m, logout_re_)) {
        LogSignal signal;
        signal.kind = SignalKind::Logout;
        signal.username = m[1].str();
        signal.key = make_key(m[2], m[3]);
        return signal;
    }

    if (search(window_at(line, AUTH_FAILED_MARKER), m, auth_failed_re_)) {
        LogSignal signal;
        signal.kind = SignalKind::AuthFailed;
        signal.key = make_key(m[1], m[2]);
        return signal;
    }

    return std::nullopt;
}

ScanResult LogScanner::scan(std::string_view bytes) const {
    ScanResult result;

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t nl = bytes.find('\n', pos);
        if (nl == std::string_view::npos) break;  // partial line, wait for more

        std::string_view line = bytes.substr(pos, nl - pos);
        pos = nl + 1;
        result.lines++;

        if (auto signal = match_line(line)) {
            spdlog::debug("Found {} for {} (user {})", to_string(signal->kind),
                          signal->key.to_string(), signal->username.value_or("-"));
            result.signals.push_back(std::move(*signal));
        }
    }

    result.consumed = pos;
    return result;
}

} // namespace tunnelwatch
