#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tunnelwatch {

// Kinds of signal extracted from the server log
enum class SignalKind : uint8_t {
    Login = 0,      // "ip:port [user] Peer Connection Initiated"
    Logout = 1,     // "user/ip:port SIGTERM[soft,remote-exit]"
    AuthFailed = 2  // "ip:port TLS Auth Error"
};

std::string_view to_string(SignalKind kind);

struct LogSignal {
    SignalKind kind = SignalKind::Login;
    SessionKey key;
    std::optional<std::string> username;

    bool operator==(const LogSignal&) const = default;
};

// Outcome of scanning a chunk of appended log bytes
struct ScanResult {
    std::vector<LogSignal> signals;     // in log order
    size_t consumed = 0;                // bytes up to and including the last newline
    size_t lines = 0;                   // complete lines examined
};

// Log-increment scanner - stateless line matcher. Offsets are tracked by
// the caller; scan() only reports how many bytes it consumed.
class LogScanner {
public:
    LogScanner();

    // Match a single line (without its newline)
    std::optional<LogSignal> match_line(std::string_view line) const;

    // Scan appended bytes. A trailing partial line is not consumed.
    ScanResult scan(std::string_view bytes) const;

private:
    std::regex login_re_;
    std::regex logout_re_;
    std::regex auth_failed_re_;
};

} // namespace tunnelwatch
