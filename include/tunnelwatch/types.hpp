#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tunnelwatch {

// Record marker for client rows in an OpenVPN status-version 2 file
constexpr std::string_view CLIENT_LIST_MARKER = "CLIENT_LIST,";

// Placeholder OpenVPN writes when a client has no username
constexpr std::string_view UNDEF_USERNAME = "UNDEF";

// Minimum comma-separated fields in a CLIENT_LIST record
constexpr size_t MIN_CLIENT_FIELDS = 8;

// Field index of the optional username column
constexpr size_t USERNAME_FIELD = 9;

// Lifecycle event kinds
enum class EventType : uint8_t {
    Connect = 0,
    Authenticated = 1,
    Disconnect = 2,
    AuthFailed = 3
};

std::string_view to_string(EventType type);
std::optional<EventType> parse_event_type(std::string_view name);

// Real (non-tunnel) client endpoint identifying one connection instance.
// Port 0 means the address carried no port.
struct SessionKey {
    std::string client_ip;
    uint16_t client_port = 0;

    auto operator<=>(const SessionKey&) const = default;
    bool operator==(const SessionKey&) const = default;

    // "ip:port"
    std::string to_string() const;

    // Split "ip:port" at the last ':'; a missing or unparsable port gives 0
    static SessionKey parse(std::string_view address);
};

struct SessionKeyHash {
    size_t operator()(const SessionKey& key) const {
        size_t h = std::hash<std::string>{}(key.client_ip);
        return h ^ (std::hash<uint16_t>{}(key.client_port) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// Static identity tags attached to every event
struct ServerIdentity {
    std::string name;
    std::string location;
};

// One derived lifecycle transition. Fixed shape: absent values are
// std::nullopt, never missing fields.
struct ConnectionEvent {
    std::chrono::system_clock::time_point timestamp;
    EventType event_type = EventType::Connect;
    std::string client_ip;
    uint16_t client_port = 0;
    std::optional<std::string> username;
    std::optional<std::string> virtual_ip;      // snapshot-derived connect/authenticated only
    std::optional<uint64_t> bytes_received;
    std::optional<uint64_t> bytes_sent;
    std::string server_name;
    std::string server_location;

    SessionKey key() const { return SessionKey{client_ip, client_port}; }
};

// Output encodings for event streams
enum class OutputFormat : uint8_t {
    Text = 0,
    Json = 1
};

std::optional<OutputFormat> parse_output_format(std::string_view name);

// Runtime configuration
struct Config {
    std::string status_path = "/var/log/openvpn/status.log";
    std::string log_path = "/var/log/openvpn/openvpn.log";
    ServerIdentity server{"openvpn-server-01", "us-east-1"};
    std::chrono::seconds poll_interval{60};
    std::string log_level = "info";
    std::string state_path;         // empty = no persistence
    std::string events_path;        // empty = stdout
    OutputFormat output_format = OutputFormat::Text;
    bool notify_heartbeats = false;
};

} // namespace tunnelwatch
