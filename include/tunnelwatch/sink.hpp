#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace tunnelwatch {

// Event summary handed to notification sinks
struct Alert {
    EventType event_type = EventType::Connect;
    std::string client_ip;
    std::optional<std::string> username;
    std::optional<std::string> virtual_ip;
    std::string server_name;
    uint16_t client_port = 0;

    static Alert from_event(const ConnectionEvent& event);
};

// Human-readable alert ready for delivery
struct RenderedAlert {
    std::string title;
    std::string message;
    int priority = 0;   // -2 (lowest) .. 2 (emergency)
};

RenderedAlert render_alert(const Alert& alert);

// Serialization. JSON omits absent optional fields.
std::string to_json(const ConnectionEvent& event);
std::string to_text(const ConnectionEvent& event);

// ISO-8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Persists derived events. Returns false on failure; may also throw.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual bool write(const ConnectionEvent& event) = 0;
};

// Best-effort alert delivery. Returns false on failure; may also throw.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual bool notify(const Alert& alert) = 0;
};

// Writes one event per line to a stream
class StreamEventSink : public EventSink {
public:
    StreamEventSink(std::ostream& out, OutputFormat format);

    bool write(const ConnectionEvent& event) override;

    uint64_t written() const { return written_; }

private:
    std::ostream& out_;
    OutputFormat format_;
    uint64_t written_ = 0;
};

// Delivers alerts through the process log
class LogNotificationSink : public NotificationSink {
public:
    bool notify(const Alert& alert) override;
};

} // namespace tunnelwatch
