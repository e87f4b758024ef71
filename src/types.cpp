#include "tunnelwatch/types.hpp"
#include "tunnelwatch/detail/parse.hpp"

#include <fmt/format.h>

namespace tunnelwatch {

std::string_view to_string(EventType type) {
    switch (type) {
        case EventType::Connect: return "connect";
        case EventType::Authenticated: return "authenticated";
        case EventType::Disconnect: return "disconnect";
        case EventType::AuthFailed: return "auth_failed";
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view name) {
    if (name == "connect") return EventType::Connect;
    if (name == "authenticated") return EventType::Authenticated;
    if (name == "disconnect") return EventType::Disconnect;
    if (name == "auth_failed") return EventType::AuthFailed;
    return std::nullopt;
}

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

std::string SessionKey::to_string() const {
    return fmt::format("{}:{}", client_ip, client_port);
}

SessionKey SessionKey::parse(std::string_view address) {
    SessionKey key;
    size_t colon = address.rfind(':');
    if (colon == std::string_view::npos) {
        key.client_ip = std::string(address);
        return key;
    }

    key.client_ip = std::string(address.substr(0, colon));
    key.client_port = detail::parse_unsigned<uint16_t>(address.substr(colon + 1)).value_or(0);
    return key;
}

} // namespace tunnelwatch
