#pragma once

#include "types.hpp"

#include <string>
#include <vector>

namespace tunnelwatch {

// Overlay environment variables onto config:
//   OPENVPN_STATUS_PATH, OPENVPN_LOG_PATH, SERVER_NAME, SERVER_LOCATION,
//   LOG_INTERVAL (seconds), LOG_LEVEL, TUNNELWATCH_STATE_PATH,
//   TUNNELWATCH_EVENTS_PATH, TUNNELWATCH_FORMAT (text|json),
//   TUNNELWATCH_NOTIFY_HEARTBEATS (1|true|yes)
// Unset variables leave the current value; invalid values are logged and
// ignored.
void load_config_from_env(Config& config);

// Problems that prevent running with this config (empty = valid)
std::vector<std::string> validate_config(const Config& config);

// One line per setting, for startup logging
std::string describe_config(const Config& config);

} // namespace tunnelwatch
