#include "tunnelwatch/state.hpp"
#include "tunnelwatch/detail/file_reader.hpp"
#include "tunnelwatch/detail/parse.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace tunnelwatch {

namespace {

// Backslash escapes for the characters that delimit fields and lines
std::string escape_field(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescape_field(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\' || i + 1 == value.size()) {
            out += value[i];
            continue;
        }
        switch (value[++i]) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            default: out += value[i]; break;
        }
    }
    return out;
}

std::optional<std::string> field_value(std::string_view field) {
    if (field.empty()) return std::nullopt;
    return unescape_field(field);
}

SessionKey key_field(std::string_view field) {
    return SessionKey::parse(unescape_field(field));
}

} // anonymous namespace

// Format:
//   # tunnelwatch state v1
//   cycle           <n>
//   log_offset      <n>
//   snapshot_offset <n>
//   client          <ip:port>                       (previous snapshot, in order)
//   suppressed      <ip:port>
//   departed        <ip:port>
//   session         <ip:port> <0|1> <username> <virtual_ip> <last_seen>   (empty = absent)
// Text fields escape backslash, tab, CR and LF.

bool save_state(std::string_view path, const PollCursor& cursor, const SessionRegistry& registry) {
    std::string target(path);
    std::string tmp = target + ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot open state file '{}' for writing", tmp);
            return false;
        }

        out << STATE_HEADER << "\n";
        out << fmt::format("cycle\t{}\n", cursor.cycle);
        out << fmt::format("log_offset\t{}\n", cursor.log_offset);
        out << fmt::format("snapshot_offset\t{}\n", cursor.snapshot_offset);
        for (const auto& key : cursor.previous_clients) {
            out << fmt::format("client\t{}\n", escape_field(key.to_string()));
        }
        for (const auto& key : cursor.suppressed) {
            out << fmt::format("suppressed\t{}\n", escape_field(key.to_string()));
        }
        for (const auto& key : cursor.departed) {
            out << fmt::format("departed\t{}\n", escape_field(key.to_string()));
        }
        for (const auto& [key, entry] : registry.entries()) {
            out << fmt::format("session\t{}\t{}\t{}\t{}\t{}\n", escape_field(key.to_string()),
                               entry.active ? 1 : 0, escape_field(entry.username.value_or("")),
                               escape_field(entry.virtual_ip.value_or("")), entry.last_seen);
        }

        out.flush();
        if (!out) {
            spdlog::error("Failed writing state file '{}'", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("Cannot replace state file '{}': {}", target, ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool save_state(std::string_view path, const EventDerivationEngine& engine) {
    return save_state(path, engine.cursor(), engine.registry());
}

std::optional<SavedState> load_state(std::string_view path) {
    auto content = detail::read_whole_file(path);
    if (!content) {
        return std::nullopt;
    }

    auto lines = detail::split(*content, '\n');
    if (lines.empty() || detail::chomp(lines[0]) != STATE_HEADER) {
        spdlog::warn("'{}' is not a state file, ignoring", path);
        return std::nullopt;
    }

    SavedState state;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string_view line = detail::chomp(lines[i]);
        if (line.empty() || line.front() == '#') continue;

        auto parts = detail::split(line, '\t');
        std::string_view tag = parts[0];

        if (tag == "cycle" && parts.size() == 2) {
            state.cursor.cycle = detail::parse_unsigned<uint64_t>(parts[1]).value_or(0);
        } else if (tag == "log_offset" && parts.size() == 2) {
            state.cursor.log_offset = detail::parse_unsigned<uint64_t>(parts[1]).value_or(0);
        } else if (tag == "snapshot_offset" && parts.size() == 2) {
            state.cursor.snapshot_offset = detail::parse_unsigned<uint64_t>(parts[1]).value_or(0);
        } else if (tag == "client" && parts.size() == 2) {
            state.cursor.previous_clients.push_back(key_field(parts[1]));
        } else if (tag == "suppressed" && parts.size() == 2) {
            state.cursor.suppressed.insert(key_field(parts[1]));
        } else if (tag == "departed" && parts.size() == 2) {
            state.cursor.departed.insert(key_field(parts[1]));
        } else if (tag == "session" && parts.size() == 6) {
            SessionEntry& entry = state.registry.upsert(key_field(parts[1]));
            entry.active = parts[2] == "1";
            entry.username = field_value(parts[3]);
            entry.virtual_ip = field_value(parts[4]);
            entry.last_seen = detail::parse_unsigned<uint64_t>(parts[5]).value_or(0);
        } else {
            spdlog::warn("Skipping malformed state line {} in '{}'", i + 1, path);
        }
    }

    return state;
}

} // namespace tunnelwatch
