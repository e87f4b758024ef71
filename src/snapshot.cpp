#include "tunnelwatch/snapshot.hpp"
#include "tunnelwatch/detail/parse.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <unordered_set>

namespace tunnelwatch {

std::vector<SessionKey> Snapshot::keys() const {
    std::vector<SessionKey> result;
    result.reserve(clients.size());
    for (const auto& client : clients) {
        result.push_back(client.key);
    }
    return result;
}

const ClientRecord* Snapshot::find(const SessionKey& key) const {
    for (const auto& client : clients) {
        if (client.key == key) {
            return &client;
        }
    }
    return nullptr;
}

std::optional<ClientRecord> parse_client_record(std::string_view line) {
    line = detail::chomp(line);
    if (!line.starts_with(CLIENT_LIST_MARKER)) {
        return std::nullopt;
    }

    auto parts = detail::split(line, ',');
    if (parts.size() < MIN_CLIENT_FIELDS) {
        return std::nullopt;
    }

    ClientRecord record;
    record.common_name = std::string(parts[1]);
    record.key = SessionKey::parse(parts[2]);
    record.virtual_ip = std::string(parts[3]);
    record.virtual_ipv6 = std::string(parts[4]);
    record.bytes_received = detail::parse_unsigned<uint64_t>(parts[5]).value_or(0);
    record.bytes_sent = detail::parse_unsigned<uint64_t>(parts[6]).value_or(0);
    record.connected_since = std::string(parts[7]);

    if (parts.size() > USERNAME_FIELD) {
        std::string_view username = parts[USERNAME_FIELD];
        if (!username.empty() && username != UNDEF_USERNAME) {
            record.username = std::string(username);
        }
    }

    return record;
}

Snapshot parse_snapshot(std::string_view content) {
    Snapshot snap;
    std::unordered_set<SessionKey, SessionKeyHash> seen;

    for (std::string_view line : detail::split(content, '\n')) {
        if (!line.starts_with(CLIENT_LIST_MARKER)) continue;

        auto record = parse_client_record(line);
        if (!record) {
            snap.malformed_records++;
            spdlog::warn("Skipping malformed status record: '{}'", detail::chomp(line));
            continue;
        }

        if (!seen.insert(record->key).second) {
            snap.duplicate_records++;
            spdlog::debug("Duplicate status record for {}, keeping first", record->key.to_string());
            continue;
        }

        snap.clients.push_back(std::move(*record));
    }

    return snap;
}

SnapshotDiff diff_snapshots(const std::vector<SessionKey>& previous,
                            const std::vector<SessionKey>& current) {
    SnapshotDiff diff;

    std::set<SessionKey> previous_set(previous.begin(), previous.end());
    std::set<SessionKey> current_set(current.begin(), current.end());

    for (const auto& key : current) {
        if (previous_set.find(key) == previous_set.end()) {
            diff.joined.push_back(key);
        }
    }
    for (const auto& key : previous) {
        if (current_set.find(key) == current_set.end()) {
            diff.left.push_back(key);
        }
    }

    return diff;
}

} // namespace tunnelwatch
