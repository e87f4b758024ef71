#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunnelwatch {

// One CLIENT_LIST row of the status file
struct ClientRecord {
    std::string common_name;
    SessionKey key;
    std::string virtual_ip;
    std::string virtual_ipv6;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    std::string connected_since;
    std::optional<std::string> username;    // absent when missing or UNDEF
};

// Parsed view of a full status file. Represents state, not a delta.
struct Snapshot {
    std::vector<ClientRecord> clients;      // file order, one per key
    size_t malformed_records = 0;
    size_t duplicate_records = 0;

    std::vector<SessionKey> keys() const;
    const ClientRecord* find(const SessionKey& key) const;
};

// Parse a single CLIENT_LIST line; nullopt if it is not a well-formed record
std::optional<ClientRecord> parse_client_record(std::string_view line);

// Parse full status file content. Non-record lines are ignored; malformed
// records are skipped and counted.
Snapshot parse_snapshot(std::string_view content);

// Membership change between two successive snapshots
struct SnapshotDiff {
    std::vector<SessionKey> joined;     // in current, not in previous (current order)
    std::vector<SessionKey> left;       // in previous, not in current (previous order)

    bool empty() const { return joined.empty() && left.empty(); }
};

SnapshotDiff diff_snapshots(const std::vector<SessionKey>& previous,
                            const std::vector<SessionKey>& current);

} // namespace tunnelwatch
