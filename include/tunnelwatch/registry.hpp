#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tunnelwatch {

// Last-known metadata for one session
struct SessionEntry {
    bool active = false;                    // listed by the most recent snapshot
    std::optional<std::string> username;
    std::optional<std::string> virtual_ip;
    uint64_t last_seen = 0;                 // poll cycle of the latest login or snapshot sighting

    bool operator==(const SessionEntry&) const = default;
};

// Session registry - per-key metadata correlated from both sources.
// Not synchronized; owned by one engine and used from one thread.
class SessionRegistry {
public:
    // Get or create the entry for a key (new entries start inactive)
    SessionEntry& upsert(const SessionKey& key);

    // Lookup without creating
    const SessionEntry* find(const SessionKey& key) const;
    bool contains(const SessionKey& key) const { return find(key) != nullptr; }
    bool is_active(const SessionKey& key) const;

    // Record a username learned from a login signal
    void set_username(const SessionKey& key, std::string username);

    // Record snapshot presence (and virtual address, when listed)
    void mark_active(const SessionKey& key, std::optional<std::string> virtual_ip);

    // Known username, if any
    std::optional<std::string> username_of(const SessionKey& key) const;

    // Stamp the cycle in which the key was last seen
    void touch(const SessionKey& key, uint64_t cycle);

    // Drop a finalized session; returns false if it was unknown
    bool remove(const SessionKey& key);

    // Drop inactive entries not seen since before `cycle`; returns the count
    size_t prune_inactive(uint64_t cycle);

    size_t size() const { return sessions_.size(); }
    bool empty() const { return sessions_.empty(); }
    void clear() { sessions_.clear(); }

    // All entries ordered by key (for persistence and tooling)
    std::vector<std::pair<SessionKey, SessionEntry>> entries() const;

private:
    std::unordered_map<SessionKey, SessionEntry, SessionKeyHash> sessions_;
};

} // namespace tunnelwatch
