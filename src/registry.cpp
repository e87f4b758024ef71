#include "tunnelwatch/registry.hpp"

#include <algorithm>

namespace tunnelwatch {

SessionEntry& SessionRegistry::upsert(const SessionKey& key) {
    return sessions_[key];
}

const SessionEntry* SessionRegistry::find(const SessionKey& key) const {
    auto it = sessions_.find(key);
    if (it != sessions_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool SessionRegistry::is_active(const SessionKey& key) const {
    const SessionEntry* entry = find(key);
    return entry && entry->active;
}

void SessionRegistry::set_username(const SessionKey& key, std::string username) {
    upsert(key).username = std::move(username);
}

void SessionRegistry::mark_active(const SessionKey& key, std::optional<std::string> virtual_ip) {
    SessionEntry& entry = upsert(key);
    entry.active = true;
    if (virtual_ip) {
        entry.virtual_ip = std::move(virtual_ip);
    }
}

std::optional<std::string> SessionRegistry::username_of(const SessionKey& key) const {
    const SessionEntry* entry = find(key);
    if (!entry) return std::nullopt;
    return entry->username;
}

void SessionRegistry::touch(const SessionKey& key, uint64_t cycle) {
    upsert(key).last_seen = cycle;
}

bool SessionRegistry::remove(const SessionKey& key) {
    return sessions_.erase(key) > 0;
}

size_t SessionRegistry::prune_inactive(uint64_t cycle) {
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (!it->second.active && it->second.last_seen < cycle) {
            it = sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::pair<SessionKey, SessionEntry>> SessionRegistry::entries() const {
    std::vector<std::pair<SessionKey, SessionEntry>> result(sessions_.begin(), sessions_.end());
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

} // namespace tunnelwatch
