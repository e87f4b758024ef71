#include "tunnelwatch/engine.hpp"
#include "tunnelwatch/detail/file_reader.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <utility>

namespace tunnelwatch {

EventDerivationEngine::EventDerivationEngine(std::string status_path, std::string log_path,
                                             ServerIdentity server)
    : status_path_(std::move(status_path))
    , log_path_(std::move(log_path))
    , server_(std::move(server))
{
}

EventDerivationEngine::EventDerivationEngine(const Config& config)
    : EventDerivationEngine(config.status_path, config.log_path, config.server)
{
}

std::vector<ConnectionEvent> EventDerivationEngine::poll() {
    stats_ = CycleStats{};
    auto now = std::chrono::system_clock::now();

    // 1. Log increment first, so logins precede this cycle's snapshot
    std::vector<LogSignal> signals = read_log_signals();

    // 2. Full snapshot read
    std::optional<Snapshot> snapshot;
    if (auto content = detail::read_whole_file(status_path_)) {
        snapshot = parse_snapshot(*content);
        cursor_.snapshot_offset = content->size();
    } else {
        spdlog::warn("Status file unavailable: {}", status_path_);
    }

    return derive(signals, snapshot ? &*snapshot : nullptr, now);
}

std::vector<LogSignal> EventDerivationEngine::read_log_signals() {
    if (log_path_.empty()) {
        return {};
    }

    auto appended = detail::read_appended(log_path_, cursor_.log_offset);
    if (!appended) {
        spdlog::warn("Event log unavailable: {}", log_path_);
        return {};
    }

    stats_.log_available = true;
    if (appended->truncated) {
        stats_.log_truncated = true;
        spdlog::info("Event log {} shrank to {} bytes (offset was {}), rescanning from start",
                     log_path_, appended->file_size, cursor_.log_offset);
    }

    ScanResult scan = scanner_.scan(appended->data);
    cursor_.log_offset = appended->start_offset + scan.consumed;
    stats_.log_lines = scan.lines;

    return std::move(scan.signals);
}

std::vector<ConnectionEvent> EventDerivationEngine::derive(
    const std::vector<LogSignal>& signals,
    const Snapshot* snapshot,
    std::chrono::system_clock::time_point now)
{
    std::vector<ConnectionEvent> log_events;
    std::vector<ConnectionEvent> connects;
    std::vector<ConnectionEvent> heartbeats;
    std::vector<ConnectionEvent> departures;

    stats_.log_signals = signals.size();
    const uint64_t cycle = ++cursor_.cycle;

    // Log signals: enrichment, explicit logouts, auth failures
    for (const auto& signal : signals) {
        switch (signal.kind) {
            case SignalKind::Login:
                if (signal.username) {
                    registry_.set_username(signal.key, *signal.username);
                    spdlog::debug("Login for user {} with session {}",
                                  *signal.username, signal.key.to_string());
                }
                registry_.touch(signal.key, cycle);
                break;

            case SignalKind::Logout: {
                if (cursor_.departed.count(signal.key) > 0) {
                    // Status file dropped the session before its exit line was read
                    spdlog::debug("Late logout for departed session {}, no second disconnect",
                                  signal.key.to_string());
                    break;
                }
                ConnectionEvent event = make_event(EventType::Disconnect, signal.key, now);
                event.username = signal.username ? signal.username : registry_.username_of(signal.key);
                if (event.username) {
                    registry_.upsert(signal.key).username = event.username;
                }
                cursor_.suppressed.insert(signal.key);
                spdlog::debug("Logout for user {} with session {}",
                              event.username.value_or("-"), signal.key.to_string());
                log_events.push_back(std::move(event));
                break;
            }

            case SignalKind::AuthFailed: {
                ConnectionEvent event = make_event(EventType::AuthFailed, signal.key, now);
                event.username = signal.username ? signal.username : registry_.username_of(signal.key);
                log_events.push_back(std::move(event));
                break;
            }
        }
    }

    if (!snapshot) {
        // Source unavailable: no membership information, keep previous set
        return log_events;
    }

    stats_.snapshot_available = true;
    stats_.snapshot_clients = snapshot->clients.size();
    stats_.malformed_records = snapshot->malformed_records;

    std::vector<SessionKey> current = snapshot->keys();
    SnapshotDiff diff = diff_snapshots(cursor_.previous_clients, current);

    std::unordered_map<SessionKey, const ClientRecord*, SessionKeyHash> records;
    records.reserve(snapshot->clients.size());
    for (const auto& record : snapshot->clients) {
        records.emplace(record.key, &record);
    }

    // Joined sessions: connect unless the registry already knows the key
    for (const auto& key : diff.joined) {
        auto it = records.find(key);
        if (it == records.end()) continue;

        if (registry_.contains(key)) {
            spdlog::debug("Skipping duplicate connect for session {}", key.to_string());
        } else {
            ConnectionEvent event = make_event(EventType::Connect, key, now);
            attach_record(event, *it->second);
            event.username = it->second->username;
            connects.push_back(std::move(event));
            spdlog::debug("New connection for session {}", key.to_string());
        }
    }

    // Departed sessions: disconnect unless an explicit logout already did
    std::set<SessionKey> departed;
    for (const auto& key : diff.left) {
        if (cursor_.suppressed.erase(key) > 0) {
            spdlog::debug("Session {} already logged out, no second disconnect", key.to_string());
        } else {
            ConnectionEvent event = make_event(EventType::Disconnect, key, now);
            event.username = registry_.username_of(key);
            departures.push_back(std::move(event));
            departed.insert(key);
        }
        registry_.remove(key);
    }

    // Heartbeats for every listed session
    for (const auto& record : snapshot->clients) {
        std::optional<std::string> vip;
        if (!record.virtual_ip.empty()) vip = record.virtual_ip;
        registry_.mark_active(record.key, std::move(vip));
        registry_.touch(record.key, cycle);

        // A username resolved from the log takes precedence over the status file
        SessionEntry& entry = registry_.upsert(record.key);
        if (!entry.username && record.username) entry.username = record.username;

        ConnectionEvent event = make_event(EventType::Authenticated, record.key, now);
        attach_record(event, record);
        event.username = entry.username;
        heartbeats.push_back(std::move(event));
    }

    // A suppression only outlives the cycle while the session is still listed
    std::set<SessionKey> current_set(current.begin(), current.end());
    for (auto it = cursor_.suppressed.begin(); it != cursor_.suppressed.end();) {
        if (current_set.count(*it) == 0) {
            registry_.remove(*it);
            it = cursor_.suppressed.erase(it);
        } else {
            ++it;
        }
    }

    // Logins whose session never showed up in the status file
    if (cycle >= PENDING_LOGIN_CYCLES) {
        size_t pruned = registry_.prune_inactive(cycle - PENDING_LOGIN_CYCLES + 1);
        if (pruned > 0) {
            spdlog::debug("Dropped {} login-only sessions not seen for {} cycles",
                          pruned, PENDING_LOGIN_CYCLES);
        }
    }

    cursor_.previous_clients = std::move(current);
    cursor_.departed = std::move(departed);

    std::vector<ConnectionEvent> events;
    events.reserve(log_events.size() + connects.size() + heartbeats.size() + departures.size());
    for (auto* group : {&log_events, &connects, &heartbeats, &departures}) {
        for (auto& event : *group) {
            events.push_back(std::move(event));
        }
    }
    return events;
}

void EventDerivationEngine::restore(PollCursor cursor, SessionRegistry registry) {
    cursor_ = std::move(cursor);
    registry_ = std::move(registry);
}

ConnectionEvent EventDerivationEngine::make_event(EventType type, const SessionKey& key,
                                                  std::chrono::system_clock::time_point now) const {
    ConnectionEvent event;
    event.timestamp = now;
    event.event_type = type;
    event.client_ip = key.client_ip;
    event.client_port = key.client_port;
    event.server_name = server_.name;
    event.server_location = server_.location;
    return event;
}

void EventDerivationEngine::attach_record(ConnectionEvent& event, const ClientRecord& record) {
    if (!record.virtual_ip.empty()) {
        event.virtual_ip = record.virtual_ip;
    }
    event.bytes_received = record.bytes_received;
    event.bytes_sent = record.bytes_sent;
}

} // namespace tunnelwatch
