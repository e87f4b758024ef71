#pragma once

#include "types.hpp"
#include "registry.hpp"
#include "scanner.hpp"
#include "snapshot.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tunnelwatch {

// Cycles a login-only registry entry is kept while its session has not
// appeared in the status file
constexpr uint64_t PENDING_LOGIN_CYCLES = 3;

// Resume point between poll cycles. Any persistence layer must round-trip
// all of it.
struct PollCursor {
    uint64_t cycle = 0;                         // completed derive() calls
    uint64_t log_offset = 0;                    // next unread byte of the event log
    uint64_t snapshot_offset = 0;               // snapshot size at its last full read
    std::vector<SessionKey> previous_clients;   // previous snapshot's keys, file order
    std::set<SessionKey> suppressed;            // logged out, snapshot disconnect pending
    std::set<SessionKey> departed;              // disconnected by the last snapshot, late logout ignored

    bool operator==(const PollCursor&) const = default;
};

// What the last cycle saw of its sources
struct CycleStats {
    bool log_available = false;
    bool snapshot_available = false;
    bool log_truncated = false;
    size_t log_lines = 0;
    size_t log_signals = 0;
    size_t snapshot_clients = 0;
    size_t malformed_records = 0;
};

// Event-derivation engine - owns the session registry and poll cursor for
// one monitored server. Cycles must not run concurrently.
class EventDerivationEngine {
public:
    EventDerivationEngine(std::string status_path, std::string log_path, ServerIdentity server);
    explicit EventDerivationEngine(const Config& config);

    // Read both sources and derive this cycle's events
    std::vector<ConnectionEvent> poll();

    // Merge step over already-extracted inputs. A null snapshot means the
    // snapshot source was unavailable this cycle.
    // Order: log-derived events, connects, heartbeats, snapshot disconnects.
    std::vector<ConnectionEvent> derive(const std::vector<LogSignal>& signals,
                                        const Snapshot* snapshot,
                                        std::chrono::system_clock::time_point now);

    // Install previously saved state
    void restore(PollCursor cursor, SessionRegistry registry);

    // Accessors
    const SessionRegistry& registry() const { return registry_; }
    const PollCursor& cursor() const { return cursor_; }
    const CycleStats& last_cycle() const { return stats_; }
    const ServerIdentity& server() const { return server_; }
    const std::string& status_path() const { return status_path_; }
    const std::string& log_path() const { return log_path_; }

private:
    std::string status_path_;
    std::string log_path_;
    ServerIdentity server_;

    LogScanner scanner_;
    SessionRegistry registry_;
    PollCursor cursor_;
    CycleStats stats_;

    std::vector<LogSignal> read_log_signals();
    ConnectionEvent make_event(EventType type, const SessionKey& key,
                               std::chrono::system_clock::time_point now) const;
    static void attach_record(ConnectionEvent& event, const ClientRecord& record);
};

} // namespace tunnelwatch
