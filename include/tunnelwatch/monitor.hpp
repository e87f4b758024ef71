#pragma once

#include "engine.hpp"
#include "sink.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tunnelwatch {

// Outcome of one dispatched cycle
struct CycleReport {
    std::vector<ConnectionEvent> events;
    size_t sink_failures = 0;
    size_t notify_failures = 0;
    size_t notifications_sent = 0;
};

// Monitor - runs a poll cycle and hands its events to the sinks.
// Sink outcomes never affect engine state already advanced by the cycle.
class Monitor {
public:
    // Sinks are optional (nullptr = none) and must outlive the monitor
    Monitor(EventDerivationEngine& engine, EventSink* events, NotificationSink* notifier);

    // Run one cycle. Returns nullopt if a cycle is already in progress;
    // the trigger is dropped, never run in parallel.
    std::optional<CycleReport> run_cycle();

    // Forward authenticated heartbeats to the notifier too
    void set_notify_heartbeats(bool enabled) { notify_heartbeats_ = enabled; }

    bool busy() const { return running_.load(std::memory_order_acquire); }
    uint64_t cycles() const { return cycles_; }
    uint64_t dropped_triggers() const { return dropped_; }

    EventDerivationEngine& engine() { return engine_; }

private:
    EventDerivationEngine& engine_;
    EventSink* events_;
    NotificationSink* notifier_;
    bool notify_heartbeats_ = false;

    std::atomic<bool> running_{false};
    uint64_t cycles_ = 0;
    uint64_t dropped_ = 0;

    bool should_notify(EventType type) const;
    void dispatch(CycleReport& report);
};

} // namespace tunnelwatch
