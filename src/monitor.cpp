#include "tunnelwatch/monitor.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace tunnelwatch {

namespace {

// Clears the running flag however the cycle ends
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_.store(false, std::memory_order_release); }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // anonymous namespace

Monitor::Monitor(EventDerivationEngine& engine, EventSink* events, NotificationSink* notifier)
    : engine_(engine)
    , events_(events)
    , notifier_(notifier)
{
}

std::optional<CycleReport> Monitor::run_cycle() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        dropped_++;
        spdlog::warn("Poll cycle still running, dropping trigger");
        return std::nullopt;
    }
    RunningGuard guard(running_);

    CycleReport report;
    report.events = engine_.poll();
    cycles_++;

    dispatch(report);

    if (report.sink_failures > 0 || report.notify_failures > 0) {
        spdlog::warn("Cycle {}: {} events, {} sink failures, {} notification failures",
                     cycles_, report.events.size(), report.sink_failures, report.notify_failures);
    } else {
        spdlog::debug("Cycle {}: {} events", cycles_, report.events.size());
    }
    return report;
}

bool Monitor::should_notify(EventType type) const {
    if (type == EventType::Authenticated) {
        return notify_heartbeats_;
    }
    return true;
}

void Monitor::dispatch(CycleReport& report) {
    for (const auto& event : report.events) {
        if (events_) {
            try {
                if (!events_->write(event)) {
                    report.sink_failures++;
                    spdlog::warn("Failed to store {} event for {}:{}",
                                 to_string(event.event_type), event.client_ip, event.client_port);
                }
            } catch (const std::exception& e) {
                report.sink_failures++;
                spdlog::warn("Event sink error for {}:{}: {}", event.client_ip, event.client_port, e.what());
            }
        }

        if (notifier_ && should_notify(event.event_type)) {
            try {
                if (notifier_->notify(Alert::from_event(event))) {
                    report.notifications_sent++;
                } else {
                    report.notify_failures++;
                    spdlog::warn("Notification for {} event was not delivered", to_string(event.event_type));
                }
            } catch (const std::exception& e) {
                report.notify_failures++;
                spdlog::warn("Notification sink error: {}", e.what());
            }
        }
    }
}

} // namespace tunnelwatch
