#include <gtest/gtest.h>
#include <tunnelwatch/engine.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>
#include <string>

using namespace tunnelwatch;

namespace {

std::string record(const char* address, const char* vip, const char* username = "UNDEF",
                   uint64_t rx = 100, uint64_t tx = 200) {
    return fmt::format("CLIENT_LIST,{},{},{},,{},{},Mon Jan  1 11:00:00 2024,1704106800,{},0\n",
                       username, address, vip, rx, tx, username);
}

Snapshot snapshot_of(std::initializer_list<std::string> records) {
    std::string content = "TITLE,OpenVPN 2.6.8\nHEADER,CLIENT_LIST,Common Name\n";
    for (const auto& r : records) content += r;
    content += "END\n";
    return parse_snapshot(content);
}

LogSignal login(const char* ip, uint16_t port, const char* username) {
    return LogSignal{SignalKind::Login, SessionKey{ip, port}, std::string(username)};
}

LogSignal logout(const char* ip, uint16_t port, const char* username) {
    return LogSignal{SignalKind::Logout, SessionKey{ip, port}, std::string(username)};
}

LogSignal auth_failed(const char* ip, uint16_t port) {
    return LogSignal{SignalKind::AuthFailed, SessionKey{ip, port}, std::nullopt};
}

size_t count_of(const std::vector<ConnectionEvent>& events, EventType type) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [type](const ConnectionEvent& e) { return e.event_type == type; }));
}

} // anonymous namespace

class EngineTest : public ::testing::Test {
protected:
    EngineTest()
        : engine("/nonexistent/status.log", "/nonexistent/server.log",
                 ServerIdentity{"vpn-test-01", "eu-west-1"})
    {
    }

    std::vector<ConnectionEvent> cycle(std::vector<LogSignal> signals, const Snapshot& snap) {
        return engine.derive(signals, &snap, now);
    }

    EventDerivationEngine engine;
    std::chrono::system_clock::time_point now =
        std::chrono::system_clock::time_point(std::chrono::seconds(1704110400));

    SessionKey alice{"10.0.0.5", 5000};
    SessionKey office{"192.168.1.10", 4000};
};

TEST_F(EngineTest, LoginBeforeSnapshotYieldsAuthenticatedNotConnect) {
    // Cycle 1: empty snapshot, login in the log
    auto events = cycle({login("10.0.0.5", 5000, "alice")}, snapshot_of({}));
    EXPECT_TRUE(events.empty());

    const SessionEntry* entry = engine.registry().find(alice);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->username, "alice");
    EXPECT_FALSE(entry->active);

    // Cycle 2: the session shows up in the snapshot
    events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Authenticated);
    EXPECT_EQ(events[0].username, "alice");
    EXPECT_EQ(events[0].virtual_ip, "10.8.0.4");
    EXPECT_TRUE(engine.registry().is_active(alice));
}

TEST_F(EngineTest, LoginInSameCycleSuppressesConnect) {
    auto events = cycle({login("10.0.0.5", 5000, "alice")},
                        snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));

    EXPECT_EQ(count_of(events, EventType::Connect), 0u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Authenticated);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, NewSessionConnects) {
    auto events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice", 1200, 3400)}));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_type, EventType::Connect);
    EXPECT_EQ(events[0].client_ip, "10.0.0.5");
    EXPECT_EQ(events[0].client_port, 5000);
    EXPECT_EQ(events[0].username, "alice");
    EXPECT_EQ(events[0].virtual_ip, "10.8.0.4");
    EXPECT_EQ(events[0].bytes_received, 1200u);
    EXPECT_EQ(events[0].bytes_sent, 3400u);

    EXPECT_EQ(events[1].event_type, EventType::Authenticated);
    EXPECT_EQ(events[1].username, "alice");
}

TEST_F(EngineTest, SilentDepartureDisconnectsOnce) {
    auto events = cycle({}, snapshot_of({record("192.168.1.10:4000", "10.8.0.9")}));
    EXPECT_EQ(count_of(events, EventType::Connect), 1u);

    events = cycle({}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Disconnect);
    EXPECT_EQ(events[0].key(), office);
    EXPECT_FALSE(events[0].username.has_value());
    EXPECT_FALSE(engine.registry().contains(office));

    // Stays gone
    events = cycle({}, snapshot_of({}));
    EXPECT_TRUE(events.empty());
}

TEST_F(EngineTest, SnapshotDisconnectCarriesResolvedUsername) {
    cycle({login("10.0.0.5", 5000, "alice")}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));

    auto events = cycle({}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Disconnect);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, IdempotentRepoll) {
    Snapshot snap = snapshot_of({
        record("10.0.0.5:5000", "10.8.0.4", "alice"),
        record("10.0.0.6:5001", "10.8.0.5", "bob"),
    });
    cycle({}, snap);

    for (int i = 0; i < 3; ++i) {
        auto events = cycle({}, snap);
        ASSERT_EQ(events.size(), 2u);
        EXPECT_EQ(count_of(events, EventType::Authenticated), 2u);
    }
}

TEST_F(EngineTest, LogoutAndDepartureInSameCycle) {
    cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")}));

    auto events = cycle({logout("10.0.0.5", 5000, "alice")}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Disconnect);
    EXPECT_EQ(events[0].username, "alice");
    EXPECT_FALSE(events[0].virtual_ip.has_value());

    EXPECT_TRUE(engine.cursor().suppressed.empty());
    EXPECT_FALSE(engine.registry().contains(alice));
}

TEST_F(EngineTest, LogoutBeforeDepartureInLaterCycle) {
    Snapshot listed = snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")});
    cycle({}, listed);

    // Logged out but the status file has not caught up yet
    auto events = cycle({logout("10.0.0.5", 5000, "alice")}, listed);
    EXPECT_EQ(count_of(events, EventType::Disconnect), 1u);
    EXPECT_EQ(engine.cursor().suppressed.count(alice), 1u);

    events = cycle({}, listed);
    EXPECT_EQ(count_of(events, EventType::Disconnect), 0u);

    events = cycle({}, snapshot_of({}));
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(engine.cursor().suppressed.empty());
    EXPECT_FALSE(engine.registry().contains(alice));
}

TEST_F(EngineTest, LogoutForUnlistedSessionIsPruned) {
    auto events = cycle({logout("10.0.0.7", 6000, "carol")}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Disconnect);
    EXPECT_EQ(events[0].username, "carol");

    EXPECT_TRUE(engine.cursor().suppressed.empty());
    EXPECT_TRUE(engine.registry().empty());
}

TEST_F(EngineTest, AuthFailedEvent) {
    auto events = cycle({auth_failed("203.0.113.7", 40000)}, snapshot_of({}));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::AuthFailed);
    EXPECT_EQ(events[0].client_ip, "203.0.113.7");
    EXPECT_EQ(events[0].client_port, 40000);
    EXPECT_FALSE(events[0].username.has_value());
    EXPECT_TRUE(engine.registry().empty());
}

TEST_F(EngineTest, EventOrdering) {
    cycle({}, snapshot_of({record("10.0.0.1:1", "10.8.0.1", "gone")}));

    auto events = cycle(
        {auth_failed("203.0.113.7", 40000)},
        snapshot_of({record("10.0.0.2:2", "10.8.0.2", "fresh")}));

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].event_type, EventType::AuthFailed);
    EXPECT_EQ(events[1].event_type, EventType::Connect);
    EXPECT_EQ(events[2].event_type, EventType::Authenticated);
    EXPECT_EQ(events[3].event_type, EventType::Disconnect);
    EXPECT_EQ(events[3].username, "gone");
}

TEST_F(EngineTest, MissingSnapshotKeepsMembership) {
    Snapshot listed = snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")});
    cycle({}, listed);

    auto events = engine.derive({auth_failed("203.0.113.7", 40000)}, nullptr, now);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::AuthFailed);
    EXPECT_FALSE(engine.last_cycle().snapshot_available);
    ASSERT_EQ(engine.cursor().previous_clients.size(), 1u);

    // Snapshot back: no spurious connect or disconnect
    events = cycle({}, listed);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Authenticated);
}

TEST_F(EngineTest, MalformedRecordTolerated) {
    Snapshot snap = parse_snapshot(
        "CLIENT_LIST,broken,10.0.0.9:1,10.8.0.9\n" +
        record("10.0.0.5:5000", "10.8.0.4", "alice"));

    auto events = cycle({}, snap);
    ASSERT_EQ(events.size(), 2u);
    for (const auto& e : events) {
        EXPECT_EQ(e.key(), alice);
    }
    EXPECT_EQ(engine.last_cycle().malformed_records, 1u);
}

TEST_F(EngineTest, SnapshotUsernameFillsRegistry) {
    cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")}));
    EXPECT_EQ(engine.registry().username_of(alice), "alice");

    // Later records without a username still resolve it
    auto events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, LoginUsernameNotOverwrittenBySnapshot) {
    cycle({login("10.0.0.5", 5000, "alice")}, snapshot_of({}));
    auto events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice-cn")}));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Authenticated);
    EXPECT_EQ(events[0].username, "alice");
    EXPECT_EQ(engine.registry().username_of(alice), "alice");

    // The whole timeline of the session carries the same name
    events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice-cn")}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].username, "alice");

    events = cycle({}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Disconnect);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, LoginOnlySessionExpires) {
    SessionKey short_lived{"10.0.0.5", 7};
    cycle({login("10.0.0.5", 7, "mallory")}, snapshot_of({}));

    // Still waiting for the status file to list it
    for (uint64_t i = 1; i < PENDING_LOGIN_CYCLES; ++i) {
        cycle({}, snapshot_of({}));
        EXPECT_TRUE(engine.registry().contains(short_lived)) << "cycle " << i;
    }

    cycle({}, snapshot_of({}));
    EXPECT_FALSE(engine.registry().contains(short_lived));

    // A later session on the recycled address is announced
    auto events = cycle({}, snapshot_of({record("10.0.0.5:7", "10.8.0.7", "trent")}));
    EXPECT_EQ(count_of(events, EventType::Connect), 1u);
}

TEST_F(EngineTest, LoginOnlySessionsDoNotAccumulate) {
    for (uint16_t port = 1; port <= 1000; ++port) {
        cycle({login("10.0.0.5", port, "user")}, snapshot_of({}));
    }
    EXPECT_LE(engine.registry().size(), PENDING_LOGIN_CYCLES);
}

TEST_F(EngineTest, ListedSessionsNeverExpire) {
    Snapshot listed = snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")});
    for (uint64_t i = 0; i < PENDING_LOGIN_CYCLES * 3; ++i) {
        cycle({}, listed);
    }
    EXPECT_TRUE(engine.registry().is_active(alice));

    auto events = cycle({}, snapshot_of({}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, LateLogoutAfterDepartureIgnored) {
    cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")}));

    // Status file drops the session before the exit line is read
    auto events = cycle({}, snapshot_of({}));
    ASSERT_EQ(count_of(events, EventType::Disconnect), 1u);
    EXPECT_EQ(engine.cursor().departed.count(alice), 1u);

    events = cycle({logout("10.0.0.5", 5000, "alice")}, snapshot_of({}));
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(engine.cursor().departed.empty());
    EXPECT_TRUE(engine.cursor().suppressed.empty());
    EXPECT_TRUE(engine.registry().empty());
}

TEST_F(EngineTest, LargeSnapshotConnectsEverySession) {
    std::string content;
    for (int i = 0; i < 5000; ++i) {
        content += record(fmt::format("10.{}.{}.1:{}", i / 250, i % 250, 1000 + i).c_str(), "10.8.0.2");
    }
    Snapshot snap = parse_snapshot(content);
    ASSERT_EQ(snap.clients.size(), 5000u);

    auto events = cycle({}, snap);
    EXPECT_EQ(count_of(events, EventType::Connect), 5000u);
    EXPECT_EQ(count_of(events, EventType::Authenticated), 5000u);
    EXPECT_EQ(events[0].key(), snap.clients[0].key);
}

TEST_F(EngineTest, ReusedSessionKeyIsNotDistinguished) {
    Snapshot listed = snapshot_of({record("10.0.0.5:5000", "10.8.0.4", "alice")});
    cycle({}, listed);

    // Logout then an immediate reconnect from the same address and port.
    // Membership never changes, so no new connect is derived.
    auto events = cycle({logout("10.0.0.5", 5000, "alice"), login("10.0.0.5", 5000, "alice")}, listed);
    EXPECT_EQ(count_of(events, EventType::Disconnect), 1u);
    EXPECT_EQ(count_of(events, EventType::Connect), 0u);

    events = cycle({}, listed);
    EXPECT_EQ(count_of(events, EventType::Connect), 0u);
    EXPECT_EQ(count_of(events, EventType::Authenticated), 1u);
}

TEST_F(EngineTest, EventsCarryServerIdentityAndCycleTime) {
    auto events = cycle({auth_failed("203.0.113.7", 40000)},
                        snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));
    ASSERT_FALSE(events.empty());
    for (const auto& e : events) {
        EXPECT_EQ(e.server_name, "vpn-test-01");
        EXPECT_EQ(e.server_location, "eu-west-1");
        EXPECT_EQ(e.timestamp, now);
    }
}

TEST_F(EngineTest, RestoreResumesFromSavedCursor) {
    PollCursor cursor;
    cursor.log_offset = 1234;
    cursor.previous_clients = {alice};
    SessionRegistry registry;
    registry.set_username(alice, "alice");
    registry.mark_active(alice, std::string("10.8.0.4"));

    engine.restore(cursor, std::move(registry));
    EXPECT_EQ(engine.cursor().log_offset, 1234u);

    // Already known: heartbeat only
    auto events = cycle({}, snapshot_of({record("10.0.0.5:5000", "10.8.0.4")}));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Authenticated);
    EXPECT_EQ(events[0].username, "alice");
}

TEST_F(EngineTest, PollWithMissingSourcesYieldsNothing) {
    auto events = engine.poll();
    EXPECT_TRUE(events.empty());
    EXPECT_FALSE(engine.last_cycle().log_available);
    EXPECT_FALSE(engine.last_cycle().snapshot_available);
    EXPECT_EQ(engine.cursor().log_offset, 0u);
}
