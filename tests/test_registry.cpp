#include <gtest/gtest.h>
#include <tunnelwatch/registry.hpp>

using namespace tunnelwatch;

class RegistryTest : public ::testing::Test {
protected:
    SessionRegistry registry;

    SessionKey alice{"10.0.0.5", 5000};
    SessionKey bob{"10.0.0.6", 5001};
};

TEST_F(RegistryTest, UpsertCreatesInactiveEntry) {
    EXPECT_TRUE(registry.empty());

    SessionEntry& entry = registry.upsert(alice);
    EXPECT_FALSE(entry.active);
    EXPECT_FALSE(entry.username.has_value());
    EXPECT_FALSE(entry.virtual_ip.has_value());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains(alice));
    EXPECT_FALSE(registry.is_active(alice));
}

TEST_F(RegistryTest, UpsertReturnsExistingEntry) {
    registry.upsert(alice).username = "alice";
    SessionEntry& again = registry.upsert(alice);

    ASSERT_TRUE(again.username.has_value());
    EXPECT_EQ(*again.username, "alice");
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(RegistryTest, FindDoesNotCreate) {
    EXPECT_EQ(registry.find(alice), nullptr);
    EXPECT_FALSE(registry.contains(alice));
    EXPECT_FALSE(registry.is_active(alice));
    EXPECT_FALSE(registry.username_of(alice).has_value());
    EXPECT_TRUE(registry.empty());
}

TEST_F(RegistryTest, LoginUsernameBeforeSnapshot) {
    registry.set_username(alice, "alice");

    EXPECT_TRUE(registry.contains(alice));
    EXPECT_FALSE(registry.is_active(alice));
    EXPECT_EQ(registry.username_of(alice), "alice");
}

TEST_F(RegistryTest, MarkActiveKeepsUsername) {
    registry.set_username(alice, "alice");
    registry.mark_active(alice, std::string("10.8.0.4"));

    const SessionEntry* entry = registry.find(alice);
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->active);
    EXPECT_EQ(entry->username, "alice");
    EXPECT_EQ(entry->virtual_ip, "10.8.0.4");
}

TEST_F(RegistryTest, MarkActiveWithoutVirtualIpKeepsPrevious) {
    registry.mark_active(alice, std::string("10.8.0.4"));
    registry.mark_active(alice, std::nullopt);

    EXPECT_EQ(registry.find(alice)->virtual_ip, "10.8.0.4");
}

TEST_F(RegistryTest, Remove) {
    registry.mark_active(alice, std::nullopt);
    registry.mark_active(bob, std::nullopt);

    EXPECT_TRUE(registry.remove(alice));
    EXPECT_FALSE(registry.remove(alice));
    EXPECT_FALSE(registry.contains(alice));
    EXPECT_TRUE(registry.contains(bob));
    EXPECT_EQ(registry.size(), 1u);

    registry.clear();
    EXPECT_TRUE(registry.empty());
}

TEST_F(RegistryTest, PruneInactiveKeepsRecentAndActive) {
    SessionKey stale{"10.0.0.7", 7};
    registry.touch(stale, 1);
    registry.set_username(alice, "alice");
    registry.touch(alice, 5);
    registry.mark_active(bob, std::nullopt);
    registry.touch(bob, 1);

    EXPECT_EQ(registry.prune_inactive(5), 1u);
    EXPECT_FALSE(registry.contains(stale));
    EXPECT_TRUE(registry.contains(alice));
    // Listed sessions stay however old their stamp is
    EXPECT_TRUE(registry.contains(bob));

    EXPECT_EQ(registry.prune_inactive(6), 1u);
    EXPECT_FALSE(registry.contains(alice));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(RegistryTest, EntriesOrderedByKey) {
    SessionKey low_port{"10.0.0.5", 80};
    registry.upsert(bob);
    registry.upsert(alice);
    registry.upsert(low_port);

    auto entries = registry.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, low_port);
    EXPECT_EQ(entries[1].first, alice);
    EXPECT_EQ(entries[2].first, bob);
}

TEST(SessionKeyTest, ParseAndFormat) {
    SessionKey key = SessionKey::parse("192.168.1.10:4000");
    EXPECT_EQ(key.client_ip, "192.168.1.10");
    EXPECT_EQ(key.client_port, 4000);
    EXPECT_EQ(key.to_string(), "192.168.1.10:4000");
}

TEST(SessionKeyTest, ParseDefaultsPortToZero) {
    EXPECT_EQ(SessionKey::parse("192.168.1.10"), (SessionKey{"192.168.1.10", 0}));
    EXPECT_EQ(SessionKey::parse("192.168.1.10:abc"), (SessionKey{"192.168.1.10", 0}));
    EXPECT_EQ(SessionKey::parse("192.168.1.10:70000"), (SessionKey{"192.168.1.10", 0}));
}

TEST(SessionKeyTest, ParseSplitsAtLastColon) {
    SessionKey key = SessionKey::parse("fd00::1:1194");
    EXPECT_EQ(key.client_ip, "fd00::1");
    EXPECT_EQ(key.client_port, 1194);
}

TEST(EventTypeTest, Names) {
    EXPECT_EQ(to_string(EventType::Connect), "connect");
    EXPECT_EQ(to_string(EventType::Authenticated), "authenticated");
    EXPECT_EQ(to_string(EventType::Disconnect), "disconnect");
    EXPECT_EQ(to_string(EventType::AuthFailed), "auth_failed");

    EXPECT_EQ(parse_event_type("auth_failed"), EventType::AuthFailed);
    EXPECT_FALSE(parse_event_type("reconnect").has_value());
}
