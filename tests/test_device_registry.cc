#include <core/network/discovery/device_registry.h>
#include <doctest/doctest.h>

using namespace lanlink::core;
using namespace std::chrono_literals;

TEST_CASE("upsert creates then refreshes") {
    DeviceRegistry registry(120s);
    auto t0 = DeviceRegistry::Clock::now();

    CHECK(registry.Upsert("alice", "192.168.1.10", 40000, t0));
    CHECK_FALSE(registry.Upsert("alice", "192.168.1.11", 40001, t0 + 5s));
    CHECK(registry.size() == 1);

    auto alice = registry.Lookup("alice");
    REQUIRE(alice.has_value());
    CHECK(alice->ip_address == "192.168.1.11");
    CHECK(alice->port == 40001);
    CHECK(alice->last_seen == t0 + 5s);
}

TEST_CASE("last seen never goes backwards") {
    DeviceRegistry registry;
    auto t0 = DeviceRegistry::Clock::now();
    registry.Upsert("alice", "10.0.0.1", 1, t0 + 10s);
    registry.Upsert("alice", "10.0.0.1", 1, t0);
    CHECK(registry.Lookup("alice")->last_seen == t0 + 10s);
}

TEST_CASE("lookup of an unknown name") {
    DeviceRegistry registry;
    CHECK_FALSE(registry.Lookup("nobody").has_value());
    CHECK_FALSE(registry.FindNameByAddress("10.0.0.1").has_value());
}

TEST_CASE("snapshot keeps insertion order") {
    DeviceRegistry registry;
    auto now = DeviceRegistry::Clock::now();
    registry.Upsert("carol", "10.0.0.3", 1, now);
    registry.Upsert("alice", "10.0.0.1", 1, now);
    registry.Upsert("bob", "10.0.0.2", 1, now);
    registry.Upsert("carol", "10.0.0.3", 1, now + 1s);

    auto devices = registry.Snapshot();
    REQUIRE(devices.size() == 3);
    CHECK(devices[0].name == "carol");
    CHECK(devices[1].name == "alice");
    CHECK(devices[2].name == "bob");
    CHECK(registry.FindNameByAddress("10.0.0.2") == std::optional<std::string>("bob"));
}

TEST_CASE("sweep removes devices silent for longer than the timeout") {
    DeviceRegistry registry(120s);
    auto t0 = DeviceRegistry::Clock::now();
    registry.Upsert("old", "10.0.0.1", 1, t0);
    registry.Upsert("fresh", "10.0.0.2", 1, t0 + 60s);

    // Exactly at the timeout the device is still alive
    CHECK(registry.Sweep(t0 + 120s).empty());

    auto expired = registry.Sweep(t0 + 121s);
    REQUIRE(expired.size() == 1);
    CHECK(expired[0].name == "old");

    auto devices = registry.Snapshot();
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].name == "fresh");
}
