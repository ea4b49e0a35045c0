#include <doctest/doctest.h>
#include "orvibo/discovery.hpp"
#include "orvibo/packets.hpp"
#include "fake_transport.hpp"

#include <chrono>

using namespace orvibo;
using orvibo_test::FakeTransport;
using orvibo_test::discover_reply;

static const MacAddress SOCKET_MAC{0xac, 0xdf, 0x23, 0x8d, 0x1d, 0x2e};
static const MacAddress BLASTER_MAC{0xac, 0xcf, 0x43, 0x78, 0xef, 0xdc};

static Config quick_config() {
    Config cfg;
    cfg.broadcast_address = "192.168.1.255";
    return cfg;
}

TEST_CASE("Broadcast discovery classifies a socket and a blaster") {
    FakeTransport t;
    t.queue("192.168.1.45", Command::DiscoverResponse, discover_reply(SOCKET_MAC, "SOC"));
    t.queue("192.168.1.37", Command::DiscoverResponse, discover_reply(BLASTER_MAC, "IRD"));

    DeviceMap found;
    REQUIRE(discover_all(t, quick_config(), 20, 100, found) == Status::Ok);

    REQUIRE(found.size() == 2);
    REQUIRE(found.count("192.168.1.45") == 1);
    REQUIRE(found.count("192.168.1.37") == 1);
    CHECK(found["192.168.1.45"].type == DeviceType::Socket);
    CHECK(found["192.168.1.45"].mac == SOCKET_MAC);
    CHECK(found["192.168.1.37"].type == DeviceType::Blaster);
    CHECK(found["192.168.1.37"].mac == BLASTER_MAC);

    // One broadcast request on the vendor port, from a broadcast-enabled socket.
    REQUIRE(t.sent.size() == 1);
    CHECK(t.sent[0].bytes == make_discover());
    CHECK(t.sent[0].to.ip == "192.168.1.255");
    CHECK(t.sent[0].to.port == 10000);
    CHECK(t.broadcast_on);
    CHECK(t.bound_port == 10000);
}

TEST_CASE("First reply per MAC wins") {
    FakeTransport t;
    t.queue("192.168.1.45", Command::DiscoverResponse, discover_reply(SOCKET_MAC, "SOC"));
    t.queue("192.168.1.37", Command::DiscoverResponse, discover_reply(BLASTER_MAC, "IRD"));
    t.queue("192.168.1.99", Command::DiscoverResponse, discover_reply(SOCKET_MAC, "SOC"));

    DeviceMap found;
    REQUIRE(discover_all(t, quick_config(), 20, 100, found) == Status::Ok);

    REQUIRE(found.size() == 2);
    CHECK(found.count("192.168.1.99") == 0);
    CHECK(found["192.168.1.45"].mac == SOCKET_MAC);
    CHECK(found["192.168.1.37"].mac == BLASTER_MAC);
}

TEST_CASE("Echoed request, foreign traffic and unknown models are not devices") {
    FakeTransport t;
    t.queue("192.168.1.10", make_discover());                                   // our own broadcast
    t.queue("192.168.1.20", std::vector<uint8_t>{0x13, 0x37, 0x00, 0x06, 0x71, 0x61});
    t.queue("192.168.1.30", Command::DiscoverResponse, discover_reply(BLASTER_MAC, "ABC"));
    t.queue("192.168.1.40", Command::Subscribe, discover_reply(SOCKET_MAC, "SOC"));
    t.queue("192.168.1.45", Command::DiscoverResponse, discover_reply(SOCKET_MAC, "SOC"));

    DeviceMap found;
    REQUIRE(discover_all(t, quick_config(), 20, 100, found) == Status::Ok);
    REQUIRE(found.size() == 1);
    CHECK(found.begin()->first == "192.168.1.45");
}

TEST_CASE("Quiet network ends on the wall clock with an empty map") {
    FakeTransport t;
    DeviceMap found;
    found["stale"] = DeviceRecord{};

    auto t0 = std::chrono::steady_clock::now();
    REQUIRE(discover_all(t, quick_config(), 30, 120, found) == Status::Ok);
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

    CHECK(found.empty());
    CHECK(took >= 110);
    CHECK(took < 1000);
}

TEST_CASE("A zero per-receive timeout still waits between receives") {
    FakeTransport t;
    DeviceMap found;
    REQUIRE(discover_all(t, quick_config(), 0, 50, found) == Status::Ok);
    CHECK(found.empty());
    CHECK(t.receives > 0);
    CHECK(t.receives <= 60);
}

TEST_CASE("Transport failures are reported, not hidden") {
    DeviceMap found;
    SUBCASE("bind") {
        FakeTransport t;
        t.fail_open = true;
        CHECK(discover_all(t, quick_config(), 20, 50, found) == Status::BindError);
    }
    SUBCASE("send") {
        FakeTransport t;
        t.fail_send = true;
        CHECK(discover_all(t, quick_config(), 20, 50, found) == Status::SendError);
    }
}

TEST_CASE("Unicast discovery answers from the target only") {
    FakeTransport t;
    t.queue("192.168.1.37", Command::DiscoverResponse, discover_reply(BLASTER_MAC, "IRD"));
    t.queue("192.168.1.45", Command::DiscoverResponse, discover_reply(SOCKET_MAC, "SOC"));

    DeviceRecord rec;
    REQUIRE(discover_one(t, quick_config(), "192.168.1.45", 100, rec) == Status::Ok);
    CHECK(rec.ip == "192.168.1.45");
    CHECK(rec.type == DeviceType::Socket);
    CHECK(rec.mac == SOCKET_MAC);

    REQUIRE(t.sent.size() == 1);
    CHECK(t.sent[0].to.ip == "192.168.1.45");
}

TEST_CASE("Unicast discovery of a silent address is DeviceNotFound") {
    FakeTransport t;
    DeviceRecord rec;
    CHECK(discover_one(t, quick_config(), "192.168.1.200", 50, rec) == Status::DeviceNotFound);
}
