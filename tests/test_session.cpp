#include <doctest/doctest.h>
#include "orvibo/session.hpp"
#include "orvibo/packets.hpp"
#include "fake_transport.hpp"

#include <chrono>
#include <memory>

using namespace orvibo;
using orvibo_test::FakeTransport;
using orvibo_test::learn_frame;
using orvibo_test::set_state_ack;
using orvibo_test::subscribe_ack;

static const MacAddress SOCKET_MAC{0xac, 0xdf, 0x23, 0x8d, 0x1d, 0x2e};
static const MacAddress BLASTER_MAC{0xac, 0xcf, 0x43, 0x78, 0xef, 0xdc};
static const char* SOCKET_IP  = "192.168.1.45";
static const char* BLASTER_IP = "192.168.1.37";

static Config test_config() {
    Config cfg;
    cfg.response_timeout_ms   = 50;
    cfg.subscribe_interval_ms = 10;
    return cfg;
}

static DeviceRecord socket_record()  { return DeviceRecord{DeviceType::Socket, SOCKET_IP, SOCKET_MAC}; }
static DeviceRecord blaster_record() { return DeviceRecord{DeviceType::Blaster, BLASTER_IP, BLASTER_MAC}; }

static long long ms_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("open binds an ephemeral port without sending anything") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));

    CHECK(s.state() == Session::State::Closed);
    REQUIRE(s.open() == Status::Ok);
    CHECK(s.state() == Session::State::Open);
    CHECK(fake->bound_port == 0);
    CHECK_FALSE(fake->broadcast_on);
    CHECK(fake->sent.empty());

    CHECK(s.open() == Status::Ok);
    CHECK(fake->opens == 1);
}

TEST_CASE("Commands on a closed session are NotOpen") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));

    SocketState st;
    CHECK(s.subscribe() == Status::NotOpen);
    CHECK(s.query_state(st) == Status::NotOpen);
    CHECK(s.set_state(true, st) == Status::NotOpen);
    CHECK(fake->sent.empty());
}

TEST_CASE("A record of the other kind is refused at open") {
    SocketSession s(blaster_record(), test_config(), std::make_unique<FakeTransport>());
    CHECK(s.open() == Status::UnsupportedOperation);
    CHECK_FALSE(s.is_open());
}

TEST_CASE("subscribe: ack, silence, and a wrong answer") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    SUBCASE("ack") {
        fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
        REQUIRE(s.subscribe() == Status::Ok);
        CHECK(s.is_subscribed());
        REQUIRE(fake->sent.size() == 1);
        CHECK(fake->sent[0].bytes == make_subscribe(SOCKET_MAC));
        CHECK(fake->sent[0].to.ip == SOCKET_IP);
        CHECK(fake->sent[0].to.port == 10000);
    }
    SUBCASE("silence") {
        CHECK(s.subscribe() == Status::Timeout);
        CHECK(s.state() == Session::State::Open);
    }
    SUBCASE("answered with something else") {
        fake->queue(SOCKET_IP, Command::SetStateAck, set_state_ack(SOCKET_MAC, true));
        CHECK(s.subscribe() == Status::SubscribeRejected);
        CHECK_FALSE(s.is_subscribed());
    }
    SUBCASE("ack for another device") {
        fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(BLASTER_MAC, false));
        CHECK(s.subscribe() == Status::SubscribeRejected);
    }
    SUBCASE("garbage from the device is a codec error") {
        fake->queue(SOCKET_IP, std::vector<uint8_t>{0x68, 0x64, 0x00, 0x40, 0x63, 0x6c});
        CHECK(s.subscribe() == Status::TruncatedFrame);
    }
}

TEST_CASE("close sends a best-effort unsubscribe and is idempotent") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);
    fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, true));
    REQUIRE(s.subscribe() == Status::Ok);

    SUBCASE("send works") {
        s.close();
        REQUIRE(fake->sent.size() == 2);
        CHECK(fake->sent[1].bytes == make_unsubscribe(SOCKET_MAC));
    }
    SUBCASE("send fails") {
        fake->fail_send = true;
        s.close();
        CHECK(fake->sent.size() == 1);
    }

    CHECK(s.state() == Session::State::Closed);
    CHECK_FALSE(fake->is_open());
    CHECK(fake->closes == 1);

    s.close();
    CHECK(fake->closes == 1);
}

TEST_CASE("close on an open but unsubscribed session sends nothing") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    {
        SocketSession s(socket_record(), test_config(), std::move(t));
        REQUIRE(s.open() == Status::Ok);
        s.close();
        CHECK(fake->sent.empty());
        CHECK(fake->closes == 1);
    }
}

// ---------------------------------------------------------------------------
// Socket
// ---------------------------------------------------------------------------

TEST_CASE("query, toggle, query gives the toggled value") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, false));
    SocketState before;
    REQUIRE(s.query_state(before) == Status::Ok);
    CHECK_FALSE(before.on);
    CHECK(s.is_subscribed());

    fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
    fake->queue(SOCKET_IP, Command::SetStateAck, set_state_ack(SOCKET_MAC, true));
    fake->queue(SOCKET_IP, Command::StateChanged, set_state_ack(SOCKET_MAC, true));   // relay push
    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    SocketState confirmed;
    REQUIRE(s.set_state(!before.on, confirmed) == Status::Ok);
    CHECK(confirmed.on);

    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    SocketState after;
    REQUIRE(s.query_state(after) == Status::Ok);
    CHECK(after.on == !before.on);

    REQUIRE(fake->sent.size() == 5);
    CHECK(fake->sent_command(0) == code(Command::QueryState));
    CHECK(fake->sent_command(1) == code(Command::Subscribe));
    CHECK(fake->sent[2].bytes == make_set_state(SOCKET_MAC, true));
    CHECK(fake->sent_command(3) == code(Command::QueryState));
    CHECK(fake->sent_command(4) == code(Command::QueryState));
}

TEST_CASE("set_state on an unsubscribed session subscribes before the control frame") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);
    REQUIRE_FALSE(s.is_subscribed());

    fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
    fake->queue(SOCKET_IP, Command::SetStateAck, set_state_ack(SOCKET_MAC, true));
    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    SocketState confirmed;
    REQUIRE(s.set_state(true, confirmed) == Status::Ok);
    CHECK(confirmed.on);
    CHECK(s.is_subscribed());

    REQUIRE(fake->sent.size() == 3);
    CHECK(fake->sent[0].bytes == make_subscribe(SOCKET_MAC));
    CHECK(fake->sent_command(1) == code(Command::SetState));
    CHECK(fake->sent_command(2) == code(Command::QueryState));
}

TEST_CASE("set_state sends no control frame when the relay is already there") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, true));
    SocketState confirmed;
    REQUIRE(s.set_state(true, confirmed) == Status::Ok);
    CHECK(confirmed.on);

    REQUIRE(fake->sent.size() == 1);
    CHECK(fake->sent_command(0) == code(Command::Subscribe));
}

TEST_CASE("set_state reports what the device confirms, not what was asked") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
    fake->queue(SOCKET_IP, Command::SetStateAck, set_state_ack(SOCKET_MAC, true));
    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, false));
    SocketState confirmed;
    confirmed.on = true;
    REQUIRE(s.set_state(true, confirmed) == Status::Ok);
    CHECK_FALSE(confirmed.on);
    CHECK(fake->sent_command(0) == code(Command::Subscribe));
}

TEST_CASE("Mismatched replies to socket commands are UnexpectedResponse") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);
    SocketState st;

    SUBCASE("query") {
        fake->queue(SOCKET_IP, Command::SetStateAck, set_state_ack(SOCKET_MAC, true));
        CHECK(s.query_state(st) == Status::UnexpectedResponse);
    }
    SUBCASE("control") {
        fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
        fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, true));
        CHECK(s.set_state(true, st) == Status::UnexpectedResponse);
    }
    SUBCASE("control unanswered") {
        fake->queue(SOCKET_IP, Command::SubscribeAck, subscribe_ack(SOCKET_MAC, false));
        CHECK(s.set_state(true, st) == Status::Timeout);
        CHECK(fake->sent.size() == 2);
    }
    SUBCASE("no subscribe ack, no control frame") {
        CHECK(s.set_state(true, st) == Status::Timeout);
        REQUIRE(fake->sent.size() == 1);
        CHECK(fake->sent_command(0) == code(Command::Subscribe));
    }
}

TEST_CASE("Datagrams from other hosts are ignored while waiting") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    fake->queue("192.168.1.99", Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, false));
    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    SocketState st;
    REQUIRE(s.query_state(st) == Status::Ok);
    CHECK(st.on);
}

TEST_CASE("Back-to-back queries are spaced by the subscribe interval") {
    Config cfg = test_config();
    cfg.subscribe_interval_ms = 80;
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    SocketSession s(socket_record(), cfg, std::move(t));
    REQUIRE(s.open() == Status::Ok);

    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    fake->queue(SOCKET_IP, Command::QueryStateResponse, subscribe_ack(SOCKET_MAC, true));
    SocketState st;
    REQUIRE(s.query_state(st) == Status::Ok);
    auto t0 = std::chrono::steady_clock::now();
    REQUIRE(s.query_state(st) == Status::Ok);
    CHECK(ms_since(t0) >= 70);
}

// ---------------------------------------------------------------------------
// Blaster
// ---------------------------------------------------------------------------

static BlasterSession subscribed_blaster(FakeTransport*& fake, const Config& cfg = test_config()) {
    auto t = std::make_unique<FakeTransport>();
    fake = t.get();
    BlasterSession s(blaster_record(), cfg, std::move(t));
    REQUIRE(s.open() == Status::Ok);
    fake->queue(BLASTER_IP, Command::SubscribeAck, subscribe_ack(BLASTER_MAC, false));
    REQUIRE(s.subscribe() == Status::Ok);
    fake->sent.clear();
    return s;
}

TEST_CASE("emit without subscribe is refused before any datagram") {
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* fake = t.get();
    BlasterSession s(blaster_record(), test_config(), std::move(t));
    REQUIRE(s.open() == Status::Ok);

    SignalCapture cap{{0x01, 0x02, 0x03}, SignalKind::IR};
    CHECK(s.emit_signal(cap) == Status::NotSubscribed);
    std::optional<SignalCapture> out;
    CHECK(s.learn_signal(100, out) == Status::NotSubscribed);
    CHECK_FALSE(out.has_value());
    CHECK(fake->sent.empty());
}

TEST_CASE("learn with nobody pressing a button returns empty near the timeout") {
    FakeTransport* fake = nullptr;
    BlasterSession s = subscribed_blaster(fake);

    std::optional<SignalCapture> out;
    auto t0 = std::chrono::steady_clock::now();
    REQUIRE(s.learn_signal(1000, out) == Status::Ok);
    auto took = ms_since(t0);

    CHECK_FALSE(out.has_value());
    CHECK(took >= 950);
    CHECK(took < 1500);
    REQUIRE(fake->sent.size() == 1);
    CHECK(fake->sent[0].bytes == make_enter_learn(BLASTER_MAC));
}

TEST_CASE("learn skips the acknowledgement and foreign frames") {
    FakeTransport* fake = nullptr;
    BlasterSession s = subscribed_blaster(fake);

    const std::vector<uint8_t> signal{0x00, 0x00, 0x00, 0x00, 0x9a, 0x01, 0x55, 0xaa};
    fake->queue(BLASTER_IP, Command::SignalCaptured, learn_frame(BLASTER_MAC, {}));             // learn-mode ack
    fake->queue("192.168.1.50", Command::SignalCaptured, learn_frame(BLASTER_MAC, {0xde, 0xad})); // other host
    fake->queue(BLASTER_IP, Command::SubscribeAck, subscribe_ack(BLASTER_MAC, false));         // stray
    fake->queue(BLASTER_IP, Command::SignalCaptured, learn_frame(BLASTER_MAC, signal));

    std::optional<SignalCapture> out;
    REQUIRE(s.learn_signal(500, out, SignalKind::RF433) == Status::Ok);
    REQUIRE(out.has_value());
    CHECK(out->raw == signal);
    CHECK(out->kind == SignalKind::RF433);
}

TEST_CASE("emit replays the capture byte for byte") {
    FakeTransport* fake = nullptr;
    BlasterSession s = subscribed_blaster(fake);

    SignalCapture cap{{0x10, 0x20, 0x30, 0x40, 0x50}, SignalKind::IR};
    REQUIRE(s.emit_signal(cap) == Status::Ok);
    REQUIRE(fake->sent.size() == 1);

    Frame f;
    REQUIRE(decode(fake->sent[0].bytes, f) == Status::Ok);
    CHECK(f.is(Command::EmitSignal));
    REQUIRE(f.payload.size() == EMIT_PREFIX_LEN + cap.raw.size());
    CHECK(std::vector<uint8_t>(f.payload.begin(), f.payload.begin() + 6)
          == std::vector<uint8_t>(BLASTER_MAC.begin(), BLASTER_MAC.end()));
    CHECK(std::vector<uint8_t>(f.payload.begin() + EMIT_PREFIX_LEN, f.payload.end()) == cap.raw);

    CHECK(s.emit_signal(SignalCapture{}) == Status::EmptySignal);
    CHECK(fake->sent.size() == 1);
}

TEST_CASE("emit surfaces a send failure") {
    FakeTransport* fake = nullptr;
    BlasterSession s = subscribed_blaster(fake);
    fake->fail_send = true;
    CHECK(s.emit_signal(SignalCapture{{0x01}, SignalKind::IR}) == Status::SendError);
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

TEST_CASE("make_session picks the class from the record") {
    AnySession a = make_session(socket_record(), test_config(), std::make_unique<FakeTransport>());
    AnySession b = make_session(blaster_record(), test_config(), std::make_unique<FakeTransport>());
    CHECK(std::holds_alternative<SocketSession>(a));
    CHECK(std::holds_alternative<BlasterSession>(b));
    CHECK(std::get<BlasterSession>(b).device().mac == BLASTER_MAC);
}
