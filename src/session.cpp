// ============================================================================
// session.cpp — implementation for session.hpp
// For the state machine see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "orvibo/session.hpp"
#include "orvibo/log.hpp"
#include "orvibo/packets.hpp"
#include "orvibo/transport/transport_udp.hpp"

#include <thread>
#include <utility>

namespace orvibo {

static int ms_left(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Session::Session(const DeviceRecord& device, DeviceType kind, const Config& cfg,
                 std::unique_ptr<transport::DatagramTransport> t)
  : device_(device),
    kind_(kind),
    cfg_(cfg),
    transport_(std::move(t)),
    comp_(std::string(kind == DeviceType::Socket ? "SocketSession@" : "BlasterSession@") + device.ip) {
  if (!transport_) transport_ = std::make_unique<transport::UdpTransport>();
}

Session::Session(Session&& other) noexcept
  : device_(std::move(other.device_)),
    kind_(other.kind_),
    cfg_(std::move(other.cfg_)),
    transport_(std::move(other.transport_)),
    state_(other.state_),
    last_subscribe_(other.last_subscribe_),
    subscribed_once_(other.subscribed_once_),
    comp_(std::move(other.comp_)) {
  other.state_ = State::Closed;
}

Session::~Session() { close(); }

Status Session::open() {
  if (state_ != State::Closed) return Status::Ok;
  if (!transport_) return Status::NotOpen;
  if (device_.type != kind_) {
    log::error(comp_, std::string("record is a ") + device_type_name(device_.type)
                      + ", this session drives a " + device_type_name(kind_));
    return Status::UnsupportedOperation;
  }

  Status st = transport_->open(cfg_.bind_address, cfg_.session_bind_port, false);
  if (st != Status::Ok) {
    log::error(comp_, std::string("open failed reason=") + status_name(st));
    return st;
  }
  state_ = State::Open;
  log::debug(comp_, "open local_port=" + std::to_string(transport_->local_port()));
  return Status::Ok;
}

Status Session::subscribe() {
  Status st = ready();
  if (st != Status::Ok) return st;

  Frame reply;
  st = subscribe_exchange(make_subscribe(device_.mac), reply);
  if (st != Status::Ok) return st;

  SocketState ignored;
  st = parse_subscribe_ack(reply, device_.mac, ignored);
  if (st != Status::Ok) {
    log::warn(comp_, "subscribe answered with cmd=" + command_name(reply.command)
                     + " reason=" + status_name(st));
    return Status::SubscribeRejected;
  }

  state_ = State::Subscribed;
  log::info(comp_, "subscribed mac=" + mac_to_string(device_.mac));
  return Status::Ok;
}

void Session::close() {
  if (state_ == State::Closed) return;

  if (state_ == State::Subscribed && transport_) {
    Status st = send(make_unsubscribe(device_.mac));
    if (st != Status::Ok)
      log::warn(comp_, std::string("unsubscribe not sent reason=") + status_name(st));
  }
  if (transport_) transport_->close();
  state_ = State::Closed;
  log::debug(comp_, "closed");
}

Status Session::ready() const {
  if (state_ == State::Closed || !transport_) return Status::NotOpen;
  if (device_.type != kind_) return Status::UnsupportedOperation;
  return Status::Ok;
}

Status Session::send(const std::vector<uint8_t>& bytes) {
  if (log::enabled(log::Level::Debug)) log::debug(comp_, "tx " + describe(bytes));
  return transport_->send_to(bytes, {device_.ip, cfg_.port});
}

Status Session::await_frame(clock_type::time_point deadline, Frame& out) {
  for (;;) {
    int left = ms_left(deadline);
    if (left <= 0) return Status::Timeout;

    transport::Datagram d;
    Status st = transport_->receive(left, d);
    if (st != Status::Ok) return st;

    if (d.from.ip != device_.ip) {
      log::debug(comp_, "ignored datagram from " + d.from.ip);
      continue;
    }
    if (log::enabled(log::Level::Debug)) log::debug(comp_, "rx " + describe(d.bytes));

    st = decode(d.bytes, out);
    if (st != Status::Ok) {
      log::warn(comp_, std::string("undecodable reply reason=") + status_name(st));
      return st;
    }
    if (out.is(Command::StateChanged)) continue;   // relay push, not an answer
    return Status::Ok;
  }
}

Session::clock_type::time_point Session::reply_deadline() const {
  return clock_type::now() + std::chrono::milliseconds(cfg_.response_timeout_ms);
}

void Session::pace_subscribe() {
  if (!subscribed_once_) return;
  auto next = last_subscribe_ + std::chrono::milliseconds(cfg_.subscribe_interval_ms);
  auto now = clock_type::now();
  if (now < next) std::this_thread::sleep_for(next - now);
}

Status Session::subscribe_exchange(const std::vector<uint8_t>& request, Frame& reply) {
  pace_subscribe();
  Status st = send(request);
  last_subscribe_ = clock_type::now();
  subscribed_once_ = true;
  if (st != Status::Ok) return st;

  st = await_frame(reply_deadline(), reply);
  if (st == Status::Timeout) log::warn(comp_, "no subscribe ack");
  return st;
}

// ---------------------------------------------------------------------------
// SocketSession
// ---------------------------------------------------------------------------

SocketSession::SocketSession(const DeviceRecord& device, const Config& cfg,
                             std::unique_ptr<transport::DatagramTransport> t)
  : Session(device, DeviceType::Socket, cfg, std::move(t)) {}

Status SocketSession::query_state(SocketState& out) {
  Status st = ready();
  if (st != Status::Ok) return st;

  Frame reply;
  st = subscribe_exchange(make_query_state(device_.mac), reply);
  if (st != Status::Ok) return st;

  SocketState s;
  st = parse_subscribe_ack(reply, device_.mac, s);
  if (st != Status::Ok) {
    log::warn(comp(), "state query answered with cmd=" + command_name(reply.command));
    return st;
  }

  out = s;
  state_ = State::Subscribed;
  log::debug(comp(), std::string("state=") + (s.on ? "on" : "off"));
  return Status::Ok;
}

Status SocketSession::set_state(bool on, SocketState& confirmed) {
  // The firmware only takes control frames from its current subscriber, and
  // the subscribe ack tells us whether there is anything to switch.
  SocketState current;
  Status st = query_state(current);
  if (st != Status::Ok) return st;
  if (current.on == on) {
    log::info(comp(), std::string("already ") + (on ? "on" : "off"));
    confirmed = current;
    return Status::Ok;
  }

  st = send(make_set_state(device_.mac, on));
  if (st != Status::Ok) return st;

  Frame reply;
  st = await_frame(reply_deadline(), reply);
  if (st != Status::Ok) {
    if (st == Status::Timeout) log::warn(comp(), "no control ack");
    return st;
  }
  st = parse_set_state_ack(reply, device_.mac);
  if (st != Status::Ok) {
    log::warn(comp(), "control answered with cmd=" + command_name(reply.command));
    return st;
  }

  st = query_state(confirmed);
  if (st == Status::Ok && confirmed.on != on)
    log::warn(comp(), std::string("asked for ") + (on ? "on" : "off") + ", device reports "
                      + (confirmed.on ? "on" : "off"));
  return st;
}

// ---------------------------------------------------------------------------
// BlasterSession
// ---------------------------------------------------------------------------

BlasterSession::BlasterSession(const DeviceRecord& device, const Config& cfg,
                               std::unique_ptr<transport::DatagramTransport> t)
  : Session(device, DeviceType::Blaster, cfg, std::move(t)),
    rng_(std::random_device{}()) {}

Status BlasterSession::learn_signal(int timeout_ms, std::optional<SignalCapture>& out,
                                    SignalKind kind) {
  out.reset();
  Status st = ready();
  if (st != Status::Ok) return st;
  if (!is_subscribed()) return Status::NotSubscribed;

  st = send(make_enter_learn(device_.mac));
  if (st != Status::Ok) return st;

  const auto deadline = clock_type::now() + std::chrono::milliseconds(timeout_ms);
  log::info(comp(), "learning for " + std::to_string(timeout_ms) + " ms");

  for (;;) {
    Frame f;
    st = await_frame(deadline, f);
    if (st == Status::Timeout) {
      log::info(comp(), "no signal captured");
      return Status::Ok;
    }
    if (st != Status::Ok) return st;
    if (!f.is(Command::SignalCaptured)) {
      log::debug(comp(), "skipping cmd=" + command_name(f.command));
      continue;
    }

    bool captured = false;
    std::vector<uint8_t> raw;
    if (parse_learn_frame(f, device_.mac, captured, raw) != Status::Ok) continue;
    if (!captured) {
      log::debug(comp(), "learning mode on");
      continue;
    }

    out = SignalCapture{std::move(raw), kind};
    log::info(comp(), "captured " + std::to_string(out->raw.size()) + " bytes kind="
                      + signal_kind_name(kind));
    return Status::Ok;
  }
}

Status BlasterSession::emit_signal(const SignalCapture& capture) {
  Status st = ready();
  if (st != Status::Ok) return st;
  if (!is_subscribed()) return Status::NotSubscribed;

  std::vector<uint8_t> bytes;
  st = make_emit(device_.mac, capture.raw, static_cast<uint16_t>(rng_() & 0xFFFF), bytes);
  if (st != Status::Ok) return st;
  return send(bytes);
}

// ---------------------------------------------------------------------------

AnySession make_session(const DeviceRecord& device, const Config& cfg,
                        std::unique_ptr<transport::DatagramTransport> t) {
  if (device.type == DeviceType::Blaster)
    return AnySession(std::in_place_type<BlasterSession>, device, cfg, std::move(t));
  return AnySession(std::in_place_type<SocketSession>, device, cfg, std::move(t));
}

} // namespace orvibo
