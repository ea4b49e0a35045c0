#include "orvibo/packets.hpp"   // builders, parsers, layout constants

#include <algorithm>   // std::equal
#include <cstring>     // std::memcmp for the model marker

namespace orvibo {
// ============================================================================
// Low-level helpers
// ============================================================================
// Almost every request starts with "mac + six spaces"; keep that in one place.

static constexpr uint8_t PAD = 0x20;

static inline void add_bytes(std::vector<uint8_t>& b, const uint8_t* p, size_t n) {
  b.insert(b.end(), p, p + n);
}

static inline void add_mac(std::vector<uint8_t>& b, const MacAddress& mac) {
  add_bytes(b, mac.data(), mac.size());
}

static inline void add_pad6(std::vector<uint8_t>& b) {
  b.insert(b.end(), 6, PAD);
}

static inline std::vector<uint8_t> keyed_payload(const MacAddress& mac) {
  std::vector<uint8_t> p;
  p.reserve(32);
  add_mac(p, mac);
  add_pad6(p);
  return p;
}

// Fixed-size requests never exceed FRAME_MAX, so encode() cannot fail here.
static inline std::vector<uint8_t> seal(Command cmd, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  encode(cmd, payload, out);
  return out;
}

// Payload must open with the session's MAC; replies for another device are not ours.
static inline bool keyed_to(const Frame& f, const MacAddress& mac) {
  return f.payload.size() >= mac.size()
      && std::equal(mac.begin(), mac.end(), f.payload.begin());
}

// ============================================================================
// Builders
// ============================================================================

std::vector<uint8_t> make_discover() {
  return seal(Command::Discover, {});
}

std::vector<uint8_t> make_subscribe(const MacAddress& mac) {
  auto p = keyed_payload(mac);
  MacAddress rev = reversed(mac);
  add_mac(p, rev);
  add_pad6(p);
  return seal(Command::Subscribe, p);
}

// The firmware has no separate read verb; the subscribe reply carries the state.
std::vector<uint8_t> make_query_state(const MacAddress& mac) {
  return make_subscribe(mac);
}

std::vector<uint8_t> make_set_state(const MacAddress& mac, bool on) {
  auto p = keyed_payload(mac);
  p.insert(p.end(), 4, 0x00);
  p.push_back(on ? 0x01 : 0x00);
  return seal(Command::SetState, p);
}

std::vector<uint8_t> make_enter_learn(const MacAddress& mac) {
  auto p = keyed_payload(mac);
  p.push_back(0x01);
  p.push_back(0x00);
  p.insert(p.end(), 4, 0x00);
  return seal(Command::EnterLearnMode, p);
}

std::vector<uint8_t> make_unsubscribe(const MacAddress& mac) {
  return seal(Command::Unsubscribe, keyed_payload(mac));
}

Status make_emit(const MacAddress& mac, const std::vector<uint8_t>& signal,
                 uint16_t seq, std::vector<uint8_t>& out) {
  out.clear();
  if (signal.empty())            return Status::EmptySignal;
  if (signal.size() > SIGNAL_MAX) return Status::PayloadTooLarge;

  auto p = keyed_payload(mac);
  static const uint8_t EMIT_TAG[4] = { 0x65, 0x00, 0x00, 0x00 };
  add_bytes(p, EMIT_TAG, sizeof(EMIT_TAG));
  p.push_back(static_cast<uint8_t>(seq >> 8));
  p.push_back(static_cast<uint8_t>(seq & 0xFF));
  add_bytes(p, signal.data(), signal.size());
  return encode(Command::EmitSignal, p, out);
}

// ============================================================================
// Parsers
// ============================================================================

Status parse_discover_reply(const Frame& frame, MacAddress& mac, DeviceType& type) {
  if (!frame.is(Command::DiscoverResponse)) return Status::UnexpectedResponse;
  if (frame.payload.size() < DISCOVER_MARKER_OFFSET + 3) return Status::MalformedFrame;

  const uint8_t* marker = frame.payload.data() + DISCOVER_MARKER_OFFSET;
  DeviceType t;
  if      (std::memcmp(marker, "SOC", 3) == 0) t = DeviceType::Socket;
  else if (std::memcmp(marker, "IRD", 3) == 0) t = DeviceType::Blaster;
  else return Status::UnknownDeviceType;

  std::copy(frame.payload.begin() + 1, frame.payload.begin() + 7, mac.begin());
  type = t;
  return Status::Ok;
}

Status parse_subscribe_ack(const Frame& frame, const MacAddress& mac, SocketState& state) {
  if (!frame.is(Command::SubscribeAck)) return Status::UnexpectedResponse;
  if (frame.payload.size() < mac.size() + 7) return Status::MalformedFrame;
  if (!keyed_to(frame, mac)) return Status::UnexpectedResponse;
  state.on = frame.payload.back() != 0x00;
  return Status::Ok;
}

Status parse_set_state_ack(const Frame& frame, const MacAddress& mac) {
  if (!frame.is(Command::SetStateAck)) return Status::UnexpectedResponse;
  if (frame.payload.size() < mac.size()) return Status::MalformedFrame;
  if (!keyed_to(frame, mac)) return Status::UnexpectedResponse;
  return Status::Ok;
}

Status parse_learn_frame(const Frame& frame, const MacAddress& mac,
                         bool& captured, std::vector<uint8_t>& out) {
  if (!frame.is(Command::SignalCaptured)) return Status::UnexpectedResponse;
  if (frame.payload.size() < LEARN_PREFIX_LEN) return Status::MalformedFrame;
  if (!keyed_to(frame, mac)) return Status::UnexpectedResponse;

  captured = frame.payload.size() > LEARN_PREFIX_LEN;
  out.assign(frame.payload.begin() + LEARN_PREFIX_LEN, frame.payload.end());
  return Status::Ok;
}

} // namespace orvibo
