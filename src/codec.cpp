// ============================================================================
// codec.cpp — implementation for codec.hpp
// For the wire layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "orvibo/codec.hpp"

#include <cstdio>   // snprintf for command_name fallbacks

namespace orvibo {

// ---------------------------------------------------------------------------
// Big-endian helpers. The length and command fields are both network order.
// ---------------------------------------------------------------------------
static inline uint16_t read_be16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static inline void push_be16(std::vector<uint8_t>& b, uint16_t v) {
  b.push_back(static_cast<uint8_t>(v >> 8));
  b.push_back(static_cast<uint8_t>(v & 0xFF));
}

std::string command_name(uint16_t command) {
  switch (command) {
    case code(Command::Discover):       return "discover";
    case code(Command::Subscribe):      return "subscribe";
    case code(Command::SetState):       return "control";
    case code(Command::StateChanged):   return "state_changed";
    case code(Command::EnterLearnMode): return "learn";
    case code(Command::EmitSignal):     return "emit";
    case code(Command::Unsubscribe):    return "unsubscribe";
    default: break;
  }
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%04x", static_cast<unsigned>(command));
  return buf;
}

// ---------------------------------------------------------------------------
// encode()
// --------
// [magic][length][command][payload...]; length is filled once the total size
// is known so it can never disagree with what goes on the wire.
// ---------------------------------------------------------------------------
Status encode(uint16_t command, const uint8_t* payload, size_t len, std::vector<uint8_t>& out) {
  out.clear();
  if (len > PAYLOAD_MAX) return Status::PayloadTooLarge;

  const size_t total = HEADER_LEN + len;
  out.reserve(total);
  out.push_back(MAGIC_HI);
  out.push_back(MAGIC_LO);
  push_be16(out, static_cast<uint16_t>(total));
  push_be16(out, command);
  if (len) out.insert(out.end(), payload, payload + len);
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Order matters: the magic check comes first so a foreign datagram is always
// MalformedFrame, then the size checks decide between truncated and bogus.
// ---------------------------------------------------------------------------
Status decode(const uint8_t* data, size_t len, Frame& out) {
  if (data == nullptr || len < 2) return Status::TruncatedFrame;
  if (data[0] != MAGIC_HI || data[1] != MAGIC_LO) return Status::MalformedFrame;
  if (len < HEADER_LEN) return Status::TruncatedFrame;

  const size_t declared = read_be16(data + 2);
  if (declared < HEADER_LEN) return Status::MalformedFrame;
  if (declared > len)        return Status::TruncatedFrame;
  if (declared < len)        return Status::MalformedFrame;   // trailing bytes
  if (declared > FRAME_MAX)  return Status::PayloadTooLarge;

  out.command = read_be16(data + 4);
  out.payload.assign(data + HEADER_LEN, data + declared);
  return Status::Ok;
}

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    s.push_back(HEX[data[i] >> 4]);
    s.push_back(HEX[data[i] & 0x0F]);
  }
  return s;
}

// ---------------------------------------------------------------------------
// describe()
// ----------
// Header fields are labelled when present; inside the payload, each run of
// six ASCII spaces (the firmware's field padding) is shown as [SPACES_6].
// ---------------------------------------------------------------------------
std::string describe(const uint8_t* data, size_t len) {
  if (data == nullptr || len == 0) return "(empty)";
  if (len < HEADER_LEN || data[0] != MAGIC_HI || data[1] != MAGIC_LO)
    return to_hex(data, len);

  std::string s = "[MAGIC] [LEN=" + std::to_string(read_be16(data + 2)) + "] [CMD="
                + command_name(read_be16(data + 4)) + "]";

  size_t i = HEADER_LEN;
  size_t run_start = i;
  while (i < len) {
    bool spaces = (i + 6 <= len);
    for (size_t k = 0; spaces && k < 6; ++k) spaces = (data[i + k] == 0x20);
    if (spaces) {
      if (i > run_start) s += " " + to_hex(data + run_start, i - run_start);
      s += " [SPACES_6]";
      i += 6;
      run_start = i;
    } else {
      ++i;
    }
  }
  if (len > run_start) s += " " + to_hex(data + run_start, len - run_start);
  return s;
}

} // namespace orvibo
