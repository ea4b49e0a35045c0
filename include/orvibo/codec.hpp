/**
 * @page orvibo-codec Orvibo Frame Codec
 * @file codec.hpp
 * @brief Fixed-header binary frames shared by every Orvibo command.
 *
 * @details
 * Every datagram exchanged with an S20 socket or an AllOne blaster carries
 * exactly one frame. The header is six bytes, big-endian, no checksum:
 *
 * | Offset | Bytes | Field    | Notes                                            |
 * |--------|-------|----------|--------------------------------------------------|
 * | 0      | 2     | magic    | always 0x68 0x64 ("hd")                          |
 * | 2      | 2     | length   | whole datagram length, header included           |
 * | 4      | 2     | command  | two ASCII letters, e.g. 0x71 0x61 ("qa")         |
 * | 6      | n     | payload  | command specific, see packets.hpp                |
 *
 * The length field counts the magic and itself plus the body (command + payload),
 * so `length == 4 + 2 + payload.size()`, which is also the datagram size. A bare
 * discovery request is therefore `68 64 00 06 71 61`.
 *
 * ### Decode rules
 * - fewer than 2 bytes, or the magic matched but fewer than 6 bytes: TruncatedFrame
 * - first two bytes are not the magic: MalformedFrame, whatever follows
 * - declared length larger than what arrived: TruncatedFrame
 * - declared length shorter than the header or than what arrived: MalformedFrame
 * - unknown command codes are NOT an error; the raw code is handed back
 *
 * ### Capacity
 * Frames are bounded by FRAME_MAX, which is also the transport receive buffer.
 * The payload lives in a fixed-capacity etl::vector so decoding never touches
 * the heap and an oversized frame is refused instead of reallocated.
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   orvibo::encode(orvibo::Command::Discover, {}, wire);   // 68 64 00 06 71 61
 *
 *   orvibo::Frame f;
 *   if (orvibo::decode(wire, f) == orvibo::Status::Ok && f.is(orvibo::Command::DiscoverResponse)) {
 *     // ...
 *   }
 * @endcode
 */

#ifndef ORVIBO_CODEC_HPP
#define ORVIBO_CODEC_HPP

#include "etl/vector.h"
#include "orvibo/status.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace orvibo {

static constexpr uint8_t MAGIC_HI    = 0x68;          ///< 'h'
static constexpr uint8_t MAGIC_LO    = 0x64;          ///< 'd'
static constexpr size_t  HEADER_LEN  = 6;             ///< magic + length + command
static constexpr size_t  FRAME_MAX   = 2048;          ///< largest datagram we build or accept
static constexpr size_t  PAYLOAD_MAX = FRAME_MAX - HEADER_LEN;

/**
 * @brief Command codes as they appear at offset 4 of every frame.
 *
 * The firmware answers a request with a frame carrying the same two letters,
 * so request/response pairs share a value. QueryState rides on the subscribe
 * exchange: the subscribe acknowledgement ends with the socket power byte.
 */
enum class Command : uint16_t {
  Discover           = 0x7161,  ///< "qa"
  DiscoverResponse   = 0x7161,
  Subscribe          = 0x636c,  ///< "cl"
  SubscribeAck       = 0x636c,
  QueryState         = 0x636c,
  QueryStateResponse = 0x636c,
  SetState           = 0x6463,  ///< "dc"
  SetStateAck        = 0x6463,
  StateChanged       = 0x7366,  ///< "sf", pushed by a socket when its relay flips
  EnterLearnMode     = 0x6c73,  ///< "ls"
  SignalCaptured     = 0x6c73,
  EmitSignal         = 0x6963,  ///< "ic"
  Unsubscribe        = 0x636e   ///< "cn"
};

constexpr uint16_t code(Command c) { return static_cast<uint16_t>(c); }

/// Short readable name for a raw command code ("discover", "learn", ... or "0x1234").
std::string command_name(uint16_t command);

using Payload = etl::vector<uint8_t, PAYLOAD_MAX>;

/**
 * @struct Frame
 * @brief One decoded datagram. The length field is derived, never stored.
 */
struct Frame {
  uint16_t command = 0;   ///< raw code; compare with is()
  Payload  payload;       ///< bytes after the command code

  bool   is(Command c) const { return command == code(c); }
  size_t wire_length() const { return HEADER_LEN + payload.size(); }
};

/**
 * @brief Build one frame into @p out (cleared first).
 * @return Ok, or PayloadTooLarge when HEADER_LEN + len exceeds FRAME_MAX.
 */
Status encode(uint16_t command, const uint8_t* payload, size_t len, std::vector<uint8_t>& out);

inline Status encode(Command command, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out) {
  return encode(code(command), payload.data(), payload.size(), out);
}

inline Status encode(const Frame& frame, std::vector<uint8_t>& out) {
  return encode(frame.command, frame.payload.data(), frame.payload.size(), out);
}

/**
 * @brief Parse one datagram. See the decode rules above.
 * @param data  datagram bytes
 * @param len   number of bytes received
 * @param out   receives command and payload on Ok; untouched otherwise
 */
Status decode(const uint8_t* data, size_t len, Frame& out);

inline Status decode(const std::vector<uint8_t>& bytes, Frame& out) {
  return decode(bytes.data(), bytes.size(), out);
}

/// Lowercase hex, no separators.
std::string to_hex(const uint8_t* data, size_t len);

/**
 * @brief Debug rendering of a datagram with the well-known groups labelled.
 *
 * Example: `[MAGIC] [LEN=6] [CMD=discover]` or
 * `[MAGIC] [LEN=30] [CMD=subscribe] accf238d1d2e [SPACES_6] 2e1d8d23cfac [SPACES_6]`.
 * Works on garbage too; whatever does not parse is dumped as plain hex.
 */
std::string describe(const uint8_t* data, size_t len);

inline std::string describe(const std::vector<uint8_t>& bytes) {
  return describe(bytes.data(), bytes.size());
}

} // namespace orvibo

#endif // ORVIBO_CODEC_HPP
