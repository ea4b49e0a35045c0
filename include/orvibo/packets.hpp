/**
 * @page orvibo-packets Orvibo Request Builders and Reply Parsers
 * @file packets.hpp
 * @brief Command payload layouts, the inside of every frame codec.hpp wraps.
 *
 * @details
 * PURPOSE
 * -------
 * codec.hpp knows about magic, length and command code. This layer knows what
 * each command carries. Builders return complete, ready-to-send datagrams;
 * parsers take a decoded Frame and pull out the one or two facts a session
 * needs (MAC, device kind, power byte, learned signal).
 *
 * PAYLOAD LAYOUTS (offsets relative to the payload, i.e. datagram offset - 6)
 * --------------------------------------------------------------------------
 *   discover      : (empty)
 *   discover reply: [0]=0x00 [1..6]=mac [7..12]=6x0x20 [13..18]=mac reversed
 *                   [19..24]=6x0x20 [25..30]=model marker "SOC..."/"IRD..." [31..]=device clock
 *   subscribe     : mac, 6x0x20, mac reversed, 6x0x20
 *   subscribe ack : mac, 6x0x20, 5 bytes, power byte (last)
 *   control       : mac, 6x0x20, 00 00 00 00, power byte
 *   control ack   : mac, 6x0x20, ...
 *   learn         : mac, 6x0x20, 01 00, 00 00 00 00
 *   learn ack     : mac, 6x0x20, 6 bytes (nothing after)
 *   learned signal: mac, 6x0x20, 6 bytes, signal bytes...
 *   emit          : mac, 6x0x20, 65 00 00 00, seq hi, seq lo, signal bytes...
 *   unsubscribe   : mac, 6x0x20
 *
 * The learn acknowledgement and the learned signal share the "ls" code; the
 * only difference is whether bytes follow the 18-byte prefix.
 *
 * MAINTENANCE
 * -----------
 * Offsets are part of the vendor wire contract and pinned by tests against
 * captured datagrams. Keep builders explicit, one per request.
 */

#ifndef ORVIBO_PACKETS_HPP
#define ORVIBO_PACKETS_HPP

#include "orvibo/codec.hpp"
#include "orvibo/device.hpp"
#include "orvibo/status.hpp"

#include <cstdint>
#include <vector>

namespace orvibo {

/// Default UDP port for discovery and every command.
static constexpr uint16_t DEFAULT_PORT = 10000;

/// Offset of the model marker inside a discovery reply payload.
static constexpr size_t DISCOVER_MARKER_OFFSET = 25;

/// Bytes before the signal in a learn frame: mac + padding + 6 status bytes.
static constexpr size_t LEARN_PREFIX_LEN = 18;

/// Bytes before the signal in an emit frame: mac + padding + 4 + 2-byte sequence.
static constexpr size_t EMIT_PREFIX_LEN = 18;

/// Largest signal that still fits one emit frame.
static constexpr size_t SIGNAL_MAX = PAYLOAD_MAX - EMIT_PREFIX_LEN;

// ------------------------------ builders ------------------------------

std::vector<uint8_t> make_discover();
std::vector<uint8_t> make_subscribe(const MacAddress& mac);
std::vector<uint8_t> make_query_state(const MacAddress& mac);
std::vector<uint8_t> make_set_state(const MacAddress& mac, bool on);
std::vector<uint8_t> make_enter_learn(const MacAddress& mac);
std::vector<uint8_t> make_unsubscribe(const MacAddress& mac);

/**
 * @brief Emit request carrying @p signal verbatim.
 * @param seq   two bytes the firmware uses to tell repeated emits apart
 * @return Ok, EmptySignal for a zero-length signal, PayloadTooLarge above SIGNAL_MAX.
 */
Status make_emit(const MacAddress& mac, const std::vector<uint8_t>& signal,
                 uint16_t seq, std::vector<uint8_t>& out);

// ------------------------------ parsers -------------------------------
// All parsers return UnexpectedResponse when the command code is not the one
// they handle, MalformedFrame when the payload is too short for its layout.

/**
 * @brief Classify a discovery reply.
 * @return Ok, UnexpectedResponse, MalformedFrame, or UnknownDeviceType when the
 *         marker is neither "SOC" nor "IRD" (the record must then be dropped).
 */
Status parse_discover_reply(const Frame& frame, MacAddress& mac, DeviceType& type);

/// Subscribe/query reply from @p mac; @p state receives the trailing power byte.
Status parse_subscribe_ack(const Frame& frame, const MacAddress& mac, SocketState& state);

/// Control acknowledgement from @p mac.
Status parse_set_state_ack(const Frame& frame, const MacAddress& mac);

/**
 * @brief Inspect an "ls" frame from @p mac.
 * @param captured  false for the learn-mode acknowledgement (no signal bytes)
 * @param out       receives the signal bytes when @p captured is true
 */
Status parse_learn_frame(const Frame& frame, const MacAddress& mac,
                         bool& captured, std::vector<uint8_t>& out);

} // namespace orvibo

#endif // ORVIBO_PACKETS_HPP
