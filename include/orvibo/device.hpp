#pragma once
/**
 * @file device.hpp
 * @brief Plain records passed between discovery, sessions and callers.
 *
 * @details
 * A DeviceRecord is what discovery hands out: the device kind decided once from
 * the reply marker, the address it answered from, and its MAC. The MAC is the
 * identity (IPs move with DHCP) and is treated as six opaque bytes that the
 * firmware wants echoed back inside most requests.
 *
 * SocketState and SignalCapture are the results of session commands. Neither is
 * ever synthesized locally: a state comes from a reply, a capture from a learn
 * cycle (or verbatim from a file the caller wrote earlier).
 */

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace orvibo {

enum class DeviceType : uint8_t {
  Socket  = 0,   ///< S20 WiFi power socket ("SOC" marker)
  Blaster = 1    ///< AllOne IR / 433MHz blaster ("IRD" marker)
};

using MacAddress = std::array<uint8_t, 6>;

struct DeviceRecord {
  DeviceType  type = DeviceType::Socket;
  std::string ip;          ///< dotted IPv4 the reply came from
  MacAddress  mac{};       ///< identity; wire order as the device reports it

  bool operator==(const DeviceRecord& o) const {
    return type == o.type && ip == o.ip && mac == o.mac;
  }
  bool operator!=(const DeviceRecord& o) const { return !(*this == o); }
};

struct SocketState {
  bool on = false;
};

enum class SignalKind : uint8_t { IR = 0, RF433 = 1 };

/**
 * @struct SignalCapture
 * @brief Raw learned signal. Opaque: replayed byte for byte by emit_signal().
 */
struct SignalCapture {
  std::vector<uint8_t> raw;
  SignalKind kind = SignalKind::IR;
};

/// "socket" / "blaster"
const char* device_type_name(DeviceType t);
bool parse_device_type(const std::string& text, DeviceType& out);

/// "ir" / "rf433"
const char* signal_kind_name(SignalKind k);

/// "ac:cf:23:8d:1d:2e"
std::string mac_to_string(const MacAddress& mac);

/// Accepts "accf238d1d2e" or colon/dash separated pairs. False on anything else.
bool parse_mac(const std::string& text, MacAddress& out);

/// MAC with its byte order reversed, as the subscribe request wants it.
MacAddress reversed(const MacAddress& mac);

/// One-line human summary: "type=socket ip=192.168.1.45 mac=ac:df:23:8d:1d:2e".
std::string describe(const DeviceRecord& rec);

} // namespace orvibo
