// ============================================================================
// device.cpp — implementation for device.hpp
// ============================================================================

#include "orvibo/device.hpp"

#include <algorithm>
#include <cctype>

namespace orvibo {

const char* device_type_name(DeviceType t) {
  switch (t) {
    case DeviceType::Socket:  return "socket";
    case DeviceType::Blaster: return "blaster";
  }
  return "unknown";
}

bool parse_device_type(const std::string& text, DeviceType& out) {
  if (text == "socket")  { out = DeviceType::Socket;  return true; }
  if (text == "blaster") { out = DeviceType::Blaster; return true; }
  return false;
}

const char* signal_kind_name(SignalKind k) {
  return k == SignalKind::RF433 ? "rf433" : "ir";
}

std::string mac_to_string(const MacAddress& mac) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(17);
  for (size_t i = 0; i < mac.size(); ++i) {
    if (i) s.push_back(':');
    s.push_back(HEX[mac[i] >> 4]);
    s.push_back(HEX[mac[i] & 0x0F]);
  }
  return s;
}

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

// Separators are skipped only between byte pairs, so "a:ccf..." is rejected.
bool parse_mac(const std::string& text, MacAddress& out) {
  MacAddress tmp{};
  size_t byte = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (byte == tmp.size()) return false;            // trailing junk
    if (i + 1 >= text.size()) return false;          // odd nibble count
    int hi = hex_val(text[i]);
    int lo = hex_val(text[i + 1]);
    if (hi < 0 || lo < 0) return false;
    tmp[byte++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
    if (i < text.size() && byte < tmp.size() && (text[i] == ':' || text[i] == '-')) ++i;
  }
  if (byte != tmp.size()) return false;
  out = tmp;
  return true;
}

MacAddress reversed(const MacAddress& mac) {
  MacAddress r = mac;
  std::reverse(r.begin(), r.end());
  return r;
}

std::string describe(const DeviceRecord& rec) {
  return std::string("type=") + device_type_name(rec.type)
       + " ip=" + rec.ip
       + " mac=" + mac_to_string(rec.mac);
}

} // namespace orvibo
