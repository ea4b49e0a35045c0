// ============================================================================
// discovery.cpp — implementation for discovery.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "orvibo/discovery.hpp"
#include "orvibo/codec.hpp"                      // decode(), describe()
#include "orvibo/log.hpp"
#include "orvibo/packets.hpp"                    // make_discover(), parse_discover_reply()
#include "orvibo/transport/transport_udp.hpp"

#include <algorithm>
#include <chrono>
#include <set>

namespace orvibo {

using clock_type = std::chrono::steady_clock;

static int ms_left(clock_type::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

/*
 * classify()
 * ----------
 * Datagram -> record, or false for noise. Only logs; never fails the caller.
 */
static bool classify(const transport::Datagram& d, DeviceRecord& rec) {
  Frame f;
  Status st = decode(d.bytes, f);
  if (st != Status::Ok) {
    log::debug("discovery", "drop from=" + d.from.ip + " reason=" + status_name(st));
    return false;
  }

  MacAddress mac{};
  DeviceType type = DeviceType::Socket;
  st = parse_discover_reply(f, mac, type);
  if (st != Status::Ok) {
    log::debug("discovery", "drop from=" + d.from.ip + " reason=" + status_name(st)
                          + " frame=" + describe(d.bytes));
    return false;
  }

  rec.type = type;
  rec.ip   = d.from.ip;
  rec.mac  = mac;
  return true;
}

static Status ensure_open(transport::DatagramTransport& t, const Config& cfg) {
  if (t.is_open()) return Status::Ok;
  return t.open(cfg.bind_address, cfg.discovery_bind_port, true);
}

Status discover_all(transport::DatagramTransport& t, const Config& cfg,
                    int timeout_ms, int max_wait_ms, DeviceMap& out) {
  out.clear();

  Status st = ensure_open(t, cfg);
  if (st != Status::Ok) return st;

  const auto deadline = clock_type::now() + std::chrono::milliseconds(max_wait_ms);
  log::debug("discovery", "broadcast to " + cfg.broadcast_address + ":" + std::to_string(cfg.port));

  st = t.send_to(make_discover(), {cfg.broadcast_address, cfg.port});
  if (st != Status::Ok) return st;

  std::set<MacAddress> seen;
  for (int left = ms_left(deadline); left > 0; left = ms_left(deadline)) {
    transport::Datagram d;
    st = t.receive(std::max(1, std::min(timeout_ms, left)), d);   // 0 would spin
    if (st == Status::Timeout) continue;     // quiet stretch, keep listening until max_wait
    if (st != Status::Ok) return st;

    DeviceRecord rec;
    if (!classify(d, rec)) continue;
    if (!seen.insert(rec.mac).second) continue;          // first reply per MAC wins
    if (!out.emplace(rec.ip, rec).second) {
      log::warn("discovery", "ip " + rec.ip + " answered with a second mac " + mac_to_string(rec.mac));
      continue;
    }
    log::info("discovery", "found " + describe(rec));
  }

  log::debug("discovery", "done devices=" + std::to_string(out.size()));
  return Status::Ok;
}

Status discover_one(transport::DatagramTransport& t, const Config& cfg,
                    const std::string& target_ip, int timeout_ms, DeviceRecord& out) {
  Status st = ensure_open(t, cfg);
  if (st != Status::Ok) return st;

  const auto deadline = clock_type::now() + std::chrono::milliseconds(timeout_ms);
  st = t.send_to(make_discover(), {target_ip, cfg.port});
  if (st != Status::Ok) return st;

  for (int left = ms_left(deadline); left > 0; left = ms_left(deadline)) {
    transport::Datagram d;
    st = t.receive(left, d);
    if (st == Status::Timeout) break;
    if (st != Status::Ok) return st;
    if (d.from.ip != target_ip) continue;

    DeviceRecord rec;
    if (!classify(d, rec)) continue;
    out = rec;
    log::info("discovery", "found " + describe(rec));
    return Status::Ok;
  }

  log::warn("discovery", "device not found ip=" + target_ip);
  return Status::DeviceNotFound;
}

Status discover_all(const Config& cfg, DeviceMap& out) {
  transport::UdpTransport t;
  return discover_all(t, cfg, cfg.discovery_timeout_ms, cfg.discovery_max_wait_ms, out);
}

Status discover_one(const Config& cfg, const std::string& target_ip, DeviceRecord& out) {
  transport::UdpTransport t;
  return discover_one(t, cfg, target_ip, cfg.response_timeout_ms, out);
}

} // namespace orvibo
