#pragma once
/**
 * @file transport_base.hpp
 * @brief Datagram transport interface the protocol layers are written against.
 *
 * Header-only. Discovery and sessions never touch a socket directly; they talk
 * to this interface so tests can swap in a scripted fake and the UDP code stays
 * in one file.
 */

#include "orvibo/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace orvibo::transport {

struct Endpoint {
  std::string ip;        ///< dotted IPv4
  uint16_t    port = 0;

  bool operator==(const Endpoint& o) const { return ip == o.ip && port == o.port; }
};

struct Datagram {
  std::vector<uint8_t> bytes;
  Endpoint from;
};

/**
 * @brief Transport trait every implementation provides.
 *
 * Contract:
 *  - open(addr, port, broadcast) binds a local endpoint (port 0 = ephemeral).
 *    BindError when the address is unavailable. Idempotent when already open.
 *  - send_to(bytes, dest) writes exactly one datagram. SendError on OS failure,
 *    never retried here.
 *  - receive(timeout_ms, out) blocks up to timeout_ms for the next datagram.
 *    Timeout when the window closes empty; that is the normal way an offline
 *    device shows up, not an exceptional failure.
 *  - close() releases the endpoint; idempotent.
 *  - One owner at a time; not safe for concurrent use from two threads.
 */
class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;
  virtual Status   open(const std::string& bind_address, uint16_t port, bool broadcast) = 0;
  virtual Status   send_to(const std::vector<uint8_t>& bytes, const Endpoint& dest) = 0;
  virtual Status   receive(int timeout_ms, Datagram& out) = 0;
  virtual void     close() = 0;
  virtual bool     is_open() const = 0;
  virtual uint16_t local_port() const = 0;
  virtual const char* name() const = 0;
};

} // namespace orvibo::transport
