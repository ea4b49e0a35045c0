#pragma once
/**
 * @file transport_udp.hpp
 * @brief POSIX UDP implementation of DatagramTransport (socket, bind, sendto, poll + recvfrom).
 *
 * @details
 * - SO_REUSEADDR is always set so a CLI run can bind the vendor port while a
 *   previous run's socket lingers; SO_BROADCAST only when asked for.
 * - receive() polls with the caller's timeout and resumes after EINTR with
 *   whatever time is left, so a stray signal never shortens a learn window.
 * - Datagrams larger than FRAME_MAX are truncated by the kernel; the codec then
 *   reports them as TruncatedFrame/MalformedFrame.
 * - Linux first. Anything with BSD sockets and poll(2) should work unchanged.
 */

#include "orvibo/transport/transport_base.hpp"

#include <string>

namespace orvibo::transport {

class UdpTransport : public DatagramTransport {
public:
  UdpTransport() = default;
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  Status   open(const std::string& bind_address, uint16_t port, bool broadcast) override;
  Status   send_to(const std::vector<uint8_t>& bytes, const Endpoint& dest) override;
  Status   receive(int timeout_ms, Datagram& out) override;
  void     close() override;
  bool     is_open() const override { return fd_ >= 0; }
  uint16_t local_port() const override { return local_port_; }
  const char* name() const override { return "udp"; }

  /// errno text of the last failure, empty if none.
  const std::string& last_error() const { return last_error_; }

private:
  int         fd_ = -1;
  uint16_t    local_port_ = 0;
  std::string last_error_;
};

} // namespace orvibo::transport
