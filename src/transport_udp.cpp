// ============================================================================
// transport_udp.cpp — implementation for transport/transport_udp.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "orvibo/transport/transport_udp.hpp"
#include "orvibo/codec.hpp"   // FRAME_MAX sizes the receive buffer
#include "orvibo/log.hpp"

#include <arpa/inet.h>    // inet_pton, inet_ntop, htons
#include <netinet/in.h>   // sockaddr_in
#include <poll.h>         // poll(2) for the timed receive
#include <sys/socket.h>   // socket, bind, sendto, recvfrom
#include <unistd.h>       // ::close

#include <cerrno>
#include <chrono>
#include <cstring>        // strerror

namespace orvibo::transport {

// ---------------------------------------------------------------------------
// make_addr()
// -----------
// "" and "0.0.0.0" mean INADDR_ANY. Returns false for anything inet_pton
// refuses so a typo in the config is a BindError, not a silent wildcard bind.
// ---------------------------------------------------------------------------
static bool make_addr(const std::string& ip, uint16_t port, sockaddr_in& addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  if (ip.empty() || ip == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  return inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

UdpTransport::~UdpTransport() {
  close();
}

Status UdpTransport::open(const std::string& bind_address, uint16_t port, bool broadcast) {
  if (fd_ >= 0) return Status::Ok;
  last_error_.clear();

  sockaddr_in addr;
  if (!make_addr(bind_address, port, addr)) {
    last_error_ = "invalid bind address " + bind_address;
    log::error("transport", last_error_);
    return Status::BindError;
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = std::string("socket() failed: ") + std::strerror(errno);
    log::error("transport", last_error_);
    return Status::BindError;
  }

  int one = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
    log::warn("transport", std::string("setsockopt(SO_REUSEADDR) failed: ") + std::strerror(errno));
  }
  if (broadcast && ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0) {
    last_error_ = std::string("setsockopt(SO_BROADCAST) failed: ") + std::strerror(errno);
    log::error("transport", last_error_);
    close();
    return Status::BindError;
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    last_error_ = "bind(" + bind_address + ":" + std::to_string(port) + ") failed: " + std::strerror(errno);
    log::error("transport", last_error_);
    close();
    return Status::BindError;
  }

  // Ask the kernel which port we actually got (matters for port 0).
  sockaddr_in bound{};
  socklen_t blen = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
    local_port_ = ntohs(bound.sin_port);
  else
    local_port_ = port;

  log::debug("transport", "bound " + (bind_address.empty() ? std::string("0.0.0.0") : bind_address)
                        + ":" + std::to_string(local_port_) + (broadcast ? " broadcast" : ""));
  return Status::Ok;
}

Status UdpTransport::send_to(const std::vector<uint8_t>& bytes, const Endpoint& dest) {
  if (fd_ < 0) return Status::NotOpen;

  sockaddr_in addr;
  if (!make_addr(dest.ip, dest.port, addr)) {
    last_error_ = "invalid destination " + dest.ip;
    log::error("transport", last_error_);
    return Status::SendError;
  }

  ssize_t n = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                       reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (n < 0) {
    last_error_ = std::string("sendto() failed: ") + std::strerror(errno);
    log::error("transport", last_error_ + " dest=" + dest.ip);
    return Status::SendError;
  }
  if (static_cast<size_t>(n) != bytes.size()) {
    last_error_ = "short datagram write";
    log::error("transport", last_error_ + " dest=" + dest.ip);
    return Status::SendError;
  }
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// receive()
// ---------
// One datagram or Timeout. The deadline is fixed up front; an interrupted
// poll() waits only for what is left of it.
// ---------------------------------------------------------------------------
Status UdpTransport::receive(int timeout_ms, Datagram& out) {
  if (fd_ < 0) return Status::NotOpen;
  if (timeout_ms < 0) timeout_ms = 0;

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
  pollfd pfd{fd_, POLLIN, 0};

  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left < 0) left = 0;

    int pr = ::poll(&pfd, 1, static_cast<int>(left));
    if (pr == 0) return Status::Timeout;
    if (pr < 0) {
      if (errno == EINTR) continue;
      last_error_ = std::string("poll() failed: ") + std::strerror(errno);
      log::error("transport", last_error_);
      return Status::ReceiveError;
    }
    if (!(pfd.revents & POLLIN)) {
      last_error_ = "poll() reported error condition";
      log::error("transport", last_error_);
      return Status::ReceiveError;
    }

    uint8_t buf[FRAME_MAX];
    sockaddr_in src{};
    socklen_t slen = sizeof(src);
    ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&src), &slen);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      last_error_ = std::string("recvfrom() failed: ") + std::strerror(errno);
      log::error("transport", last_error_);
      return Status::ReceiveError;
    }

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
    out.bytes.assign(buf, buf + n);
    out.from.ip   = ip;
    out.from.port = ntohs(src.sin_port);
    return Status::Ok;
  }
}

void UdpTransport::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  local_port_ = 0;
}

} // namespace orvibo::transport
