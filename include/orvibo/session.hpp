#pragma once
/**
 * @page orvibo-session Orvibo Device Session
 * @file session.hpp
 * @brief Per-device command sequencing: subscribe, query/toggle a socket, learn/emit on a blaster.
 *
 * @details
 * ## Field Brief
 * A session is one conversation with one device. It owns a transport binding
 * (its own ephemeral UDP port) and the DeviceRecord discovery produced, and it
 * runs every command as a blocking send-then-receive round trip on the
 * caller's thread. One frame in flight, no retries, no background listeners.
 * When something goes wrong the Status comes straight back to the caller, who
 * decides whether to resend.
 *
 * ---
 *
 * @par State machine
 * ```
 *   Closed --open()--> Open --subscribe()--> Subscribed
 *     ^                 |                       |
 *     +----close()------+-------close()---------+   (close sends a best-effort unsubscribe)
 * ```
 *
 * @par Two kinds, two classes
 * Discovery decides the device kind once. The capability methods only exist on
 * the matching class: `SocketSession` has query_state()/set_state(),
 * `BlasterSession` has learn_signal()/emit_signal(). make_session() picks the
 * class from the record. Building a session class for the wrong kind by hand
 * is caught at open() with UnsupportedOperation.
 *
 * @par Single subscriber (firmware limit, not a client bug)
 * A device holds one subscription at a time. If a second session subscribes
 * while the first is still open, the device drops out of later discovery
 * replies until the first session unsubscribes (close()) or the device-side
 * keep-alive runs out. Close sessions promptly; do not pool them.
 *
 * @par Pacing
 * The firmware ignores subscribe frames that follow each other within about
 * 100 ms. Subscribe and query exchanges are spaced by
 * Config::subscribe_interval_ms; the session sleeps if needed.
 *
 * @par What arrives while waiting
 * Datagrams from other hosts are ignored. A socket pushes an unsolicited
 * state-changed frame ("sf") whenever its relay flips; those are skipped. A
 * datagram from the device that does not decode is returned as the codec error.
 *
 * ---
 *
 * @par Minimal usage
 * @code
 *   orvibo::Config cfg;
 *   orvibo::DeviceRecord rec;
 *   orvibo::discover_one(cfg, "192.168.1.37", rec);
 *
 *   orvibo::BlasterSession s(rec, cfg);
 *   s.open();
 *   if (s.subscribe() == orvibo::Status::Ok) {
 *     std::optional<orvibo::SignalCapture> cap;
 *     s.learn_signal(15000, cap);
 *     if (cap) s.emit_signal(*cap);
 *   }
 *   s.close();   // also done by the destructor
 * @endcode
 */

#include "orvibo/codec.hpp"
#include "orvibo/config.hpp"
#include "orvibo/device.hpp"
#include "orvibo/status.hpp"
#include "orvibo/transport/transport_base.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace orvibo {

class Session {
public:
  enum class State : uint8_t { Closed = 0, Open = 1, Subscribed = 2 };

  virtual ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&& other) noexcept;
  Session& operator=(Session&&) = delete;

  /**
   * @brief Bind the transport to an ephemeral local port. No traffic.
   * @return Ok (also when already open), BindError, or UnsupportedOperation
   *         when the record's kind does not match this session class.
   */
  Status open();

  /**
   * @brief Claim the device: send subscribe keyed by MAC, wait for the ack.
   * @return Ok, NotOpen, SendError, Timeout (no answer in
   *         Config::response_timeout_ms), SubscribeRejected (answered with
   *         something else), or a codec error.
   */
  Status subscribe();

  /// Best-effort unsubscribe when subscribed, then release the port. Idempotent.
  void close();

  State state() const { return state_; }
  bool  is_open() const { return state_ != State::Closed; }
  bool  is_subscribed() const { return state_ == State::Subscribed; }
  const DeviceRecord& device() const { return device_; }

protected:
  Session(const DeviceRecord& device, DeviceType kind, const Config& cfg,
          std::unique_ptr<transport::DatagramTransport> t);

  using clock_type = std::chrono::steady_clock;

  /// Common precondition: open and of the right kind.
  Status ready() const;

  Status send(const std::vector<uint8_t>& bytes);

  /// Next frame from the device before @p deadline; foreign datagrams and "sf" pushes skipped.
  Status await_frame(clock_type::time_point deadline, Frame& out);

  clock_type::time_point reply_deadline() const;

  /// Paced subscribe-shaped round trip shared by subscribe() and query_state().
  Status subscribe_exchange(const std::vector<uint8_t>& request, Frame& reply);

  const std::string& comp() const { return comp_; }

  DeviceRecord device_;
  DeviceType   kind_;
  Config       cfg_;
  std::unique_ptr<transport::DatagramTransport> transport_;
  State        state_ = State::Closed;

private:
  void pace_subscribe();

  clock_type::time_point last_subscribe_{};
  bool        subscribed_once_ = false;
  std::string comp_;
};

/**
 * @class SocketSession
 * @brief S20 power socket: read and switch the relay.
 */
class SocketSession : public Session {
public:
  /// @p t defaults to a UdpTransport.
  explicit SocketSession(const DeviceRecord& device, const Config& cfg = Config{},
                         std::unique_ptr<transport::DatagramTransport> t = nullptr);

  /**
   * @brief Ask the device for its relay state.
   *
   * On the wire this is a subscribe exchange (the ack ends with the power
   * byte), so a successful query also leaves the session Subscribed.
   * @return Ok, UnexpectedResponse (reply with another command or MAC), Timeout, ...
   */
  Status query_state(SocketState& out);

  /**
   * @brief Switch the relay, then re-query.
   *
   * Subscribes first (a query exchange), since the firmware ignores control
   * from a peer that holds no subscription. When the relay is already in the
   * requested state no control frame is sent.
   * @param confirmed  the state the device reports afterwards, which is what
   *                   counts; it may differ from @p on.
   */
  Status set_state(bool on, SocketState& confirmed);
};

/**
 * @class BlasterSession
 * @brief AllOne IR / 433MHz blaster: learn a remote's signal, replay it.
 */
class BlasterSession : public Session {
public:
  explicit BlasterSession(const DeviceRecord& device, const Config& cfg = Config{},
                          std::unique_ptr<transport::DatagramTransport> t = nullptr);

  /**
   * @brief Put the device in learning mode and wait for a captured signal.
   *
   * Requires subscribe(); otherwise NotSubscribed and nothing is sent.
   * Waits up to @p timeout_ms for the "ls" frame that carries signal bytes,
   * skipping the learning-mode acknowledgement and anything else.
   *
   * @param out   reset first; holds the capture on success
   * @param kind  tag stored in the capture (the firmware does not report it)
   * @return Ok with @p out empty when nobody pressed a button in time; that is
   *         an expected outcome, not an error.
   */
  Status learn_signal(int timeout_ms, std::optional<SignalCapture>& out,
                      SignalKind kind = SignalKind::IR);

  /**
   * @brief Replay a capture. Send-and-forget: the emission has no completion frame.
   * @return Ok, NotSubscribed (checked before any datagram), EmptySignal,
   *         PayloadTooLarge, SendError.
   */
  Status emit_signal(const SignalCapture& capture);

private:
  std::mt19937 rng_;
};

/// Session of the right class for @p device.type.
using AnySession = std::variant<SocketSession, BlasterSession>;

AnySession make_session(const DeviceRecord& device, const Config& cfg = Config{},
                        std::unique_ptr<transport::DatagramTransport> t = nullptr);

} // namespace orvibo
