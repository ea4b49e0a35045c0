#pragma once
/**
 * @file status.hpp
 * @brief One result taxonomy for every orvibo-core layer (codec, transport, discovery, session).
 *
 * @details
 * The library does not throw. Every fallible call returns a Status and hands
 * results back through out-parameters, the same way the transport layer returns
 * its Tx/Rx codes. Callers switch on the value; logs and the CLI print the
 * stable token from status_name() so scripts can grep for it.
 *
 * | Status               | Layer      | Meaning                                              |
 * |----------------------|------------|------------------------------------------------------|
 * | Ok                   | all        | call succeeded                                       |
 * | MalformedFrame       | codec      | bad magic, or length field disagrees with datagram   |
 * | TruncatedFrame       | codec      | datagram shorter than its header or declared length  |
 * | PayloadTooLarge      | codec      | frame would not fit FRAME_MAX                        |
 * | BindError            | transport  | socket creation or bind failed                       |
 * | SendError            | transport  | sendto failed or wrote a short datagram              |
 * | ReceiveError         | transport  | poll/recvfrom failed                                 |
 * | Timeout              | transport  | nothing arrived in the window                        |
 * | NotOpen              | transport  | used before open() or after close()                  |
 * | UnexpectedResponse   | session    | well-formed frame, wrong command for the exchange    |
 * | DeviceNotFound       | discovery  | targeted discovery got no valid reply                |
 * | UnknownDeviceType    | discovery  | reply marker is neither socket nor blaster           |
 * | SubscribeRejected    | session    | device answered the subscribe with something else    |
 * | UnsupportedOperation | session    | operation does not exist for this device type        |
 * | NotSubscribed        | session    | learn/emit attempted before subscribe()              |
 * | EmptySignal          | session    | emit of a zero-length capture                        |
 * | ConfigError          | config     | config or registry file unreadable or ill-typed      |
 */

#include <cstdint>

namespace orvibo {

enum class Status : uint8_t {
  Ok = 0,
  MalformedFrame,
  TruncatedFrame,
  PayloadTooLarge,
  BindError,
  SendError,
  ReceiveError,
  Timeout,
  NotOpen,
  UnexpectedResponse,
  DeviceNotFound,
  UnknownDeviceType,
  SubscribeRejected,
  UnsupportedOperation,
  NotSubscribed,
  EmptySignal,
  ConfigError
};

/// Stable snake_case token for logs and CLI output (e.g. "truncated_frame").
const char* status_name(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace orvibo
