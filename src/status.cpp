// ============================================================================
// status.cpp — implementation for status.hpp
// ============================================================================

#include "orvibo/status.hpp"

namespace orvibo {

const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:                   return "ok";
    case Status::MalformedFrame:       return "malformed_frame";
    case Status::TruncatedFrame:       return "truncated_frame";
    case Status::PayloadTooLarge:      return "payload_too_large";
    case Status::BindError:            return "bind_error";
    case Status::SendError:            return "send_error";
    case Status::ReceiveError:         return "receive_error";
    case Status::Timeout:              return "timeout";
    case Status::NotOpen:              return "not_open";
    case Status::UnexpectedResponse:   return "unexpected_response";
    case Status::DeviceNotFound:       return "device_not_found";
    case Status::UnknownDeviceType:    return "unknown_device_type";
    case Status::SubscribeRejected:    return "subscribe_rejected";
    case Status::UnsupportedOperation: return "unsupported_operation";
    case Status::NotSubscribed:        return "not_subscribed";
    case Status::EmptySignal:          return "empty_signal";
    case Status::ConfigError:          return "config_error";
  }
  return "unknown";
}

} // namespace orvibo
