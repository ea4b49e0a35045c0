#pragma once
/**
 * @page orvibo-config Orvibo Configuration and Device Registry
 * @file config.hpp
 * @brief Tunables loaded from a small JSON file, plus the discovered-device registry.
 *
 * @details
 * WHERE THINGS LIVE
 * -----------------
 *   $XDG_CONFIG_HOME/orvibo/config.json    (fallback ~/.config/orvibo/config.json)
 *   $XDG_CONFIG_HOME/orvibo/devices.json   registry written after each discovery
 *
 * Both are plain JSON so they can be read and edited by hand. A missing config
 * file is not an error: every field has a default and the file only needs the
 * keys you want to change.
 *
 * @code
 *   {
 *     "port": 10000,
 *     "broadcast_address": "192.168.1.255",
 *     "response_timeout_ms": 1500,
 *     "log_level": "info"
 *   }
 * @endcode
 *
 * FAILURE MODEL
 * -------------
 * Malformed JSON, a non-object top level, or a key with the wrong JSON type
 * yields Status::ConfigError with a human-readable reason in @p err. Unknown
 * keys are ignored. The registry writer goes through a temporary file and a
 * rename so readers never see half a file.
 */

#include "orvibo/device.hpp"
#include "orvibo/status.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace orvibo {

struct Config {
  uint16_t    port                  = 10000;              ///< vendor UDP port, all commands
  std::string bind_address          = "0.0.0.0";
  std::string broadcast_address     = "255.255.255.255";
  uint16_t    discovery_bind_port   = 10000;              ///< replies to broadcasts come back here
  uint16_t    session_bind_port     = 0;                  ///< 0 = ephemeral
  int         discovery_timeout_ms  = 1000;               ///< per receive() during discovery
  int         discovery_max_wait_ms = 3000;               ///< whole broadcast collection window
  int         response_timeout_ms   = 1000;               ///< acks and replies in a session
  int         learn_timeout_ms      = 15000;              ///< how long learn waits for a remote press
  int         subscribe_interval_ms = 100;                ///< firmware drops faster subscriptions
  std::string log_level             = "warn";
};

/// Discovery result: IP -> record.
using DeviceMap = std::map<std::string, DeviceRecord>;

/// Directory holding config.json and devices.json.
std::string default_config_dir();
std::string default_config_path();
std::string default_registry_path();

/**
 * @brief Overlay the keys found in @p path onto @p cfg.
 * @return Ok (file missing counts as Ok, cfg untouched) or ConfigError.
 */
Status load_config(const std::string& path, Config& cfg, std::string& err);

/// Write every field of @p cfg. Creates parent directories.
Status save_config(const std::string& path, const Config& cfg, std::string& err);

/// `[{"ip":"...","mac":"ac:cf:...","type":"socket"}, ...]`, atomic replace.
Status save_registry(const std::string& path, const DeviceMap& devices, std::string& err);

/// Inverse of save_registry(). A missing file is ConfigError (nothing cached).
Status load_registry(const std::string& path, DeviceMap& devices, std::string& err);

} // namespace orvibo
