// ============================================================================
// config.cpp — implementation for config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "orvibo/config.hpp"
#include "orvibo/log.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>        // getenv for XDG/HOME lookups
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace orvibo {

// -------- helpers --------

/*
 * config_base()
 * -------------
 * $XDG_CONFIG_HOME/orvibo if set, else $HOME/.config/orvibo. With neither set
 * the result is a relative "orvibo" directory, which still works from a CLI.
 */
static fs::path config_base() {
  if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
    return fs::path(x) / "orvibo";
  if (const char* h = std::getenv("HOME"); h && *h)
    return fs::path(h) / ".config" / "orvibo";
  return fs::path("orvibo");
}

// Read a whole JSON document. Missing file => found=false, Ok.
static Status read_json_file(const fs::path& p, json& out, bool& found, std::string& err) {
  found = false;
  std::error_code ec;
  if (!fs::exists(p, ec)) return Status::Ok;
  found = true;

  std::ifstream in(p);
  if (!in) { err = "cannot open " + p.string(); return Status::ConfigError; }
  try {
    in >> out;
  } catch (const json::exception& e) {
    err = p.string() + ": " + e.what();
    return Status::ConfigError;
  }
  return Status::Ok;
}

// tmp + rename so a crash mid-write never leaves a truncated file behind.
static Status atomic_write_json(const fs::path& p, const json& j, std::string& err) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) { err = "mkdir " + p.parent_path().string() + ": " + ec.message(); return Status::ConfigError; }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "cannot write " + tmp.string(); return Status::ConfigError; }
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) { err = "write failed " + tmp.string(); return Status::ConfigError; }
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    err = "rename " + tmp.string() + ": " + ec.message();
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    return Status::ConfigError;
  }
  return Status::Ok;
}

static bool take_string(const json& j, const char* key, std::string& dst, std::string& err) {
  if (!j.contains(key)) return true;
  if (!j[key].is_string()) { err = std::string(key) + " must be a string"; return false; }
  dst = j[key].get<std::string>();
  return true;
}

static bool take_int(const json& j, const char* key, int& dst, std::string& err) {
  if (!j.contains(key)) return true;
  if (!j[key].is_number_integer() || j[key].get<long long>() < 0
      || j[key].get<long long>() > std::numeric_limits<int>::max()) {
    err = std::string(key) + " must be a non-negative integer";
    return false;
  }
  dst = j[key].get<int>();
  return true;
}

static bool take_port(const json& j, const char* key, uint16_t& dst, std::string& err) {
  if (!j.contains(key)) return true;
  if (!j[key].is_number_integer() || j[key].get<long long>() < 0 || j[key].get<long long>() > 65535) {
    err = std::string(key) + " must be a port number (0..65535)";
    return false;
  }
  dst = static_cast<uint16_t>(j[key].get<int>());
  return true;
}

// -------- public API --------

std::string default_config_dir()    { return config_base().string(); }
std::string default_config_path()   { return (config_base() / "config.json").string(); }
std::string default_registry_path() { return (config_base() / "devices.json").string(); }

Status load_config(const std::string& path, Config& cfg, std::string& err) {
  json j;
  bool found = false;
  Status st = read_json_file(path, j, found, err);
  if (st != Status::Ok) return st;
  if (!found) {
    log::debug("config", "no config at " + path + ", using defaults");
    return Status::Ok;
  }
  if (!j.is_object()) { err = path + ": top level must be an object"; return Status::ConfigError; }

  // Work on a copy so a bad key leaves the caller's config untouched.
  Config c = cfg;
  bool good = take_port  (j, "port",                  c.port,                  err)
           && take_string(j, "bind_address",          c.bind_address,          err)
           && take_string(j, "broadcast_address",     c.broadcast_address,     err)
           && take_port  (j, "discovery_bind_port",   c.discovery_bind_port,   err)
           && take_port  (j, "session_bind_port",     c.session_bind_port,     err)
           && take_int   (j, "discovery_timeout_ms",  c.discovery_timeout_ms,  err)
           && take_int   (j, "discovery_max_wait_ms", c.discovery_max_wait_ms, err)
           && take_int   (j, "response_timeout_ms",   c.response_timeout_ms,   err)
           && take_int   (j, "learn_timeout_ms",      c.learn_timeout_ms,      err)
           && take_int   (j, "subscribe_interval_ms", c.subscribe_interval_ms, err)
           && take_string(j, "log_level",             c.log_level,             err);
  if (!good) { err = path + ": " + err; return Status::ConfigError; }

  log::Level lvl;
  if (!log::parse_level(c.log_level, lvl)) {
    err = path + ": log_level must be debug|info|warn|error|off";
    return Status::ConfigError;
  }

  cfg = c;
  log::debug("config", "loaded " + path);
  return Status::Ok;
}

Status save_config(const std::string& path, const Config& cfg, std::string& err) {
  json j;
  j["port"]                  = cfg.port;
  j["bind_address"]          = cfg.bind_address;
  j["broadcast_address"]     = cfg.broadcast_address;
  j["discovery_bind_port"]   = cfg.discovery_bind_port;
  j["session_bind_port"]     = cfg.session_bind_port;
  j["discovery_timeout_ms"]  = cfg.discovery_timeout_ms;
  j["discovery_max_wait_ms"] = cfg.discovery_max_wait_ms;
  j["response_timeout_ms"]   = cfg.response_timeout_ms;
  j["learn_timeout_ms"]      = cfg.learn_timeout_ms;
  j["subscribe_interval_ms"] = cfg.subscribe_interval_ms;
  j["log_level"]             = cfg.log_level;
  return atomic_write_json(path, j, err);
}

Status save_registry(const std::string& path, const DeviceMap& devices, std::string& err) {
  json arr = json::array();
  for (const auto& kv : devices) {
    const DeviceRecord& d = kv.second;
    arr.push_back({ {"ip", d.ip}, {"mac", mac_to_string(d.mac)}, {"type", device_type_name(d.type)} });
  }
  Status st = atomic_write_json(path, arr, err);
  if (st == Status::Ok) log::debug("config", "registry saved " + path + " devices=" + std::to_string(devices.size()));
  return st;
}

Status load_registry(const std::string& path, DeviceMap& devices, std::string& err) {
  json j;
  bool found = false;
  Status st = read_json_file(path, j, found, err);
  if (st != Status::Ok) return st;
  if (!found) { err = "no registry at " + path; return Status::ConfigError; }
  if (!j.is_array()) { err = path + ": registry must be an array"; return Status::ConfigError; }

  DeviceMap loaded;
  for (const auto& e : j) {
    if (!e.is_object() || !e.contains("ip") || !e.contains("mac") || !e.contains("type")
        || !e["ip"].is_string() || !e["mac"].is_string() || !e["type"].is_string()) {
      err = path + ": each entry needs string ip, mac and type";
      return Status::ConfigError;
    }
    DeviceRecord rec;
    rec.ip = e["ip"].get<std::string>();
    if (!parse_mac(e["mac"].get<std::string>(), rec.mac)) {
      err = path + ": bad mac " + e["mac"].get<std::string>();
      return Status::ConfigError;
    }
    if (!parse_device_type(e["type"].get<std::string>(), rec.type)) {
      err = path + ": bad type " + e["type"].get<std::string>();
      return Status::ConfigError;
    }
    loaded.emplace(rec.ip, rec);
  }
  devices.swap(loaded);
  return Status::Ok;
}

} // namespace orvibo
