/**
 * @file main.cpp
 * @brief orvibo-cli — Linux one-shot runner around the orvibo core library.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11), load ~/.config/orvibo/config.json, apply overrides.
 *  - No --ip: broadcast discovery, print one line per device, save devices.json.
 *  - --ip: resolve the device (live unicast discovery or --cached registry),
 *    open a session of the right kind and run one action:
 *      socket  : print state, or --switch on|off and print the confirmed state
 *      blaster : --teach <file> learns a signal, --emit <file> replays one
 *
 * Notes:
 *  - Capture files hold the raw signal bytes exactly as the device sent them.
 *  - Results go to stdout as key=value lines; failures go to stderr as
 *    `status=error reason=<token>` and map to the exit codes below.
 *
 * Exit codes: 0 ok, 1 transport/I-O, 2 usage, 3 timeout/no capture,
 *             4 device not found, 5 unsupported for this device.
 */

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "CLI/CLI11.hpp"

#include "orvibo/config.hpp"
#include "orvibo/device.hpp"
#include "orvibo/discovery.hpp"
#include "orvibo/log.hpp"
#include "orvibo/session.hpp"
#include "orvibo/status.hpp"

namespace fs = std::filesystem;
using namespace orvibo;

enum Exit : int {
  EXIT_OK          = 0,
  EXIT_IO          = 1,
  EXIT_USAGE       = 2,
  EXIT_TIMEOUT     = 3,
  EXIT_NOT_FOUND   = 4,
  EXIT_UNSUPPORTED = 5
};

// ---------- small utilities ----------

static int exit_code(Status st) {
  switch (st) {
    case Status::Ok:                   return EXIT_OK;
    case Status::Timeout:              return EXIT_TIMEOUT;
    case Status::DeviceNotFound:       return EXIT_NOT_FOUND;
    case Status::UnsupportedOperation:
    case Status::UnknownDeviceType:    return EXIT_UNSUPPORTED;
    default:                           return EXIT_IO;
  }
}

static int fail(Status st, const std::string& detail = "") {
  std::cerr << "status=error reason=" << status_name(st);
  if (!detail.empty()) std::cerr << " detail=\"" << detail << "\"";
  std::cerr << "\n";
  return exit_code(st);
}

static int usage_error(const std::string& msg) {
  std::cerr << "status=error reason=usage detail=\"" << msg << "\"\n";
  return EXIT_USAGE;
}

static bool read_blob(const std::string& path, std::vector<uint8_t>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static bool write_blob(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  return static_cast<bool>(out);
}

// Remember one device in the registry next to whatever is already there.
static void remember(const std::string& registry, const DeviceRecord& rec) {
  DeviceMap known;
  std::string err;
  std::error_code ec;
  if (fs::exists(registry, ec) && load_registry(registry, known, err) != Status::Ok) {
    log::warn("cli", "registry not merged: " + err);
    return;
  }
  known[rec.ip] = rec;
  if (save_registry(registry, known, err) != Status::Ok)
    log::warn("cli", "registry not saved: " + err);
}

// ---------- actions ----------

struct Options {
  std::string ip;
  bool        cached = false;
  std::string switch_to;     // "", "on", "off"
  std::string teach_file;
  std::string emit_file;
  bool        rf = false;
};

static int run_discover_all(const Config& cfg, const std::string& registry) {
  DeviceMap found;
  Status st = discover_all(cfg, found);
  if (st != Status::Ok) return fail(st);

  for (const auto& kv : found) std::cout << describe(kv.second) << "\n";
  if (found.empty()) std::cerr << "status=ok devices=0\n";

  std::string err;
  if (save_registry(registry, found, err) != Status::Ok)
    log::warn("cli", "registry not saved: " + err);
  return EXIT_OK;
}

static int run_socket(SocketSession& s, const Options& opt) {
  if (!opt.teach_file.empty() || !opt.emit_file.empty())
    return fail(Status::UnsupportedOperation, "teach/emit need a blaster");

  Status st = s.open();
  if (st != Status::Ok) return fail(st);

  SocketState state;
  if (opt.switch_to.empty()) {
    st = s.query_state(state);
  } else {
    st = s.set_state(opt.switch_to == "on", state);
  }
  if (st != Status::Ok) return fail(st);

  std::cout << "state=" << (state.on ? "on" : "off") << "\n";
  return EXIT_OK;
}

static int run_blaster(BlasterSession& s, const Options& opt, const Config& cfg) {
  if (!opt.switch_to.empty())
    return fail(Status::UnsupportedOperation, "--switch needs a socket");
  if (opt.teach_file.empty() && opt.emit_file.empty()) return EXIT_OK;

  // Read the capture before touching the network so a bad path costs nothing.
  SignalCapture capture;
  if (!opt.emit_file.empty()) {
    if (!read_blob(opt.emit_file, capture.raw)) {
      std::cerr << "status=error reason=io detail=\"cannot read " << opt.emit_file << "\"\n";
      return EXIT_IO;
    }
    capture.kind = opt.rf ? SignalKind::RF433 : SignalKind::IR;
  }

  Status st = s.open();
  if (st == Status::Ok) st = s.subscribe();
  if (st != Status::Ok) return fail(st);

  if (!opt.emit_file.empty()) {
    st = s.emit_signal(capture);
    if (st != Status::Ok) return fail(st);
    std::cout << "status=ok emitted=" << capture.raw.size() << "\n";
    return EXIT_OK;
  }

  std::optional<SignalCapture> learned;
  st = s.learn_signal(cfg.learn_timeout_ms, learned, opt.rf ? SignalKind::RF433 : SignalKind::IR);
  if (st != Status::Ok) return fail(st);
  if (!learned) {
    std::cerr << "status=error reason=no_capture\n";
    return EXIT_TIMEOUT;
  }
  if (!write_blob(opt.teach_file, learned->raw)) {
    std::cerr << "status=error reason=io detail=\"cannot write " << opt.teach_file << "\"\n";
    return EXIT_IO;
  }
  std::cout << "status=ok captured=" << learned->raw.size()
            << " kind=" << signal_kind_name(learned->kind)
            << " file=" << opt.teach_file << "\n";
  return EXIT_OK;
}

// ---------- main ----------

int main(int argc, char** argv) {
  Options opt;
  std::string opt_config;
  std::string opt_loglevel;
  int opt_timeout_ms = -1;
  int opt_learn_timeout_ms = -1;

  CLI::App app{"Orvibo S20 socket / AllOne blaster client"};

  app.add_option("--ip", opt.ip, "Device address; omit to discover everything on the LAN");
  app.add_flag("--cached", opt.cached, "Take the device from devices.json instead of asking it")->needs("--ip");
  auto* sw = app.add_option("--switch", opt.switch_to, "Socket: switch the relay")
                 ->check(CLI::IsMember({"on", "off"}))->needs("--ip");
  auto* teach = app.add_option("--teach", opt.teach_file, "Blaster: learn a signal into FILE")->needs("--ip");
  auto* emit  = app.add_option("--emit", opt.emit_file, "Blaster: replay the signal in FILE")->needs("--ip");
  teach->excludes(emit);
  sw->excludes(teach)->excludes(emit);
  app.add_flag("--rf", opt.rf, "Tag learned/emitted signals as 433MHz RF");
  app.add_option("--config", opt_config, "Config file (default ~/.config/orvibo/config.json)");
  app.add_option("--loglevel", opt_loglevel, "debug|info|warn|error|off");
  app.add_option("--timeout", opt_timeout_ms, "Reply timeout and discovery window in ms")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--learn-timeout", opt_learn_timeout_ms, "How long --teach waits for a remote press, ms")
      ->check(CLI::NonNegativeNumber);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // Config file first, then command-line overrides.
  Config cfg;
  std::string err;
  const std::string config_path = opt_config.empty() ? default_config_path() : opt_config;
  if (load_config(config_path, cfg, err) != Status::Ok) {
    std::cerr << "status=error reason=config_error detail=\"" << err << "\"\n";
    return EXIT_USAGE;
  }
  if (!opt_loglevel.empty()) cfg.log_level = opt_loglevel;
  log::Level lvl;
  if (!log::parse_level(cfg.log_level, lvl)) return usage_error("bad log level " + cfg.log_level);
  log::set_level(lvl);

  if (opt_timeout_ms >= 0) {
    cfg.response_timeout_ms   = opt_timeout_ms;
    cfg.discovery_max_wait_ms = opt_timeout_ms;
  }
  if (opt_learn_timeout_ms >= 0) cfg.learn_timeout_ms = opt_learn_timeout_ms;

  const std::string registry = default_registry_path();

  if (opt.ip.empty()) return run_discover_all(cfg, registry);

  // Resolve the device.
  DeviceRecord rec;
  if (opt.cached) {
    DeviceMap known;
    if (load_registry(registry, known, err) != Status::Ok) {
      std::cerr << "status=error reason=config_error detail=\"" << err << "\"\n";
      return EXIT_NOT_FOUND;
    }
    auto it = known.find(opt.ip);
    if (it == known.end()) return fail(Status::DeviceNotFound, opt.ip + " not in " + registry);
    rec = it->second;
  } else {
    Status st = discover_one(cfg, opt.ip, rec);
    if (st != Status::Ok) return fail(st);
    remember(registry, rec);
  }
  std::cout << describe(rec) << "\n";

  AnySession session = make_session(rec, cfg);
  if (auto* sock = std::get_if<SocketSession>(&session)) return run_socket(*sock, opt);
  return run_blaster(std::get<BlasterSession>(session), opt, cfg);
}
