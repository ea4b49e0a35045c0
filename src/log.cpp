// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "orvibo/log.hpp"

#include <cctype>
#include <iostream>

namespace orvibo {
namespace log {

static Level         g_level = Level::Warn;
static std::ostream* g_sink  = nullptr;   // nullptr => std::cerr

static const char* level_token(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "?";
}

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool parse_level(const std::string& text, Level& out) {
  std::string t;
  t.reserve(text.size());
  for (char c : text) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if      (t == "debug")                   out = Level::Debug;
  else if (t == "info")                    out = Level::Info;
  else if (t == "warn" || t == "warning")  out = Level::Warn;
  else if (t == "error")                   out = Level::Error;
  else if (t == "off")                     out = Level::Off;
  else return false;
  return true;
}

void set_sink(std::ostream* sink) { g_sink = sink; }

bool enabled(Level lvl) {
  return lvl != Level::Off && static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(g_level);
}

void write(Level lvl, const std::string& component, const std::string& msg) {
  if (!enabled(lvl)) return;
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << "level=" << level_token(lvl)
     << " comp=" << component
     << " msg="  << msg << "\n";
}

} // namespace log
} // namespace orvibo
