#pragma once
/**
 * @file log.hpp
 * @brief Levelled, grep-friendly log lines on stderr.
 *
 * @details
 * Every line is a flat `key=value` record, the same shape the CLI uses for its
 * status lines, so one `grep reason=` or `grep comp=session` works on both:
 *
 * @code
 *   level=warn comp=BlasterSession@192.168.1.37 msg=unsubscribe send failed reason=send_error
 * @endcode
 *
 * Components name themselves `<Class>@<ip>` for per-device code and a bare
 * module name otherwise ("discovery", "transport", "config").
 *
 * The threshold and the sink are process-wide. Tests point the sink at a
 * std::ostringstream to assert on what was logged. Not synchronized: set the
 * level and sink once at startup before sessions run on other threads.
 */

#include <cstdint>
#include <iosfwd>
#include <string>

namespace orvibo {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void  set_level(Level lvl);
Level level();

/// Parse "debug"|"info"|"warn"|"warning"|"error"|"off" (case-insensitive).
/// Returns false and leaves @p out untouched on anything else.
bool parse_level(const std::string& text, Level& out);

/// Redirect output. nullptr restores std::cerr.
void set_sink(std::ostream* sink);

bool enabled(Level lvl);

void write(Level lvl, const std::string& component, const std::string& msg);

inline void debug(const std::string& comp, const std::string& msg) { write(Level::Debug, comp, msg); }
inline void info (const std::string& comp, const std::string& msg) { write(Level::Info,  comp, msg); }
inline void warn (const std::string& comp, const std::string& msg) { write(Level::Warn,  comp, msg); }
inline void error(const std::string& comp, const std::string& msg) { write(Level::Error, comp, msg); }

} // namespace log
} // namespace orvibo
