/**
 * @file log.hpp
 * @brief Single-line key=value logging to stderr.
 *
 * @details
 * Every record is one line, shell-friendly, in the same shape the CLI prints
 * its status lines:
 *
 * @code
 *   level=info event=session_state from=connecting to=authenticated
 *   level=warn event=fetch_failed code=network_error reason=timeout retry_in_ms=2000
 * @endcode
 *
 * Values containing spaces or line breaks are double-quoted. Writes are serialized with a
 * mutex so the session, worker and alert threads never interleave characters.
 */
#ifndef PUSHWIRE_LOG_HPP
#define PUSHWIRE_LOG_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

namespace pushwire::log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Field = std::pair<std::string, std::string>;

/// Set the minimum level that is written. Default is Info.
void set_level(Level level);
Level level();

/// Parse "debug|info|warn|error|off"; returns false and leaves @p out untouched otherwise.
bool parse_level(const std::string& text, Level& out);

/// @p base moved @p steps levels toward Debug (one per `-v`), never past Debug.
Level lower_level(Level base, int steps);

/// One record, newline-terminated. Values with spaces, '=', quotes or line
/// breaks are double-quoted with `\n` / `\r` escaped, so a record never spans lines.
std::string format_record(Level level, const char* event, std::initializer_list<Field> fields = {});

void write(Level level, const char* event, std::initializer_list<Field> fields = {});

inline void debug(const char* event, std::initializer_list<Field> fields = {}) { write(Level::Debug, event, fields); }
inline void info (const char* event, std::initializer_list<Field> fields = {}) { write(Level::Info,  event, fields); }
inline void warn (const char* event, std::initializer_list<Field> fields = {}) { write(Level::Warn,  event, fields); }
inline void error(const char* event, std::initializer_list<Field> fields = {}) { write(Level::Error, event, fields); }

} // namespace pushwire::log

#endif // PUSHWIRE_LOG_HPP
