// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "pushwire/log.hpp"
#include "pushwire/errors.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace pushwire {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:            return "ok";
    case ErrorCode::AuthError:     return "auth_error";
    case ErrorCode::NetworkError:  return "network_error";
    case ErrorCode::FetchError:    return "fetch_error";
    case ErrorCode::AckError:      return "ack_error";
    case ErrorCode::ProtocolError: return "protocol_error";
    case ErrorCode::StorageError:  return "storage_error";
  }
  return "unknown";
}

namespace log {

static std::atomic<Level> g_level{Level::Info};
static std::mutex g_write_mu;

static const char* level_name(Level l) {
  switch (l) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "info";
}

// Quote values that would break key=value splitting in shell tools.
static void append_value(std::string& line, const std::string& v) {
  bool quote = v.empty();
  for (char c : v) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n' || c == '\r') { quote = true; break; }
  }
  if (!quote) { line += v; return; }
  line += '"';
  for (char c : v) {
    if (c == '"' || c == '\\') line += '\\';
    if (c == '\n') { line += "\\n"; continue; }
    if (c == '\r') { line += "\\r"; continue; }
    line += c;
  }
  line += '"';
}

void set_level(Level level) { g_level.store(level); }

Level level() { return g_level.load(); }

bool parse_level(const std::string& text, Level& out) {
  if (text == "debug") { out = Level::Debug; return true; }
  if (text == "info")  { out = Level::Info;  return true; }
  if (text == "warn")  { out = Level::Warn;  return true; }
  if (text == "error") { out = Level::Error; return true; }
  if (text == "off")   { out = Level::Off;   return true; }
  return false;
}

Level lower_level(Level base, int steps) {
  int v = static_cast<int>(base) - (steps > 0 ? steps : 0);
  if (v < static_cast<int>(Level::Debug)) v = static_cast<int>(Level::Debug);
  return static_cast<Level>(v);
}

std::string format_record(Level lvl, const char* event, std::initializer_list<Field> fields) {
  std::string line = "level=";
  line += level_name(lvl);
  line += " event=";
  line += event ? event : "-";
  for (const auto& f : fields) {
    line += ' ';
    line += f.first;
    line += '=';
    append_value(line, f.second);
  }
  line += '\n';
  return line;
}

void write(Level lvl, const char* event, std::initializer_list<Field> fields) {
  if (lvl < g_level.load() || g_level.load() == Level::Off) return;

  // Assemble the whole line first so the lock only covers the write.
  const std::string line = format_record(lvl, event, fields);

  std::lock_guard<std::mutex> lock(g_write_mu);
  std::cerr << line;
  std::cerr.flush();
}

} // namespace log
} // namespace pushwire
