/**
 * @file notification_sink.hpp
 * @brief Where resolved messages go to be shown to the user.
 *
 * @details
 * The core calls `display()` and forgets about it: no return value, no
 * retries. OS toasts, tray balloons and the like are platform wrappers that
 * implement INotificationSink. The emergency loop calls `display()` again for
 * every re-alert with the same Message, so implementations must tolerate
 * repeats.
 *
 * ConsoleNotificationSink prints to a stream in one of three formats:
 * - pretty: two lines per message, ANSI bold/red when enabled;
 * - json:   one JSON object per line (id, priority, title, body, app, ...);
 * - raw:    `<id>\t<priority>\t<title>\t<body>`.
 */
#ifndef PUSHWIRE_NOTIFICATION_SINK_HPP
#define PUSHWIRE_NOTIFICATION_SINK_HPP

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "pushwire/message.hpp"

namespace pushwire {

class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  virtual void display(const Message& msg) = 0;
};

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m" + s + "\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m" + s + "\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m" + s + "\033[0m" : s; }
};

enum class SinkFormat : uint8_t { Pretty, Json, Raw };

/// "pretty" | "json" | "raw"; false leaves @p out untouched.
bool parse_sink_format(const std::string& text, SinkFormat& out);

class ConsoleNotificationSink : public INotificationSink {
public:
  ConsoleNotificationSink(std::ostream& out, SinkFormat format, bool color);

  void display(const Message& msg) override;

private:
  std::ostream& out_;
  SinkFormat    format_;
  Ansi          ansi_;
  std::mutex    mu_;     // display() is called from the worker and the alert thread
};

} // namespace pushwire

#endif // PUSHWIRE_NOTIFICATION_SINK_HPP
