#include "pushwire/notification_sink.hpp"
#include "pushwire/parser.hpp"

#include <ctime>

#include <nlohmann/json.hpp>

namespace pushwire {

namespace {

// Local wall-clock "YYYY-MM-DD HH:MM" for the pretty header.
std::string local_time(uint64_t ms) {
  const std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
  return buf;
}

std::string one_line(std::string s) {
  for (auto& c : s) if (c == '\n' || c == '\t' || c == '\r') c = ' ';
  return s;
}

} // namespace

bool parse_sink_format(const std::string& text, SinkFormat& out) {
  if (text == "pretty") { out = SinkFormat::Pretty; return true; }
  if (text == "json")   { out = SinkFormat::Json;   return true; }
  if (text == "raw")    { out = SinkFormat::Raw;    return true; }
  return false;
}

ConsoleNotificationSink::ConsoleNotificationSink(std::ostream& out, SinkFormat format, bool color)
: out_(out), format_(format) {
  ansi_.enabled = color && format == SinkFormat::Pretty;
}

void ConsoleNotificationSink::display(const Message& msg) {
  std::lock_guard<std::mutex> lock(mu_);

  switch (format_) {
    case SinkFormat::Json: {
      nlohmann::json j = parser::message_to_state(msg);
      j["priority_name"] = to_string(msg.priority);
      out_ << j.dump() << "\n";
      break;
    }
    case SinkFormat::Raw:
      out_ << msg.id << "\t" << to_string(msg.priority) << "\t"
           << one_line(msg.title) << "\t" << one_line(msg.body) << "\n";
      break;
    case SinkFormat::Pretty: {
      std::string head = msg.title;
      if (msg.priority == Priority::Emergency) head = ansi_.red("[EMERGENCY] ") + ansi_.bold(head);
      else if (msg.priority == Priority::High) head = ansi_.bold("[!] " + head);
      else                                     head = ansi_.bold(head);

      out_ << head << "  " << ansi_.dim(msg.app + " " + local_time(msg.received_at_ms)) << "\n";
      out_ << "  " << msg.body << "\n";
      if (msg.url) {
        out_ << "  " << ansi_.dim(msg.url_title ? *msg.url_title + ": " + *msg.url : *msg.url) << "\n";
      }
      if (msg.needs_ack_loop()) {
        out_ << "  " << ansi_.dim("acknowledge with: ack " + *msg.receipt_id) << "\n";
      }
      break;
    }
  }
  out_.flush();
}

} // namespace pushwire
