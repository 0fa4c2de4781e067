#include "pushwire/relay_frame.hpp"

namespace pushwire {

RelayFrame classify_frame(uint8_t byte) {
  switch (byte) {
    case '#': return RelayFrame::KeepAlive;
    case '!': return RelayFrame::NewMessage;
    case 'R': return RelayFrame::Reload;
    case 'E': return RelayFrame::ReloadCredentials;
    case 'A': return RelayFrame::SessionSuperseded;
    default:  return RelayFrame::Unknown;
  }
}

std::vector<RelayFrame> classify_payload(const std::vector<uint8_t>& payload) {
  std::vector<RelayFrame> out;
  out.reserve(payload.size());
  for (uint8_t b : payload) {
    if (b == '\n' || b == '\r') continue;   // some relays terminate signals with a newline
    out.push_back(classify_frame(b));
  }
  return out;
}

const char* to_string(RelayFrame f) {
  switch (f) {
    case RelayFrame::KeepAlive:         return "keepalive";
    case RelayFrame::NewMessage:        return "new_message";
    case RelayFrame::Reload:            return "reload";
    case RelayFrame::ReloadCredentials: return "reload_credentials";
    case RelayFrame::SessionSuperseded: return "session_superseded";
    case RelayFrame::Unknown:           break;
  }
  return "unknown";
}

std::string identification_frame(const Token& token) {
  return "login:" + token.device_id + ":" + token.secret + "\n";
}

} // namespace pushwire
