// ============================================================================
// http.cpp - implementation for http.hpp
// Wire parsing is kept free of sockets; perform() only moves bytes.
// ============================================================================

#include "pushwire/http.hpp"
#include "pushwire/log.hpp"
#include "pushwire/transport/tls_stream.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>

namespace pushwire::http {

namespace {

constexpr size_t MAX_RESPONSE = 8u * 1024u * 1024u;

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// Decode a chunked body starting at @p pos. Trailers are ignored.
bool decode_chunked(const std::string& raw, size_t pos, std::string& body, Error& err) {
  body.clear();
  for (;;) {
    const auto eol = raw.find("\r\n", pos);
    if (eol == std::string::npos) { err.set(ErrorCode::ProtocolError, "http_chunk_truncated"); return false; }
    std::string size_line = raw.substr(pos, eol - pos);
    const auto semi = size_line.find(';');                  // chunk extensions
    if (semi != std::string::npos) size_line.resize(semi);
    size_line = trim(size_line);
    if (size_line.empty() || size_line.size() > 16) {
      err.set(ErrorCode::ProtocolError, "http_bad_chunk_size");
      return false;
    }

    char* end = nullptr;
    const unsigned long long size = std::strtoull(size_line.c_str(), &end, 16);
    if (*end != '\0') { err.set(ErrorCode::ProtocolError, "http_bad_chunk_size"); return false; }

    pos = eol + 2;
    if (size == 0) return true;
    if (size > raw.size() - pos) { err.set(ErrorCode::ProtocolError, "http_chunk_truncated"); return false; }
    body.append(raw, pos, static_cast<size_t>(size));
    pos += static_cast<size_t>(size);
    if (raw.compare(pos, 2, "\r\n") != 0) { err.set(ErrorCode::ProtocolError, "http_chunk_missing_crlf"); return false; }
    pos += 2;
  }
}

uint64_t mono_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

std::string url_encode(const std::string& text) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string out;
  for (const auto& kv : fields) {
    if (!out.empty()) out.push_back('&');
    out += url_encode(kv.first);
    out.push_back('=');
    out += url_encode(kv.second);
  }
  return out;
}

// ---------------------------------------------------------------------------
// parse_http_response()
// ---------------------
// Status line -> headers -> body. Body selection order follows RFC 7230 §3.3.3:
// chunked wins over Content-Length, otherwise the rest of the buffer.
// ---------------------------------------------------------------------------
bool parse_http_response(const std::string& raw, Response& out, Error& err) {
  Response r;
  const auto head_end = raw.find("\r\n\r\n");
  if (head_end == std::string::npos) { err.set(ErrorCode::ProtocolError, "http_no_header_end"); return false; }

  const auto eol = raw.find("\r\n");
  const std::string status_line = raw.substr(0, eol);
  if (status_line.compare(0, 5, "HTTP/") != 0) { err.set(ErrorCode::ProtocolError, "http_bad_status_line"); return false; }
  const auto sp = status_line.find(' ');
  if (sp == std::string::npos) { err.set(ErrorCode::ProtocolError, "http_bad_status_line"); return false; }
  r.status = std::atoi(status_line.c_str() + sp + 1);
  if (r.status < 100 || r.status > 599) { err.set(ErrorCode::ProtocolError, "http_bad_status_code"); return false; }

  size_t pos = eol + 2;
  while (pos < head_end) {
    const auto next = raw.find("\r\n", pos);
    const std::string line = raw.substr(pos, next - pos);
    const auto colon = line.find(':');
    if (colon == std::string::npos) { err.set(ErrorCode::ProtocolError, "http_bad_header"); return false; }
    r.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    pos = next + 2;
  }

  const size_t body_at = head_end + 4;
  const auto te = r.headers.find("transfer-encoding");
  const auto cl = r.headers.find("content-length");
  if (te != r.headers.end() && lower(te->second).find("chunked") != std::string::npos) {
    if (!decode_chunked(raw, body_at, r.body, err)) return false;
  } else if (cl != r.headers.end()) {
    char* end = nullptr;
    const unsigned long len = std::strtoul(cl->second.c_str(), &end, 10);
    if (cl->second.empty() || *end != '\0') { err.set(ErrorCode::ProtocolError, "http_bad_content_length"); return false; }
    if (len > raw.size() - body_at) { err.set(ErrorCode::ProtocolError, "http_body_truncated"); return false; }
    r.body = raw.substr(body_at, len);
  } else {
    r.body = raw.substr(body_at);
  }

  out = std::move(r);
  return true;
}

bool perform(const Request& req, uint32_t timeout_ms, Response& out, Error& err) {
  transport::Url url;
  if (!transport::parse_url(req.url, url, err)) return false;

  std::string wire;
  wire += req.method + " " + url.path + " HTTP/1.1\r\n";
  wire += "Host: " + url.host + "\r\n";
  wire += "User-Agent: pushwire\r\n";
  wire += "Accept: application/json\r\n";
  wire += "Connection: close\r\n";
  for (const auto& h : req.headers) wire += h.first + ": " + h.second + "\r\n";
  if (!req.body.empty() || req.method == "POST") {
    wire += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
  }
  wire += "\r\n";
  wire += req.body;

  const uint64_t deadline = mono_ms() + timeout_ms;
  transport::TlsStream stream;
  if (!stream.connect(url, timeout_ms, err)) return false;
  if (!stream.write_all(reinterpret_cast<const uint8_t*>(wire.data()), wire.size(), timeout_ms, err)) return false;

  std::string raw;
  uint8_t buf[4096];
  for (;;) {
    const uint64_t now = mono_ms();
    if (now >= deadline) { err.set(ErrorCode::NetworkError, "timeout"); return false; }
    size_t n = 0;
    const transport::RxResult r = stream.read_some(buf, sizeof(buf), n, static_cast<uint32_t>(deadline - now), err);
    if (r == transport::RxResult::Error) return false;
    if (r == transport::RxResult::Closed) break;
    if (r == transport::RxResult::None) continue;
    raw.append(reinterpret_cast<const char*>(buf), n);
    if (raw.size() > MAX_RESPONSE) { err.set(ErrorCode::ProtocolError, "http_response_too_large"); return false; }
  }
  stream.close();

  if (!parse_http_response(raw, out, err)) return false;
  log::debug("http_response", {{"method", req.method}, {"path", url.path.substr(0, url.path.find('?'))},
                               {"status", std::to_string(out.status)}});
  return true;
}

} // namespace pushwire::http
