// ============================================================================
// tls_stream.cpp - implementation for transport/tls_stream.hpp
// The socket stays non-blocking for its whole life; poll(2) supplies every
// timeout, including the ones OpenSSL needs while it retries WANT_READ/WRITE.
// ============================================================================

#include "pushwire/transport/tls_stream.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace pushwire::transport {

namespace {

std::string ssl_reason(const char* what) {
  char buf[256] = {0};
  const unsigned long e = ERR_get_error();
  if (e != 0) ERR_error_string_n(e, buf, sizeof(buf));
  ERR_clear_error();
  return std::string(what) + (buf[0] ? std::string(": ") + buf : std::string());
}

uint64_t mono_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

// Remaining budget of a deadline, 0 once it has passed.
uint32_t remaining(uint64_t deadline) {
  const uint64_t now = mono_ms();
  return now >= deadline ? 0 : static_cast<uint32_t>(deadline - now);
}

} // namespace

// ---------------------------------------------------------------------------
// parse_url()
// -----------
// scheme://host[:port][/path?query]. No userinfo, no IPv6 literals.
// ---------------------------------------------------------------------------
bool parse_url(const std::string& text, Url& out, Error& err) {
  const auto sep = text.find("://");
  if (sep == std::string::npos) { err.set(ErrorCode::ProtocolError, "bad_url: " + text); return false; }

  const std::string scheme = text.substr(0, sep);
  Url u;
  if      (scheme == "https" || scheme == "wss") { u.tls = true;  u.port = 443; }
  else if (scheme == "http"  || scheme == "ws")  { u.tls = false; u.port = 80; }
  else { err.set(ErrorCode::ProtocolError, "bad_url_scheme: " + scheme); return false; }

  const std::string rest = text.substr(sep + 3);
  const auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  u.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const std::string port_txt = authority.substr(colon + 1);
    char* end = nullptr;
    const long p = std::strtol(port_txt.c_str(), &end, 10);
    if (port_txt.empty() || *end != '\0' || p <= 0 || p > 65535) {
      err.set(ErrorCode::ProtocolError, "bad_url_port: " + port_txt);
      return false;
    }
    u.port = static_cast<uint16_t>(p);
    authority.resize(colon);
  }
  if (authority.empty()) { err.set(ErrorCode::ProtocolError, "bad_url_host: " + text); return false; }
  u.host = authority;

  out = u;
  return true;
}

TlsStream::~TlsStream() { close(); }

bool TlsStream::wait_fd(bool for_write, uint32_t timeout_ms, Error& err) {
  pollfd p{};
  p.fd = fd_;
  p.events = for_write ? POLLOUT : POLLIN;
  for (;;) {
    const int r = ::poll(&p, 1, static_cast<int>(std::min<uint32_t>(timeout_ms, INT_MAX)));
    if (r > 0) return true;
    if (r == 0) { err.set(ErrorCode::NetworkError, "timeout"); return false; }
    if (errno == EINTR) continue;
    err.set(ErrorCode::NetworkError, std::string("poll: ") + std::strerror(errno));
    return false;
  }
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// 1. getaddrinfo, try each address with a non-blocking connect + poll.
// 2. For TLS: fresh SSL_CTX with system trust store, SNI + hostname check,
//    handshake driven by poll until the deadline.
// ---------------------------------------------------------------------------
bool TlsStream::connect(const Url& url, uint32_t timeout_ms, Error& err) {
  close();
  const uint64_t deadline = mono_ms() + timeout_ms;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(url.port);
  const int gai = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0) {
    err.set(ErrorCode::NetworkError, std::string("resolve: ") + ::gai_strerror(gai));
    return false;
  }

  std::string last_reason = "connect: no address";
  for (addrinfo* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) continue;
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) { fd_ = fd; break; }
    if (errno != EINPROGRESS) {
      last_reason = std::string("connect: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }

    fd_ = fd;
    Error werr;
    if (!wait_fd(true, remaining(deadline), werr)) {
      last_reason = "connect: " + werr.reason;
      ::close(fd); fd_ = -1;
      continue;
    }
    int so_err = 0;
    socklen_t len = sizeof(so_err);
    ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len);
    if (so_err != 0) {
      last_reason = std::string("connect: ") + std::strerror(so_err);
      ::close(fd); fd_ = -1;
    }
  }
  ::freeaddrinfo(res);

  if (fd_ < 0) { err.set(ErrorCode::NetworkError, last_reason); return false; }
  if (!url.tls) return true;

  ctx_ = SSL_CTX_new(TLS_client_method());
  if (!ctx_) { err.set(ErrorCode::NetworkError, ssl_reason("ssl_ctx")); close(); return false; }
  SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
  SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
    err.set(ErrorCode::NetworkError, ssl_reason("ssl_trust_store"));
    close();
    return false;
  }

  ssl_ = SSL_new(ctx_);
  if (!ssl_) { err.set(ErrorCode::NetworkError, ssl_reason("ssl_new")); close(); return false; }
  SSL_set_tlsext_host_name(ssl_, url.host.c_str());
  SSL_set1_host(ssl_, url.host.c_str());
  SSL_set_fd(ssl_, fd_);

  for (;;) {
    const int r = SSL_connect(ssl_);
    if (r == 1) return true;
    const int e = SSL_get_error(ssl_, r);
    if (e != SSL_ERROR_WANT_READ && e != SSL_ERROR_WANT_WRITE) {
      err.set(ErrorCode::NetworkError, ssl_reason("tls_handshake"));
      close();
      return false;
    }
    if (!wait_fd(e == SSL_ERROR_WANT_WRITE, remaining(deadline), err)) {
      err.reason = "tls_handshake: " + err.reason;
      close();
      return false;
    }
  }
}

bool TlsStream::write_all(const uint8_t* data, size_t len, uint32_t timeout_ms, Error& err) {
  if (fd_ < 0) { err.set(ErrorCode::NetworkError, "not_connected"); return false; }
  const uint64_t deadline = mono_ms() + timeout_ms;
  size_t sent = 0;

  while (sent < len) {
    if (ssl_) {
      const int w = SSL_write(ssl_, data + sent, static_cast<int>(len - sent));
      if (w > 0) { sent += static_cast<size_t>(w); continue; }
      const int e = SSL_get_error(ssl_, w);
      if (e != SSL_ERROR_WANT_READ && e != SSL_ERROR_WANT_WRITE) {
        err.set(ErrorCode::NetworkError, ssl_reason("tls_write"));
        return false;
      }
      if (!wait_fd(e == SSL_ERROR_WANT_WRITE, remaining(deadline), err)) return false;
    } else {
      const ssize_t w = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
      if (w > 0) { sent += static_cast<size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        if (!wait_fd(true, remaining(deadline), err)) return false;
        continue;
      }
      err.set(ErrorCode::NetworkError, std::string("send: ") + std::strerror(errno));
      return false;
    }
  }
  return true;
}

RxResult TlsStream::read_some(uint8_t* out, size_t cap, size_t& n, uint32_t timeout_ms, Error& err) {
  n = 0;
  if (fd_ < 0) { err.set(ErrorCode::NetworkError, "not_connected"); return RxResult::Error; }
  const uint64_t deadline = mono_ms() + timeout_ms;

  for (;;) {
    if (ssl_) {
      const int r = SSL_read(ssl_, out, static_cast<int>(cap));
      if (r > 0) { n = static_cast<size_t>(r); return RxResult::Ok; }
      const int e = SSL_get_error(ssl_, r);
      if (e == SSL_ERROR_ZERO_RETURN) return RxResult::Closed;
      if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
        Error werr;
        if (!wait_fd(e == SSL_ERROR_WANT_WRITE, remaining(deadline), werr)) {
          if (werr.reason == "timeout") return RxResult::None;
          err = werr;
          return RxResult::Error;
        }
        continue;
      }
      // Peers that drop TCP without close_notify land here as SYSCALL with no queue entry.
      if (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return RxResult::Closed;
      err.set(ErrorCode::NetworkError, ssl_reason("tls_read"));
      return RxResult::Error;
    }

    const ssize_t r = ::recv(fd_, out, cap, 0);
    if (r > 0) { n = static_cast<size_t>(r); return RxResult::Ok; }
    if (r == 0) return RxResult::Closed;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      Error werr;
      if (!wait_fd(false, remaining(deadline), werr)) {
        if (werr.reason == "timeout") return RxResult::None;
        err = werr;
        return RxResult::Error;
      }
      continue;
    }
    err.set(ErrorCode::NetworkError, std::string("recv: ") + std::strerror(errno));
    return RxResult::Error;
  }
}

void TlsStream::close() {
  if (ssl_) {
    SSL_shutdown(ssl_);   // best effort close_notify; the socket goes away regardless
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ctx_) { SSL_CTX_free(ctx_); ctx_ = nullptr; }
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  ERR_clear_error();
}

} // namespace pushwire::transport
