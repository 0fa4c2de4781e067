/**
 * @file http.hpp
 * @brief One-shot HTTP/1.1 requests for the relay's REST endpoint.
 *
 * @details
 * Each call opens its own connection (`Connection: close`), sends one request,
 * reads one response and closes. The relay API is a handful of small JSON
 * calls per signal, so connection reuse is not worth the state.
 *
 * Response bodies are decoded for Content-Length, chunked transfer encoding
 * and read-until-EOF. `parse_http_response()` is separate from the socket so
 * it can be tested on canned bytes.
 */
#ifndef PUSHWIRE_HTTP_HPP
#define PUSHWIRE_HTTP_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "pushwire/errors.hpp"

namespace pushwire::http {

struct Request {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct Response {
  int status{0};
  std::map<std::string, std::string> headers;   ///< Keys lowercased.
  std::string body;
};

/// application/x-www-form-urlencoded body from key/value pairs.
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

/// Percent-encode everything except unreserved characters (RFC 3986).
std::string url_encode(const std::string& text);

/**
 * @brief Parse a complete raw response (status line, headers, body).
 *
 * @p raw must hold everything the server sent up to EOF. Returns false with
 * ProtocolError on a malformed status line, headers or chunk framing.
 */
bool parse_http_response(const std::string& raw, Response& out, Error& err);

/**
 * @brief Send @p req and wait for the full response.
 *
 * Transport failures and timeouts are NetworkError. A parsed response is
 * success regardless of status code; callers map statuses themselves.
 */
bool perform(const Request& req, uint32_t timeout_ms, Response& out, Error& err);

} // namespace pushwire::http

#endif // PUSHWIRE_HTTP_HPP
