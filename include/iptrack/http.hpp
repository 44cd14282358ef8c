#pragma once

/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 message types and text helpers for iptrackd.
 * @details
 *   iptrackd speaks just enough HTTP/1.1 for the reporting agent (curl) and
 *   a browser:
 *     - one request per connection, answered with `Connection: close`;
 *     - bodies delimited by Content-Length only (no chunked uploads);
 *     - header names are matched case-insensitively (stored lower-case).
 *
 *   Everything here is socket-free so routing can be tested with plain
 *   strings; http_server.hpp owns the Boost.Asio side.
 */

#include <cstddef>
#include <map>
#include <string>

namespace iptrack {
namespace http {

/// Upper bound for the request line plus headers.
inline constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;
/// Upper bound for a request body.
inline constexpr std::size_t MAX_BODY_BYTES = 1024 * 1024;

struct Request {
    std::string method;                          ///< "GET", "POST", ...
    std::string target;                          ///< raw request-target, e.g. "/ssh-command?hostname=a"
    std::string path;                            ///< percent-decoded path component
    std::string query;                           ///< raw query string without '?'
    std::map<std::string, std::string> headers;  ///< lower-case name -> value
    std::string body;
    std::string remote_address;                  ///< peer "ip:port", filled by the server

    /** @brief Header value or empty string. @p name must be lower-case. */
    std::string header(const std::string& name) const;
};

struct Response {
    int         status = 200;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
};

/**
 * @brief Parse the request line and headers (everything before the blank line).
 * @param head  Raw bytes up to, and optionally including, "\r\n\r\n".
 * @param out   method/target/path/query/headers are filled on success.
 * @param err   Reason on failure.
 */
bool parse_request_head(const std::string& head, Request& out, std::string& err);

/**
 * @brief Content-Length of @p req, 0 when absent.
 * @return false when the header is present but not a plain decimal number.
 */
bool content_length(const Request& req, std::size_t& out);

/**
 * @brief Decode %XX escapes. With @p plus_as_space, '+' becomes ' ' (form encoding).
 * Malformed escapes are kept literally.
 */
std::string url_decode(const std::string& text, bool plus_as_space);

/** @brief Parse "a=1&b=2" into a map. The first occurrence of a key wins. */
std::map<std::string, std::string> parse_form(const std::string& encoded);

/**
 * @brief First value of form field @p key.
 *
 * For url-encoded POST bodies the body is consulted first, then the query
 * string, mirroring what HTML forms and curl -d produce.
 */
std::string form_value(const Request& req, const std::string& key);

/** @brief Reason phrase for a status code ("Not Found", ...). */
const char* status_text(int status);

/** @brief Plain-text error reply: body is @p message plus a newline. */
Response error(int status, const std::string& message);

/** @brief Serialize @p resp as a complete HTTP/1.1 message with Connection: close. */
std::string serialize(const Response& resp);

} // namespace http
} // namespace iptrack
