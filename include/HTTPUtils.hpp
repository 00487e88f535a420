#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <chrono>
#include <string>
#include <string_view>

/**
 * http_utils - Stateless helpers over raw HTTP text already read from a socket
 *
 * None of these functions perform I/O. Requests and responses are carried
 * around as std::string, which holds arbitrary bytes.
 */
namespace http_utils {

/**
 * Extract the request-line target (second token of the first line)
 *
 * "GET /index.html HTTP/1.1\r\n..." -> "/index.html"
 *
 * @param request Raw request text
 * @return Target exactly as sent by the client
 * @throws ParseError if the first line has fewer than two tokens
 */
std::string extractTarget(std::string_view request);

/**
 * Extract the request method (first token of the first line)
 *
 * @param request Raw request text
 * @return Method string, or empty string if the first line is blank
 */
std::string extractMethod(std::string_view request);

/**
 * Extract the destination host from the Host header (case-insensitive)
 *
 * Any ":port" suffix is dropped. Falls back to "localhost" when the
 * request carries no Host header.
 *
 * @param request Raw request text
 * @return Host name without port
 */
std::string extractHost(std::string_view request);

/**
 * Extract the status code token from a response status line
 *
 * @param response Raw response bytes
 * @return e.g. "304", or empty string if there is no status token
 */
std::string extractStatusCode(std::string_view response);

/**
 * Extract the Last-Modified header value (case-insensitive)
 *
 * A response without Last-Modified is treated as modified now: the
 * current time is returned as an HTTP-date.
 *
 * @param response Raw response bytes
 * @return Header value or the current HTTP-date
 */
std::string extractLastModified(std::string_view response);

/** Format a time point as "%a, %d %b %Y %H:%M:%S GMT" */
std::string formatHttpDate(std::chrono::system_clock::time_point when);

/**
 * Build the conditional GET used to revalidate a cached target
 *
 * @param target Cached request-line target
 * @param host Origin host for the Host header
 * @param last_modified Stored Last-Modified marker
 * @return Complete request text terminated by an empty line
 */
std::string buildConditionalGet(std::string_view target,
                                std::string_view host,
                                std::string_view last_modified);

} // namespace http_utils

#endif // HTTP_UTILS_HPP
