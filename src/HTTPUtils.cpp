#include "HTTPUtils.hpp"
#include "ProxyErrors.hpp"
#include "StringUtils.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

using namespace utils;

namespace http_utils {

namespace {

std::string_view firstLine(std::string_view text) {
    size_t eol = text.find("\r\n");
    return eol == std::string_view::npos ? text : text.substr(0, eol);
}

// Value of the first line starting with "<name>:", compared case-insensitively.
// found is false when no such line exists.
std::string headerValue(std::string_view text, std::string_view name, bool& found) {
    std::string prefix = std::string{name} + ":";

    for (std::string_view line : split(text, "\r\n")) {
        if (startsWithIgnoreCase(line, prefix)) {
            found = true;
            return trim(line.substr(prefix.size()));
        }
    }

    found = false;
    return "";
}

} // namespace

std::string extractTarget(std::string_view request) {
    auto tokens = splitWhitespace(firstLine(request));
    if (tokens.size() < 2) {
        throw ParseError("malformed request line: '" + std::string{firstLine(request)} + "'");
    }
    return std::string{tokens[1]};
}

std::string extractMethod(std::string_view request) {
    auto tokens = splitWhitespace(firstLine(request));
    if (tokens.empty()) {
        return "";
    }
    return std::string{tokens[0]};
}

std::string extractHost(std::string_view request) {
    bool found = false;
    std::string host = headerValue(request, "Host", found);
    if (!found) {
        return "localhost";
    }

    // Drop the port, if any (e.g. "example.com:8080")
    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        return trim(std::string_view{host}.substr(0, colon));
    }
    return host;
}

std::string extractStatusCode(std::string_view response) {
    auto tokens = splitWhitespace(firstLine(response));
    if (tokens.size() < 2) {
        return "";
    }
    return std::string{tokens[1]};
}

std::string extractLastModified(std::string_view response) {
    bool found = false;
    std::string value = headerValue(response, "Last-Modified", found);
    if (!found) {
        return formatHttpDate(std::chrono::system_clock::now());
    }
    return value;
}

std::string formatHttpDate(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    return fmt::format("{:%a, %d %b %Y %H:%M:%S} GMT", fmt::gmtime(t));
}

std::string buildConditionalGet(std::string_view target,
                                std::string_view host,
                                std::string_view last_modified) {
    return fmt::format("GET {} HTTP/1.1\r\n"
                       "Host: {}\r\n"
                       "If-Modified-Since: {}\r\n"
                       "\r\n",
                       target, host, last_modified);
}

} // namespace http_utils
