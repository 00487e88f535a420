#include "ErrorResponseBuilder.hpp"
#include <sstream>

// ====================================================================================================
// Public Methods - Canned Responses
// ====================================================================================================

const std::string& ErrorResponseBuilder::connectionEstablished() {
    static const std::string line = "HTTP/1.1 200 Connection Established\r\n\r\n";
    return line;
}

const std::string& ErrorResponseBuilder::build403Forbidden() {
    static const std::string response =
        "HTTP/1.1 403 Forbidden\r\n"
        "Content-Type: text/html\r\n\r\n"
        "<html><head><title>403 Forbidden</title></head><body><h1>403 Forbidden</h1>"
        "<p>This page has been blocked by the proxy server.</p></body></html>";
    return response;
}

std::string ErrorResponseBuilder::build502BadGateway(const std::string& reason) {
    std::string message = "The proxy server could not connect to the destination server.";
    if (!reason.empty()) {
        message += " Reason: " + htmlEscape(reason);
    }

    std::string body =
        "<html><head><title>502 Bad Gateway</title></head><body><h1>502 Bad Gateway</h1><p>" +
        message + "</p></body></html>";

    std::ostringstream response;
    response << "HTTP/1.1 502 Bad Gateway\r\n"
             << "Content-Type: text/html\r\n"
             << "Content-Length: " << body.size() << "\r\n"
             << "Connection: close\r\n"
             << "\r\n"
             << body;

    return response.str();
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::string ErrorResponseBuilder::htmlEscape(const std::string& text) {
    std::ostringstream escaped;

    for (char c : text) {
        switch (c) {
            case '<':
                escaped << "&lt;";
                break;
            case '>':
                escaped << "&gt;";
                break;
            case '&':
                escaped << "&amp;";
                break;
            case '"':
                escaped << "&quot;";
                break;
            case '\'':
                escaped << "&#39;";
                break;
            default:
                escaped << c;
                break;
        }
    }

    return escaped.str();
}
