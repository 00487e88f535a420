#ifndef ERROR_RESPONSE_BUILDER_HPP
#define ERROR_RESPONSE_BUILDER_HPP

#include <string>

/**
 * ErrorResponseBuilder - Canned responses the proxy produces itself
 */
class ErrorResponseBuilder {
public:
    /**
     * Status line sent to a client once its CONNECT tunnel is ready
     */
    static const std::string& connectionEstablished();

    /**
     * Build 403 Forbidden response
     * Used when the requested target is on the block list. The bytes are
     * fixed: clients and tests compare them verbatim.
     *
     * @return Complete HTTP response (headers + body)
     */
    static const std::string& build403Forbidden();

    /**
     * Build 502 Bad Gateway response
     * Used when proxy cannot connect to the origin server
     *
     * @param reason Optional reason for failure
     * @return Complete HTTP response (headers + body)
     */
    static std::string build502BadGateway(const std::string& reason = "");

private:
    /**
     * HTML escape a string to prevent XSS
     * Converts: < > & " ' to their HTML entities
     */
    static std::string htmlEscape(const std::string& text);
};

#endif // ERROR_RESPONSE_BUILDER_HPP
