#include "ErrorResponseBuilder.hpp"

#include <gtest/gtest.h>

TEST(ErrorResponseBuilderTest, ForbiddenBytesAreFixed) {
    EXPECT_EQ(ErrorResponseBuilder::build403Forbidden(),
              "HTTP/1.1 403 Forbidden\r\n"
              "Content-Type: text/html\r\n\r\n"
              "<html><head><title>403 Forbidden</title></head><body><h1>403 Forbidden</h1>"
              "<p>This page has been blocked by the proxy server.</p></body></html>");
}

TEST(ErrorResponseBuilderTest, ConnectionEstablishedLine) {
    EXPECT_EQ(ErrorResponseBuilder::connectionEstablished(),
              "HTTP/1.1 200 Connection Established\r\n\r\n");
}

TEST(ErrorResponseBuilderTest, BadGatewayHasMatchingContentLength) {
    std::string response = ErrorResponseBuilder::build502BadGateway("cannot reach origin:80");

    ASSERT_EQ(response.rfind("HTTP/1.1 502 Bad Gateway\r\n", 0), 0u);
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos);

    size_t header_end = response.find("\r\n\r\n");
    ASSERT_NE(header_end, std::string::npos);
    std::string body = response.substr(header_end + 4);
    EXPECT_NE(response.find("Content-Length: " + std::to_string(body.size()) + "\r\n"), std::string::npos);
    EXPECT_NE(body.find("cannot reach origin:80"), std::string::npos);
}

TEST(ErrorResponseBuilderTest, BadGatewayEscapesReason) {
    std::string response = ErrorResponseBuilder::build502BadGateway("<script>\"x\" & 'y'</script>");
    EXPECT_EQ(response.find("<script>"), std::string::npos);
    EXPECT_NE(response.find("&lt;script&gt;&quot;x&quot; &amp; &#39;y&#39;&lt;/script&gt;"), std::string::npos);
}
