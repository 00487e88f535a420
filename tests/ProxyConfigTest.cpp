#include "ProxyConfig.hpp"

#include <gtest/gtest.h>

#include <iterator>
#include <stdexcept>

TEST(ProxyConfigTest, Defaults) {
    const char* argv[] = {"cacheproxy"};
    ProxyConfig config = ProxyConfig::parseArgs(1, argv);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 4000);
    EXPECT_EQ(config.backlog, 10);
    EXPECT_EQ(config.buffer_size, 8192u);
    EXPECT_EQ(config.http_port, 80);
    EXPECT_EQ(config.https_port, 443);
    EXPECT_EQ(config.max_connections, 0u);
    EXPECT_TRUE(config.blocklist_file.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_TRUE(config.console);
}

TEST(ProxyConfigTest, ParsesAllOptions) {
    const char* argv[] = {"cacheproxy",
                          "--host", "0.0.0.0",
                          "--port", "8080",
                          "--backlog", "64",
                          "--buffer", "4096",
                          "--http-port", "8000",
                          "--https-port", "8443",
                          "--max-connections", "32",
                          "--blocklist", "blocked.txt",
                          "--log-file", "logs/proxy.log",
                          "--no-console"};
    ProxyConfig config = ProxyConfig::parseArgs(static_cast<int>(std::size(argv)), argv);

    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.backlog, 64);
    EXPECT_EQ(config.buffer_size, 4096u);
    EXPECT_EQ(config.http_port, 8000);
    EXPECT_EQ(config.https_port, 8443);
    EXPECT_EQ(config.max_connections, 32u);
    EXPECT_EQ(config.blocklist_file, "blocked.txt");
    EXPECT_EQ(config.log_file, "logs/proxy.log");
    EXPECT_FALSE(config.console);
}

TEST(ProxyConfigTest, RejectsBadNumbers) {
    const char* not_a_number[] = {"cacheproxy", "--port", "http"};
    EXPECT_THROW(ProxyConfig::parseArgs(3, not_a_number), std::invalid_argument);

    const char* trailing[] = {"cacheproxy", "--port", "80x"};
    EXPECT_THROW(ProxyConfig::parseArgs(3, trailing), std::invalid_argument);

    const char* out_of_range[] = {"cacheproxy", "--port", "70000"};
    EXPECT_THROW(ProxyConfig::parseArgs(3, out_of_range), std::invalid_argument);

    const char* zero_buffer[] = {"cacheproxy", "--buffer", "0"};
    EXPECT_THROW(ProxyConfig::parseArgs(3, zero_buffer), std::invalid_argument);
}

TEST(ProxyConfigTest, RejectsUnknownOptionAndMissingValue) {
    const char* unknown[] = {"cacheproxy", "--verbose", "1"};
    EXPECT_THROW(ProxyConfig::parseArgs(3, unknown), std::invalid_argument);

    const char* missing[] = {"cacheproxy", "--port"};
    EXPECT_THROW(ProxyConfig::parseArgs(2, missing), std::invalid_argument);
}

TEST(ProxyConfigTest, UsageMentionsOptions) {
    std::string usage = ProxyConfig::usage("cacheproxy");
    EXPECT_NE(usage.find("--blocklist"), std::string::npos);
    EXPECT_NE(usage.find("--max-connections"), std::string::npos);
}
