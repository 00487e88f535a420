#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "Logger.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * TestOrigin - Scripted origin server on 127.0.0.1 with an ephemeral port
 *
 * Each accepted connection gets the next scripted response (the last one
 * repeats). The origin reads the request up to the blank line (or EOF),
 * records it, writes the response and closes.
 */
class TestOrigin {
public:
    struct Options {
        // Send the response in two halves with a pause in between
        bool split_response = false;
        // After responding, keep the connection open until the peer closes it
        bool hold_open = false;
    };

    explicit TestOrigin(std::vector<std::string> responses);
    TestOrigin(std::vector<std::string> responses, Options options);
    ~TestOrigin();

    TestOrigin(const TestOrigin&) = delete;
    TestOrigin& operator=(const TestOrigin&) = delete;

    int port() const { return listen_port; }

    std::vector<std::string> requests() const;
    size_t connectionCount() const;

private:
    std::vector<std::string> responses;
    Options options;

    int listen_fd = -1;
    int listen_port = 0;
    std::atomic<bool> stopping{false};
    std::thread worker;

    mutable std::mutex mutex;
    std::vector<std::string> received;

    void run();
    void serveOne(int fd, const std::string& response);
};

/** Collects every record written to it */
class CapturingLogSink : public LogSink {
public:
    void write(const LogRecord& record) override;

    std::vector<std::string> messages() const;
    bool contains(const std::string& fragment) const;

private:
    mutable std::mutex mutex;
    std::vector<LogRecord> records;
};

/** Port on 127.0.0.1 that nothing listens on */
int unusedPort();

/** Read from fd until EOF */
std::string readAll(int fd);

/** Read exactly n bytes from fd (fewer if EOF comes first) */
std::string readExactly(int fd, size_t n);

/** Write all of data to fd */
void writeAll(int fd, const std::string& data);

/** Connect to 127.0.0.1:port, -1 on failure */
int connectLoopback(int port);

#endif // TEST_SUPPORT_HPP
