#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct LogRecord {
    std::chrono::system_clock::time_point time;
    std::string clientID;   // "server" for listener events
    std::string message;
};

// Render a record as "YYYY-MM-DD HH:MM:SS [client]: message"
std::string formatLogRecord(const LogRecord& record);

class LogSink {
    public:
        virtual ~LogSink() = default;
        virtual void write(const LogRecord& record) = 0;
};

// Default sink: one line per record on stdout
class ConsoleLogSink : public LogSink {
    public:
        void write(const LogRecord& record) override;
    private:
        std::mutex mutex;
};

// Appends to a log file shared by all connections
class FileLogSink : public LogSink {
    public:
        explicit FileLogSink(std::string path);
        void write(const LogRecord& record) override;
    private:
        std::string path;
        std::mutex mutex;
};

// Hands every formatted line to an onLog(message) callback
class CallbackLogSink : public LogSink {
    public:
        using Callback = std::function<void(const std::string&)>;
        explicit CallbackLogSink(Callback callback);
        void write(const LogRecord& record) override;
    private:
        Callback callback;
        std::mutex mutex;
};

// Fans a record out to several sinks
class TeeLogSink : public LogSink {
    public:
        explicit TeeLogSink(std::vector<std::shared_ptr<LogSink>> sinks);
        void write(const LogRecord& record) override;
    private:
        std::vector<std::shared_ptr<LogSink>> sinks;
};

class Logger {
    public:
        Logger(std::string clientID, LogSink& sink);
        void logRequest(const std::string& request); //Log the request line
        void logResponse(const std::string& response); //Log the status line
        void logTunnelEstablished(const std::string& host, int port); //Log tunnel establishment
        void logConnectionOpened(const std::string& peer); //Log accepted connection
        void logConnectionClosed(const std::string& peer); //Log connection closure
        void logCacheSaving(double secondsSaved); //Log time saved by a cache hit
        void logCustomMsg(const std::string& entry); //Log custom message
    private:
        std::string clientID;
        LogSink& sink;
        void emit(std::string message);
};

#endif // LOGGER_HPP
