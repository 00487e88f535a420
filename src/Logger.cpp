#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>

#include <string>

// Sanitize a log line (trim CRLF, keep printable ASCII/whitespace, redact Basic auth, cap length)
static std::string sanitize_http_line(std::string s) {
    // Trim at first CRLF
    if (auto p = s.find("\r\n"); p != std::string::npos)
        s.erase(p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
    }

    auto redact = [&](const char* key){
        std::string k = key;
        auto pos = out.find(k);
        if (pos != std::string::npos) {
            auto val_start = pos + k.size();
            while (val_start < out.size() &&
                   (out[val_start] == ' ' || out[val_start] == '\t'))
                ++val_start;
            out.replace(val_start, out.size() - val_start, "[REDACTED]");
        }
    };
    redact("Authorization: Basic");
    redact("Proxy-Authorization: Basic");

    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}

std::string formatLogRecord(const LogRecord& record) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(record.time);
    return fmt::format("{:%Y-%m-%d %H:%M:%S} [{}]: {}", seconds, record.clientID, record.message);
}

// ====================================================================================================
// Sinks
// ====================================================================================================

void ConsoleLogSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << formatLogRecord(record) << std::endl;
}

FileLogSink::FileLogSink(std::string path) : path(std::move(path)) {
    // Ensure the log directory exists (safe if it already exists)
    std::error_code ec;
    auto parent = std::filesystem::path(this->path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
}

void FileLogSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex); //Guard concurrent appends.

    std::ofstream out(path, std::ios::app);
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << path << "\n";
        return;
    }
    out << formatLogRecord(record) << '\n';
}

CallbackLogSink::CallbackLogSink(Callback callback) : callback(std::move(callback)) {}

void CallbackLogSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex);
    callback(formatLogRecord(record));
}

TeeLogSink::TeeLogSink(std::vector<std::shared_ptr<LogSink>> sinks) : sinks(std::move(sinks)) {}

void TeeLogSink::write(const LogRecord& record) {
    for (auto& sink : sinks) {
        sink->write(record);
    }
}

// ====================================================================================================
// Logger
// ====================================================================================================

Logger::Logger(std::string clientID, LogSink& sink)
    : clientID(std::move(clientID)), sink(sink) {}

void Logger::emit(std::string message){
    sink.write(LogRecord{std::chrono::system_clock::now(), clientID, std::move(message)});
}

void Logger::logRequest(const std::string& request){
    emit("Request: " + sanitize_http_line(request));
}

void Logger::logResponse(const std::string& response){
    emit("Response: " + sanitize_http_line(response));
}

void Logger::logTunnelEstablished(const std::string& host, int port){
    emit(fmt::format("Tunnel established to {}:{}", host, port));
}

void Logger::logConnectionOpened(const std::string& peer){
    emit("Accepted connection: " + peer);
}

void Logger::logConnectionClosed(const std::string& peer){
    emit("Closed connection: " + peer);
}

void Logger::logCacheSaving(double secondsSaved){
    emit(fmt::format("Saved {:.6f}s by caching", secondsSaved));
}

void Logger::logCustomMsg(const std::string& entry){
    emit(entry);
}
