#include "liveview/core/logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace liveview::core {

namespace {

std::atomic<LogLevel> current_level{LogLevel::INFO};

struct SinkRegistry {
    std::mutex mutex;
    std::vector<std::shared_ptr<LogSink>> sinks{std::make_shared<ConsoleSink>()};
};

SinkRegistry& registry() {
    static SinkRegistry instance;
    return instance;
}

} // namespace

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void ConsoleSink::write(const LogMessage& msg) {
    std::cout << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
              << msg.message << std::endl;
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::app) {}

void FileSink::write(const LogMessage& msg) {
    if (!file_) return;
    file_ << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
          << msg.message << '\n';
    file_.flush();
}

void Logger::setLevel(LogLevel level) {
    current_level.store(level);
}

LogLevel Logger::getLevel() {
    return current_level.load();
}

void Logger::addSink(std::shared_ptr<LogSink> sink) {
    if (!sink) return;
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.sinks.push_back(std::move(sink));
}

void Logger::clearSinks() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.sinks.clear();
}

void Logger::resetSinks() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.sinks.clear();
    reg.sinks.push_back(std::make_shared<ConsoleSink>());
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::dispatch(LogLevel level, std::string message) {
    LogMessage msg{level, timestamp(), std::move(message)};

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (const auto& sink : reg.sinks) {
        sink->write(msg);
    }
}

} // namespace liveview::core
