#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <mutex>
#include <memory>
#include <vector>
#include <fstream>
#include <optional>

namespace liveview::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level) noexcept;
std::optional<LogLevel> parseLogLevel(std::string_view name);

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
};

// Default sink, satu baris per pesan ke stdout
class ConsoleSink : public LogSink {
public:
    void write(const LogMessage& msg) override;
};

class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    void write(const LogMessage& msg) override;

private:
    std::ofstream file_;
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void addSink(std::shared_ptr<LogSink> sink);
    static void clearSinks();
    // Back to a single ConsoleSink.
    static void resetSinks();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    // Simple format string implementation
    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string head = format.substr(0, pos) + oss.str();
            return head + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }

private:
    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < getLevel()) return;
        dispatch(level, formatString(format, std::forward<Args>(args)...));
    }

    static void dispatch(LogLevel level, std::string message);
    static std::string timestamp();
};

} // namespace liveview::core
