#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <memory>
#include <vector>
#include <chrono>
#include <iomanip>

namespace fleetcam::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level);
bool parseLogLevel(std::string_view name, LogLevel& level);

// Satu baris log yang sudah diformat
struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
};

class ConsoleSink : public ILogSink {
public:
    void write(const LogMessage& msg) override;
};

class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    void write(const LogMessage& msg) override;
    bool isOpen() const { return file_.is_open(); }

private:
    std::ofstream file_;
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Console sink terpasang secara default; resetSinks() mengembalikannya
    static void addSink(std::shared_ptr<ILogSink> sink);
    static void removeSink(const std::shared_ptr<ILogSink>& sink);
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
    template<typename... Args>
    static std::string format(const std::string& format, Args&&... args) {
        return formatString(format, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static std::vector<std::shared_ptr<ILogSink>> sinks_;

    static std::string timestamp();
    static void dispatch(LogLevel level, std::string message);

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < getLevel()) return;
        dispatch(level, formatString(format, std::forward<Args>(args)...));
    }

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
            std::string partial = format;
            partial.replace(pos, 2, oss.str());
            // Continue after the substituted text so "{}" inside values is kept
            std::string head = partial.substr(0, pos + oss.str().size());
            return head + formatString(partial.substr(head.size()), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace fleetcam::core
