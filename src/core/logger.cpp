#include "fleetcam/core/logger.hpp"

#include <algorithm>
#include <ctime>

namespace fleetcam::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;
std::vector<std::shared_ptr<ILogSink>> Logger::sinks_ = {std::make_shared<ConsoleSink>()};

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

bool parseLogLevel(std::string_view name, LogLevel& level) {
    if (name == "debug") { level = LogLevel::DEBUG; return true; }
    if (name == "info")  { level = LogLevel::INFO;  return true; }
    if (name == "warn" || name == "warning") { level = LogLevel::WARN; return true; }
    if (name == "error") { level = LogLevel::ERROR; return true; }
    return false;
}

void ConsoleSink::write(const LogMessage& msg) {
    std::cout << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
              << msg.message << std::endl;
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::app) {
}

void FileSink::write(const LogMessage& msg) {
    if (!file_) return;
    file_ << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
          << msg.message << '\n';
    file_.flush();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::resetSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::dispatch(LogLevel level, std::string message) {
    LogMessage msg{level, timestamp(), std::move(message)};

    // Sinks dipanggil di bawah lock supaya baris log tidak saling bertumpuk
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(msg);
    }
}

} // namespace fleetcam::core
