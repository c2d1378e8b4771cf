#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

namespace binio {

void Logger::initialize(const std::string& log_file, LogLevel min_level) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (initialized_) {
            return;
        }

        log_file_.open(log_file, std::ios::app);
        if (!log_file_) {
            std::cerr << "Failed to open log file: " << log_file << std::endl;
            return;
        }

        min_level_.store(min_level, std::memory_order_relaxed);
        initialized_.store(true, std::memory_order_release);
    }

    info("Logging initialized at level {}", level_to_string(min_level));
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string Logger::format_time() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms;
    return ss.str();
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

} // namespace binio
