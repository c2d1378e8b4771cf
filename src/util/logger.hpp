#pragma once
#include <string>
#include <sstream>
#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>

namespace binio {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Opens log_file in append mode. Messages below min_level are dropped,
    // as is everything logged before initialization.
    void initialize(const std::string& log_file, LogLevel min_level = LogLevel::INFO);

    bool is_enabled(LogLevel level) const {
        return initialized_.load(std::memory_order_acquire) &&
               level >= min_level_.load(std::memory_order_relaxed);
    }

    template<typename... Args>
    void debug(const char* fmt, const Args&... args) {
        log(LogLevel::DEBUG, fmt, args...);
    }

    template<typename... Args>
    void info(const char* fmt, const Args&... args) {
        log(LogLevel::INFO, fmt, args...);
    }

    template<typename... Args>
    void warn(const char* fmt, const Args&... args) {
        log(LogLevel::WARN, fmt, args...);
    }

    template<typename... Args>
    void error(const char* fmt, const Args&... args) {
        log(LogLevel::ERROR, fmt, args...);
    }

    template<typename... Args>
    void fatal(const char* fmt, const Args&... args) {
        log(LogLevel::FATAL, fmt, args...);
    }

    static const char* level_to_string(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    template<typename... Args>
    void log(LogLevel level, const char* fmt, const Args&... args) {
        if (!is_enabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        std::stringstream ss;
        ss << format_time() << " [" << level_to_string(level) << "] ";

        // Substitute each {} in order
        std::string msg = fmt;
        int unpack[] = {0, ((void)format_arg(ss, msg, args), 0)...};
        (void)unpack;

        ss << msg << std::endl;

        log_file_ << ss.str();
        log_file_.flush();

        // Also output to stderr for ERROR and FATAL
        if (level >= LogLevel::ERROR) {
            std::cerr << ss.str();
        }
    }

    template<typename T>
    static void format_arg(std::stringstream& ss, std::string& fmt, const T& arg) {
        size_t pos = fmt.find("{}");
        if (pos != std::string::npos) {
            ss << fmt.substr(0, pos) << arg;
            fmt = fmt.substr(pos + 2);
        }
    }

    std::string format_time();

    std::mutex mutex_;
    std::ofstream log_file_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::atomic<bool> initialized_{false};
};

// Helper macros
#define BINIO_LOG_DEBUG(...) ::binio::Logger::instance().debug(__VA_ARGS__)
#define BINIO_LOG_INFO(...)  ::binio::Logger::instance().info(__VA_ARGS__)
#define BINIO_LOG_WARN(...)  ::binio::Logger::instance().warn(__VA_ARGS__)
#define BINIO_LOG_ERROR(...) ::binio::Logger::instance().error(__VA_ARGS__)
#define BINIO_LOG_FATAL(...) ::binio::Logger::instance().fatal(__VA_ARGS__)

} // namespace binio
