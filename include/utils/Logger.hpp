#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <iomanip>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace DmrScan {
namespace Utils {

/**
 * @brief Singleton Logger class for consistent debug output.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const;

    /**
     * @brief Also append messages (without colors) to @p filename.
     *
     * @throws std::runtime_error if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);

    /// ANSI colors on the console; defaults to on when stderr is a terminal.
    void set_color(bool enabled);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool use_color_ = true;
    std::ofstream log_file_;
    std::mutex mutex_;

    std::string level_to_string(LogLevel level);
    std::string get_color_code(LogLevel level);
    std::string reset_color_code();
};

/**
 * @brief RAII helper to log start and end of a scope/action.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace DmrScan

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) DmrScan::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) DmrScan::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) DmrScan::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) DmrScan::Utils::Logger::error(msg, __FILE__, __LINE__)
