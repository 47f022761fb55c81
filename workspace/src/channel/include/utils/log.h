#ifndef VTCTL_UTILS_LOG_H
#define VTCTL_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <string>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace vtctl {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DVTCTL_LOG_LEVEL_DEFAULT=::vtctl::utils::LogLevel::INFO
#ifndef VTCTL_LOG_LEVEL_DEFAULT
    #define VTCTL_LOG_LEVEL_DEFAULT ::vtctl::utils::LogLevel::INFO
#endif

// Global maximum log level - logs below this level are suppressed.
// Shared by every translation unit so the CLI and config can change it at runtime.
inline LogLevel g_max_log_level = VTCTL_LOG_LEVEL_DEFAULT;

inline void setLogLevel(LogLevel level) {
    g_max_log_level = level;
}

inline LogLevel getLogLevel() {
    return g_max_log_level;
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as found in configuration files
 *
 * Accepts the names printed by logLevelToString() in any case, plus "warn".
 *
 * @param name Level name
 * @param level Receives the parsed level on success
 * @return true if the name was recognized
 */
inline bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "VERBOSE" || upper == "TRACE") { level = LogLevel::VERBOSE; return true; }
    if (upper == "DEBUG")                       { level = LogLevel::DEBUG;   return true; }
    if (upper == "INFO")                        { level = LogLevel::INFO;    return true; }
    if (upper == "WARNING" || upper == "WARN")  { level = LogLevel::WARNING; return true; }
    if (upper == "ERROR")                       { level = LogLevel::ERROR;   return true; }
    if (upper == "FATAL")                       { level = LogLevel::FATAL;   return true; }
    return false;
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            filename = p + 1;
        }
    }
    return filename;
}

// Serializes whole lines; the control, writer and I/O threads all log.
inline std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < g_max_log_level) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    std::lock_guard<std::mutex> lock(logMutex());
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

} // namespace utils
} // namespace vtctl

/**
 * @brief Log Level Filtering
 *
 * Usage:
 * 1. Set log level at compile time (in CMakeLists.txt):
 *    add_compile_definitions(VTCTL_LOG_LEVEL_DEFAULT=::vtctl::utils::LogLevel::DEBUG)
 *
 * 2. Set log level at runtime:
 *    vtctl::utils::setLogLevel(vtctl::utils::LogLevel::WARNING);
 *
 * 3. From a configuration string:
 *    vtctl::utils::LogLevel level;
 *    if (vtctl::utils::parseLogLevel("debug", level)) vtctl::utils::setLogLevel(level);
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

// Log macros
#define LOGV(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::vtctl::utils::log(::vtctl::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Formatted log macros (stream-style formatting)
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // VTCTL_UTILS_LOG_H
