// ====================================================================================
// schem - Logging
//
// Process-wide leveled logger. Console lines look like
//   14:02:11.042 [DEBUG] [Transport] gzip envelope: 5121 -> 2097412 bytes
// and can be mirrored to an append-mode log file.
// ====================================================================================

#ifndef SCHEM_LOGGING_H_
#define SCHEM_LOGGING_H_

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace schem::logging {

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

const char* LogLevelName(LogLevel level);
std::optional<LogLevel> ParseLogLevel(std::string_view text);

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    std::string log_file;          // empty: no file output
    bool console_output = true;
};

class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, std::string_view category, std::string_view message);
    bool enabled(LogLevel level) const { return level >= min_level_; }

    void configure(const LoggingConfig& config);
    void setLevel(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    bool setLogFile(const std::string& filename);
    void setConsoleOutput(bool enabled) { console_output_ = enabled; }

private:
    Logger() = default;

    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_output_ = true;
    std::ofstream log_file_;
};

} // namespace schem::logging

#define SCHEM_LOG_TRACE(category, msg) ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::TRACE, category, msg)
#define SCHEM_LOG_DEBUG(category, msg) ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::DEBUG, category, msg)
#define SCHEM_LOG_INFO(category, msg)  ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::INFO, category, msg)
#define SCHEM_LOG_WARN(category, msg)  ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::WARN, category, msg)
#define SCHEM_LOG_ERROR(category, msg) ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::ERROR, category, msg)
#define SCHEM_LOG_FATAL(category, msg) ::schem::logging::Logger::instance().log(::schem::logging::LogLevel::FATAL, category, msg)

#endif  // SCHEM_LOGGING_H_
