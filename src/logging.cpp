#include "schem/logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace schem::logging {

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNW";
}

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    if (text == "trace") return LogLevel::TRACE;
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn") return LogLevel::WARN;
    if (text == "error") return LogLevel::ERROR;
    if (text == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (level < min_level_) return;

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    oss << " [" << LogLevelName(level) << "] ";
    oss << "[" << category << "] " << message << '\n';

    if (console_output_) std::clog << oss.str();

    if (log_file_.is_open()) {
        log_file_ << oss.str();
        log_file_.flush();
    }
}

void Logger::configure(const LoggingConfig& config) {
    setLevel(config.level);
    setConsoleOutput(config.console_output);
    if (!config.log_file.empty() && !setLogFile(config.log_file)) {
        log(LogLevel::WARN, "Logging", "Cannot open log file: " + config.log_file);
    }
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) log_file_.close();
    log_file_.open(filename, std::ios::app);
    return log_file_.is_open();
}

} // namespace schem::logging
