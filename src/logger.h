#ifndef FACESIG_LOGGER_H
#define FACESIG_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <cstddef>
#include <optional>

namespace facesig {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive)
std::optional<LogLevel> parseLogLevel(const std::string& name);

class Logger {
public:
    static Logger& getInstance();

    // Empty path switches back to stderr
    void setLogFile(const std::string& path);
    void setLogLevel(LogLevel level);

    // Keep only the newest N lines in the log file (0 disables rotation)
    void setMaxLogLines(size_t max_lines);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Audit trail for engine operations
    void auditEncode(const std::string& source, bool success, double quality, double duration_ms);
    void auditCompare(double distance, double tolerance, bool is_match);
    void auditAggregate(size_t succeeded, size_t failed, const std::string& tag);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    void rotateLogIfNeeded();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::WARNING;
    std::string log_file_path_;
    size_t max_log_lines_ = 0;
    size_t log_counter_ = 0;
};

} // namespace facesig

#endif // FACESIG_LOGGER_H
