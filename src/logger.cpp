#include "logger.h"
#include <iostream>
#include <unistd.h>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <fstream>
#include <vector>
#include <algorithm>

namespace facesig {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // stdout carries CLI responses, so the default sink is stderr.
    // FACESIG_LOG_LEVEL lets a caller raise verbosity before any config is read.
    const char* env_level = std::getenv("FACESIG_LOG_LEVEL");
    if (env_level != nullptr) {
        auto level = parseLogLevel(env_level);
        if (level) {
            min_level_ = *level;
        }
    }
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_file_path_ = path;
    if (path.empty()) {
        return;
    }

    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Warning: Could not open log file " << path
                  << ", falling back to console output" << std::endl;
        log_file_path_.clear();
    }
}

void Logger::setLogLevel(LogLevel level) {
    min_level_ = level;
}

void Logger::setMaxLogLines(size_t max_lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_log_lines_ = max_lines;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

void Logger::rotateLogIfNeeded() {
    // Only perform rotation check periodically (every 10 writes)
    if (log_counter_ < 10) {
        log_counter_++;
        return;
    }
    log_counter_ = 0;

    if (log_file_path_.empty() || max_log_lines_ == 0) {
        return;
    }

    std::ifstream infile(log_file_path_);
    if (!infile.is_open()) {
        return;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line)) {
        lines.push_back(line);
    }
    infile.close();

    if (lines.size() > max_log_lines_) {
        size_t start_index = lines.size() - max_log_lines_;

        if (log_file_.is_open()) {
            log_file_.close();
        }

        std::ofstream outfile(log_file_path_, std::ios::trunc);
        if (outfile.is_open()) {
            for (size_t i = start_index; i < lines.size(); ++i) {
                outfile << lines[i] << '\n';
            }
        }

        log_file_.open(log_file_path_, std::ios::app);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] "
       << "[PID:" << getpid() << "] "
       << message << '\n';

    if (log_file_.is_open()) {
        log_file_ << ss.str();
        log_file_.flush();
        rotateLogIfNeeded();
    } else {
        std::cerr << ss.str();
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::auditEncode(const std::string& source, bool success, double quality, double duration_ms) {
    std::stringstream ss;
    ss << "ENCODE source=" << source
       << " result=" << (success ? "ok" : "failed")
       << " quality=" << std::fixed << std::setprecision(1) << quality
       << " duration=" << std::setprecision(2) << duration_ms << "ms";
    info(ss.str());
}

void Logger::auditCompare(double distance, double tolerance, bool is_match) {
    std::stringstream ss;
    ss << "COMPARE distance=" << std::fixed << std::setprecision(4) << distance
       << " tolerance=" << tolerance
       << " match=" << (is_match ? "yes" : "no");
    info(ss.str());
}

void Logger::auditAggregate(size_t succeeded, size_t failed, const std::string& tag) {
    std::stringstream ss;
    ss << "AGGREGATE succeeded=" << succeeded
       << " failed=" << failed
       << " tag=" << tag;
    if (succeeded == 0) {
        warning(ss.str());
    } else {
        info(ss.str());
    }
}

} // namespace facesig
