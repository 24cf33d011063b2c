#pragma once

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace engram {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

inline LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    return fallback;
}

// Structured field rendered as key=value in the log line.
template<typename T>
struct Field {
    const char* key;
    const T& value;
};

template<typename T>
Field<T> kv(const char* key, const T& value) { return Field<T>{key, value}; }

template<typename T>
std::ostream& operator<<(std::ostream& os, const Field<T>& field) {
    return os << ' ' << field.key << '=' << field.value;
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
        output_ = &stream;
    }

    bool setFile(const std::string& path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        file_ = std::move(file);
        output_ = file_.get();
        return true;
    }

    // ENGRAM_LOG_LEVEL / ENGRAM_LOG_FILE
    void configureFromEnv() {
        if (const char* lvl = std::getenv("ENGRAM_LOG_LEVEL")) {
            setLevel(parse_log_level(lvl, level()));
        }
        if (const char* path = std::getenv("ENGRAM_LOG_FILE"); path && *path) {
            if (!setFile(path)) {
                log(LogLevel::WARN, __FILE__, __LINE__, __func__, "cannot open log file ", path);
            }
        }
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::OFF:   break;
        }

        const char* filename = strrchr(file, '/');
        filename = filename ? filename + 1 : file;

        std::ostringstream msg;
        msg << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << level_str << " " << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        *output_ << msg.str() << std::endl;
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::ostringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::ostringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    LogLevel level_;
    std::ostream* output_;
    std::unique_ptr<std::ofstream> file_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) engram::Logger::getInstance().log(engram::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  engram::Logger::getInstance().log(engram::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  engram::Logger::getInstance().log(engram::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) engram::Logger::getInstance().log(engram::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace engram
