#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    // Accepts "debug", "info", "warn", "error" (case-insensitive).
    // Returns false and leaves the level untouched for anything else.
    bool set_level_name(const std::string& name) {
        std::string n;
        for (char c : name) n += (c >= 'A' && c <= 'Z') ? (char)(c + 32) : c;
        if (n == "debug")                       set_level(LogLevel::DEBUG);
        else if (n == "info")                   set_level(LogLevel::INFO);
        else if (n == "warn" || n == "warning") set_level(LogLevel::WARN);
        else if (n == "error")                  set_level(LogLevel::ERR);
        else return false;
        return true;
    }

    void set_level_from_env(const char* var) {
        const char* v = std::getenv(var);
        if (v && *v && !set_level_name(v)) {
            warn(std::string("Ignoring unknown log level in ") + var + ": " + v);
        }
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Operations that end in Failed/TimedOut. Also appended to the
    // operation error file once one is set.
    void operation_error(const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        std::string line = format_line(LogLevel::ERR, "[OPERATION] " + msg);
        if (level_ <= LogLevel::ERR) std::cerr << line << "\n";
        if (op_err_path_.empty()) return;
        if (!op_err_file_.is_open()) {
            op_err_file_.open(op_err_path_, std::ios::app);
        }
        if (op_err_file_.is_open()) {
            op_err_file_ << line << "\n";
            op_err_file_.flush();
        }
    }

    void set_operation_error_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (op_err_file_.is_open()) op_err_file_.close();
        op_err_path_ = path;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    mutable std::mutex mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::ofstream op_err_file_;
    std::string   op_err_path_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
