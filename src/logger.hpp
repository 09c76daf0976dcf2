#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// "debug", "info", "warn" or "error"; anything else maps to INFO.
LogLevel parse_level(const std::string& s);

// Simple thread-safe logger. Writes to a file when one is opened,
// otherwise to stderr so stdout carries only tool output.
class Logger {
public:
    explicit Logger(LogLevel lvl = LogLevel::INFO);
    Logger(const std::string& path, LogLevel lvl);

    bool open(const std::string& path);
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void log(LogLevel lvl, const std::string& msg);
    std::ostream& sink();
    static std::string ts();
    static const char* level_str(LogLevel lvl);

    std::mutex mu_;
    std::ofstream file_;
    LogLevel level_ = LogLevel::INFO;
};
