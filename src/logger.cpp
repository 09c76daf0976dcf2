#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

LogLevel parse_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger::Logger(LogLevel lvl) : level_(lvl) {}

Logger::Logger(const std::string& path, LogLevel lvl) : level_(lvl) {
    if (!path.empty()) open(path);
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::set_level(LogLevel lvl) {
    level_ = lvl;
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { log(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { log(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "?";
    }
}

std::string Logger::ts() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto tt = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

std::ostream& Logger::sink() {
    if (file_.is_open()) return file_;
    return std::cerr;
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(level_)) return;
    std::lock_guard<std::mutex> lk(mu_);
    std::ostream& out = sink();
    out << ts() << " [" << level_str(lvl) << "] " << msg << "\n";
    out.flush();
}
