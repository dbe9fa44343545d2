#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::atomic<int> Logger::level{static_cast<int>(LogLevel::Info)};
std::mutex Logger::mtx;

void Logger::set_level(LogLevel new_level) {
    level = static_cast<int>(new_level);
}

LogLevel Logger::get_level() {
    return static_cast<LogLevel>(level.load());
}

bool Logger::parse_level(const std::string& name, LogLevel& out) {
    if (name == "debug") {
        out = LogLevel::Debug;
    } else if (name == "info") {
        out = LogLevel::Info;
    } else if (name == "warn" || name == "warning") {
        out = LogLevel::Warn;
    } else if (name == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void Logger::init_from_env() {
    const char* value = std::getenv("SWARMFETCH_LOG");
    if (value == nullptr) {
        return;
    }
    LogLevel parsed;
    if (parse_level(value, parsed)) {
        set_level(parsed);
    } else {
        warn("Ignoring unknown SWARMFETCH_LOG level: " + std::string(value));
    }
}

bool Logger::enabled(LogLevel at) {
    return static_cast<int>(at) >= level.load();
}

void Logger::debug(const std::string& msg) { write(LogLevel::Debug, msg); }
void Logger::info(const std::string& msg) { write(LogLevel::Info, msg); }
void Logger::warn(const std::string& msg) { write(LogLevel::Warn, msg); }
void Logger::error(const std::string& msg) { write(LogLevel::Error, msg); }

std::string Logger::now_ts() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

void Logger::write(LogLevel at, const std::string& msg) {
    if (!enabled(at)) {
        return;
    }
    static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    std::string line = "[" + now_ts() + "] [" + names[static_cast<int>(at)] + "] " + msg + "\n";
    std::lock_guard<std::mutex> lock(mtx);
    std::cerr << line;
}
