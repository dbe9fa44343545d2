#pragma once
#include <atomic>
#include <mutex>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide logger. Lines go to stderr as "[timestamp] [LEVEL] message".
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool parse_level(const std::string& name, LogLevel& level);

    // reads SWARMFETCH_LOG (debug|info|warn|error) if set
    static void init_from_env();

    static bool enabled(LogLevel level);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

private:
    static std::atomic<int> level;
    static std::mutex mtx;

    static std::string now_ts();
    static void write(LogLevel level, const std::string& msg);
};
