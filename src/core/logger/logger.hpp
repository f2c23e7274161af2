#pragma once
#include <mutex>
#include <string>

namespace Sonar {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_DEBUG   = 1 << 4,
    LOG_DEFAULT = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS,
    LOG_ALL     = LOG_DEFAULT | LOG_DEBUG
};

class Logger {
public:
    static void set_level(int level);
    static int  level();

    // Accepts "none", "error", "warn", "info", "debug" and "all".
    // Each name enables its own level and every more severe one.
    static int parse_level(const std::string& name);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write(int level, const char* color, const char* label, const std::string& message);

    static int        level_;
    static std::mutex mutex_;
};

}  // namespace Core
}  // namespace Sonar
