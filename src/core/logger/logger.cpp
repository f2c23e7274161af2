#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace Sonar {
namespace Core {

int Logger::level_ = LogLevel::LOG_DEFAULT;

std::mutex Logger::mutex_;

namespace {
constexpr const char* RESET  = "\033[0m";
constexpr const char* RED    = "\033[31m";
constexpr const char* GREEN  = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* BLUE   = "\033[34m";
constexpr const char* GRAY   = "\033[90m";

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm     tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int Logger::parse_level(const std::string& level_name) {
    std::string name = level_name;
    std::transform(
        name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

    if (name == "none")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn")
        return LOG_ERROR | LOG_WARN;
    if (name == "info")
        return LOG_DEFAULT;
    if (name == "debug" || name == "all")
        return LOG_ALL;
    throw std::invalid_argument("Unknown log level: " + level_name);
}

void Logger::write(int level, const char* color, const char* label, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;
    // stdout is reserved for scan reports in one-shot mode.
    std::cerr << GRAY << timestamp() << " " << color << label << RESET << message << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, GRAY, "[DEBUG] ", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN, "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "[ERROR] ", message);
}

}  // namespace Core
}  // namespace Sonar
