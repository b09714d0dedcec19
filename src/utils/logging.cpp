#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace scriptbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

void Log(const std::string& tag, const LogMessage& message) {
    if (static_cast<int>(message.level) < g_min_level.load()) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] " << ToString(message.level) << " " << message.message;
    // sorted so that lines are stable across runs
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<std::pair<const std::string, std::string>> fields) {
    Log(tag, LogMessage{level, message, {fields.begin(), fields.end()}});
}

}  // namespace scriptbox::utils
