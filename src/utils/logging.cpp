#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace kalibox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

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

void Configure(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    // Sorted so that the same fields always print in the same order.
    const std::map<std::string, std::string> fields(message.fields.begin(), message.fields.end());
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << message.tag << "] ";
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        std::cerr << ToString(message.level) << ": ";
    }
    std::cerr << message.message;
    for (const auto& [key, value] : fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace kalibox::utils
