#pragma once

#include <sstream>
#include <utility>
#include <string>

namespace lrunbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

// Accepts debug, info, warn/warning and error in any case. Unknown names
// return fallback.
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogConfig {
    LogLevel min_level = LogLevel::kWarn;
};

void ConfigureLogging(const LogConfig& config);
LogLevel MinLogLevel();
bool ShouldLog(LogLevel level);

// Writes "[tag] message" to stderr when level passes the threshold.
void Log(LogLevel level, const std::string& tag, const std::string& message);

// Collects a message with operator<< and emits it on destruction.
class LogLine {
public:
    LogLine(LogLevel level, std::string tag)
        : level_(level), tag_(std::move(tag)), enabled_(ShouldLog(level)) {}
    ~LogLine() {
        if (enabled_) {
            Log(level_, tag_, stream_.str());
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string tag_;
    bool enabled_;
    std::ostringstream stream_;
};

}  // namespace lrunbox::utils
