#pragma once
#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
enum class LogFormat { TEXT, JSON };

// Ordered structured context attached to one log event.
using LogFields = std::vector<std::pair<std::string, std::string>>;

const char* logLevelName(LogLevel level) noexcept;

/**
 * @brief Parses debug|info|warning|error (case-insensitive).
 * @throws Kanon::ConfigurationException on any other value.
 */
LogLevel parseLogLevel(const std::string& value);

/**
 * @brief Parses text|json (case-insensitive).
 * @throws Kanon::ConfigurationException on any other value.
 */
LogFormat parseLogFormat(const std::string& value);

/**
 * @brief Diagnostic sink handed to components by their owner.
 * @details Emission is fire-and-forget: callers never inspect a result and sink failures are not reported.
 */
class Logger {
public:
    explicit Logger(LogLevel minLevel = LogLevel::INFO) : minLevel_(minLevel) {}
    virtual ~Logger() = default;

    // Safe to call while other threads are logging.
    void setMinLevel(LogLevel level) noexcept { minLevel_.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel level) const noexcept { return static_cast<int>(level) >= static_cast<int>(minLevel()); }

    void log(LogLevel level, const std::string& component, const std::string& message, const LogFields& fields = {});

    void debug(const std::string& component, const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::DEBUG, component, message, fields);
    }
    void info(const std::string& component, const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::INFO, component, message, fields);
    }
    void warning(const std::string& component, const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::WARNING, component, message, fields);
    }
    void error(const std::string& component, const std::string& message, const LogFields& fields = {}) {
        log(LogLevel::ERROR, component, message, fields);
    }

protected:
    virtual void write(LogLevel level, const std::string& component, const std::string& message, const LogFields& fields) = 0;

private:
    std::atomic<LogLevel> minLevel_;
};

class NullLogger : public Logger {
public:
    NullLogger() : Logger(LogLevel::ERROR) {}

protected:
    void write(LogLevel, const std::string&, const std::string&, const LogFields&) override {}
};

/**
 * @brief Writes one line per event to a caller-owned stream.
 * @details TEXT: "[Kanon][WARNING] component: message key=value ..."
 *          JSON: {"level":"WARNING","name":"component","message":"...","data":{"key":"value"}}
 *          The stream must outlive the logger.
 */
class StreamLogger : public Logger {
public:
    StreamLogger(std::ostream& out, LogLevel minLevel = LogLevel::INFO, LogFormat format = LogFormat::TEXT);

protected:
    void write(LogLevel level, const std::string& component, const std::string& message, const LogFields& fields) override;

private:
    std::ostream& out_;
    LogFormat format_;
    std::mutex mutex_;
};

std::string escapeJsonString(const std::string& input);
