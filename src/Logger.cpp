#include "Logger.h"
#include "CommonUtils.h"
#include "KanonExceptions.h"
#include <ostream>
#include <sstream>

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

LogLevel parseLogLevel(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warning" || v == "warn") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    throw Kanon::ConfigurationException("log_level", value, "log_level must be one of: debug, info, warning, error");
}

LogFormat parseLogFormat(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "text") return LogFormat::TEXT;
    if (v == "json") return LogFormat::JSON;
    throw Kanon::ConfigurationException("log_format", value, "log_format must be one of: text, json");
}

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    escaped += "?";
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message, const LogFields& fields) {
    if (!enabled(level)) return;
    write(level, component, message, fields);
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel minLevel, LogFormat format)
    : Logger(minLevel), out_(out), format_(format) {}

void StreamLogger::write(LogLevel level, const std::string& component, const std::string& message, const LogFields& fields) {
    std::ostringstream line;
    if (format_ == LogFormat::JSON) {
        line << "{\"level\":\"" << logLevelName(level) << "\""
             << ",\"name\":\"" << escapeJsonString(component) << "\""
             << ",\"message\":\"" << escapeJsonString(message) << "\"";
        if (!fields.empty()) {
            line << ",\"data\":{";
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) line << ",";
                line << "\"" << escapeJsonString(fields[i].first) << "\":\"" << escapeJsonString(fields[i].second) << "\"";
            }
            line << "}";
        }
        line << "}";
    } else {
        line << "[Kanon][" << logLevelName(level) << "] " << component << ": " << message;
        for (const auto& [key, value] : fields) {
            line << " " << key << "=" << value;
        }
    }
    line << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
    out_.flush();
}
