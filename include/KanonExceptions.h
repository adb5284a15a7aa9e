#ifndef KANON_EXCEPTIONS_H
#define KANON_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Kanon {

enum class ErrorKind { CONFIGURATION, VALIDATION, DATASET, IO };

class KanonException : public std::runtime_error {
public:
    KanonException(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class IOException : public KanonException {
public:
    explicit IOException(const std::string& message) : KanonException(ErrorKind::IO, "IO Error: " + message) {}
};

class DatasetException : public KanonException {
public:
    explicit DatasetException(const std::string& message) : KanonException(ErrorKind::DATASET, "Dataset Error: " + message) {}
};

/**
 * @brief Invalid k, unsupported method name or malformed configuration value.
 * @details field() names the offending setting (e.g. "k", "categorical_method"); value() is the rejected input.
 */
class ConfigurationException : public KanonException {
public:
    explicit ConfigurationException(const std::string& message)
        : KanonException(ErrorKind::CONFIGURATION, "Configuration Error: " + message) {}

    ConfigurationException(std::string field, std::string value, const std::string& message)
        : KanonException(ErrorKind::CONFIGURATION, "Configuration Error: " + message),
          field_(std::move(field)),
          value_(std::move(value)) {}

    const std::string& field() const noexcept { return field_; }
    const std::string& value() const noexcept { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * @brief Input table or quasi-identifier set rejected before any transform ran.
 * @details missingColumns() lists the requested names absent from the table, in request order.
 */
class ValidationException : public KanonException {
public:
    explicit ValidationException(const std::string& message)
        : KanonException(ErrorKind::VALIDATION, "Validation Error: " + message) {}

    ValidationException(const std::string& message, std::vector<std::string> missingColumns)
        : KanonException(ErrorKind::VALIDATION, "Validation Error: " + message),
          missingColumns_(std::move(missingColumns)) {}

    const std::vector<std::string>& missingColumns() const noexcept { return missingColumns_; }

private:
    std::vector<std::string> missingColumns_;
};

} // namespace Kanon

#endif // KANON_EXCEPTIONS_H
