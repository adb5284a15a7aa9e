#pragma once
#include "KAnonymity.h"
#include "Logger.h"
#include "TypedTable.h"
#include <string>
#include <unordered_map>
#include <vector>

struct AppConfig {
    std::string datasetPath;
    std::string outputPath;                 // empty => <dataset stem>_anonymized.<ext>
    std::string exportFormat = "csv";       // csv|parquet
    char delimiter = ',';

    std::vector<std::string> quasiIdentifiers;
    int k = 2;
    AnonymizationOptions anonymization;

    bool reportLoss = true;
    LogLevel logLevel = LogLevel::INFO;
    LogFormat logFormat = LogFormat::TEXT;
    bool showHelp = false;

    std::unordered_map<std::string, ColumnType> columnTypeOverrides;

    /**
     * @brief Builds config from CLI args, merging an optional --config file first.
     * @details The config file is applied before the other flags, so command line values win.
     * @throws Kanon::ConfigurationException on invalid arguments or values.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (loose YAML or JSON-ish) on top of base.
     * @details Keys: dataset, output, export, delimiter, quasi_identifiers, k, categorical_method,
     *          numerical_method, bins, other_label, report_loss, log_level, log_format, type.<column>.
     * @throws Kanon::ConfigurationException naming the line on parse/validation failures.
     */
    static AppConfig fromFile(const std::string& configPath, const AppConfig& base);

    /**
     * @brief Checks required fields and enum-like values.
     * @throws Kanon::ConfigurationException on invalid values.
     */
    void validate() const;

    std::string resolvedOutputPath() const;
};

std::string usageText(const std::string& prog);

/**
 * @brief Strict integer parse: rejects empty input, fractions and trailing characters.
 * @throws Kanon::ConfigurationException (field = key) on failure or when below minValue.
 */
int parseIntStrict(const std::string& value, const std::string& key, int minValue);
