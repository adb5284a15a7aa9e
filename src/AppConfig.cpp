#include "AppConfig.h"
#include "CommonUtils.h"
#include "KanonExceptions.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// YAML/JSON lists ("[a, b]") and plain comma lists are both accepted.
std::vector<std::string> parseNameList(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }
    std::vector<std::string> out;
    for (auto& item : CommonUtils::splitList(value)) {
        std::string name = maybeUnquote(item);
        if (!name.empty()) out.push_back(name);
    }
    return out;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("type.", 0) == 0) {
        return "type." + key.substr(5);
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Kanon::ConfigurationException(key, value, "Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    std::string v = value;
    if (CommonUtils::toLower(v) == "\\t" || CommonUtils::toLower(v) == "tab") v = "\t";
    if (v.size() != 1) throw Kanon::ConfigurationException(key, value, key + " expects a single character");
    const char c = v[0];
    if (c == '"' || c == '\n' || c == '\r' || c == '\0') {
        throw Kanon::ConfigurationException(key, value, "Invalid delimiter character");
    }
    return c;
}

ColumnType parseColumnType(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "numeric") return ColumnType::NUMERIC;
    if (v == "categorical") return ColumnType::CATEGORICAL;
    throw Kanon::ConfigurationException(key, value, "invalid column type override '" + value + "' (allowed: numeric, categorical)");
}

// "col=numeric" as given to --type.
void applyTypeOverride(AppConfig& config, const std::string& arg) {
    const size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw Kanon::ConfigurationException("--type", arg, "--type expects <column>=numeric|categorical");
    }
    const std::string column = CommonUtils::trim(arg.substr(0, eq));
    config.columnTypeOverrides[column] = parseColumnType(arg.substr(eq + 1), "--type");
}

void assignKeyValue(AppConfig& config, const std::string& key, const std::string& value) {
    if (key == "dataset" || key == "dataset_path") {
        config.datasetPath = value;
    } else if (key == "output" || key == "output_path") {
        config.outputPath = value;
    } else if (key == "export" || key == "export_format") {
        config.exportFormat = CommonUtils::toLower(value);
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "quasi_identifiers" || key == "qi") {
        config.quasiIdentifiers = parseNameList(value);
    } else if (key == "k") {
        config.k = parseIntStrict(value, "k", 2);
    } else if (key == "categorical_method") {
        config.anonymization.categoricalMethod = CommonUtils::toLower(value);
    } else if (key == "numerical_method") {
        config.anonymization.numericalMethod = CommonUtils::toLower(value);
    } else if (key == "bins" || key == "bin_count") {
        config.anonymization.binCount = static_cast<size_t>(parseIntStrict(value, "bin_count", 1));
    } else if (key == "other_label" || key == "generalization_label") {
        config.anonymization.generalizationLabel = value;
    } else if (key == "report_loss") {
        config.reportLoss = parseBoolStrict(value, key);
    } else if (key == "log_level") {
        config.logLevel = parseLogLevel(value);
    } else if (key == "log_format") {
        config.logFormat = parseLogFormat(value);
    } else if (key.rfind("type.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(5));
        if (column.empty()) {
            throw Kanon::ConfigurationException(key, value, "type.<column> requires a non-empty column name");
        }
        config.columnTypeOverrides[column] = parseColumnType(value, key);
    } else {
        throw Kanon::ConfigurationException(key, value, "Unknown configuration key: " + key);
    }
}
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const std::string v = CommonUtils::trim(value);
    int parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoi(v, &pos);
        if (pos != v.size()) {
            throw Kanon::ConfigurationException(key, value, "Invalid integer for " + key + ": " + value);
        }
    } catch (const Kanon::KanonException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Kanon::ConfigurationException(key, value, "Invalid integer for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (parsed < minValue) {
        throw Kanon::ConfigurationException(key, value, "Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

std::string usageText(const std::string& prog) {
    return "Usage: " + prog + " <dataset.csv> --qi col1,col2 [options]\n"
           "Options:\n"
           "  --qi, --quasi-identifiers <cols>    Comma separated quasi-identifier columns (required)\n"
           "  --k <int>                           Minimum equivalence class size, >= 2 (default: 2)\n"
           "  --categorical-method <m>            generalization|suppression (default: generalization)\n"
           "  --numerical-method <m>              binning|microaggregation (default: binning)\n"
           "  --bins <int>                        Quantile bins for binning, >= 1 (default: 5)\n"
           "  --other-label <text>                Label for generalized rare values (default: Other)\n"
           "  --type <col>=numeric|categorical    Override inferred column type (repeatable)\n"
           "  --delimiter <char>                  CSV delimiter character (default: ,)\n"
           "  --output, -o <file>                 Output path (default: <dataset>_anonymized.<ext>)\n"
           "  --export <csv|parquet>              Output format (default: csv)\n"
           "  --report-loss <true|false>          Print information loss metrics (default: true)\n"
           "  --log-level <debug|info|warning|error>\n"
           "  --log-format <text|json>\n"
           "  --config <file>                     key: value configuration file\n"
           "  --help                              Show this help message\n";
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    AppConfig config;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--help" || args[i] == "-h") {
            config.showHelp = true;
            return config;
        }
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw Kanon::ConfigurationException("--config", "", "--config expects a path");
            config = fromFile(args[i + 1], config);
        }
    }

    auto next = [&](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw Kanon::ConfigurationException(args[i], "", args[i] + " expects a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--qi" || arg == "--quasi-identifiers") {
            config.quasiIdentifiers = parseNameList(next(i));
        } else if (arg == "--k" || arg == "-k") {
            config.k = parseIntStrict(next(i), "k", 2);
        } else if (arg == "--categorical-method") {
            config.anonymization.categoricalMethod = CommonUtils::toLower(next(i));
        } else if (arg == "--numerical-method") {
            config.anonymization.numericalMethod = CommonUtils::toLower(next(i));
        } else if (arg == "--bins") {
            config.anonymization.binCount = static_cast<size_t>(parseIntStrict(next(i), "bin_count", 1));
        } else if (arg == "--other-label") {
            config.anonymization.generalizationLabel = next(i);
        } else if (arg == "--type") {
            applyTypeOverride(config, next(i));
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(next(i), "--delimiter");
        } else if (arg == "--output" || arg == "-o") {
            config.outputPath = next(i);
        } else if (arg == "--export") {
            config.exportFormat = CommonUtils::toLower(next(i));
        } else if (arg == "--report-loss") {
            config.reportLoss = parseBoolStrict(next(i), "--report-loss");
        } else if (arg == "--log-level") {
            config.logLevel = parseLogLevel(next(i));
        } else if (arg == "--log-format") {
            config.logFormat = parseLogFormat(next(i));
        } else if (!arg.empty() && arg[0] == '-') {
            throw Kanon::ConfigurationException(arg, "", "Unknown or incomplete argument: " + arg);
        } else if (config.datasetPath.empty() || i == 0) {
            config.datasetPath = arg;
        } else {
            throw Kanon::ConfigurationException("dataset", arg, "Unexpected positional argument: " + arg);
        }
    }

    config.validate();
    return config;
}

AppConfig AppConfig::fromFile(const std::string& configPath, const AppConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Kanon::ConfigurationException("config", configPath, "Could not open config file: " + configPath);

    AppConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Kanon::ConfigurationException& ex) {
            throw Kanon::ConfigurationException(
                ex.field(), ex.value(),
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AppConfig::validate() const {
    if (datasetPath.empty()) {
        throw Kanon::ConfigurationException("dataset", "", "dataset path is required");
    }
    if (quasiIdentifiers.empty()) {
        throw Kanon::ConfigurationException("quasi_identifiers", "", "at least one quasi-identifier is required (--qi)");
    }
    if (k < 2) {
        throw Kanon::ConfigurationException("k", std::to_string(k), "k must be an integer greater than or equal to 2");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };
    if (!isIn(anonymization.categoricalMethod, {"generalization", "suppression"})) {
        throw Kanon::ConfigurationException("categorical_method", anonymization.categoricalMethod,
                                            "categorical_method must be one of: generalization, suppression");
    }
    if (!isIn(anonymization.numericalMethod, {"binning", "microaggregation"})) {
        throw Kanon::ConfigurationException("numerical_method", anonymization.numericalMethod,
                                            "numerical_method must be one of: binning, microaggregation");
    }
    if (anonymization.binCount < 1) {
        throw Kanon::ConfigurationException("bin_count", std::to_string(anonymization.binCount), "bin_count must be >= 1");
    }
    if (!isIn(exportFormat, {"csv", "parquet"})) {
        throw Kanon::ConfigurationException("export", exportFormat, "export must be one of: csv, parquet");
    }
}

std::string AppConfig::resolvedOutputPath() const {
    if (!outputPath.empty()) return outputPath;
    namespace fs = std::filesystem;
    const fs::path src(datasetPath);
    fs::path out = src.parent_path() / (src.stem().string() + "_anonymized." + exportFormat);
    return out.string();
}
