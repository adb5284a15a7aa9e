/**
 * @file test_app_config.cpp
 * @brief Command line and config file parsing.
 */

#include <gtest/gtest.h>
#include "AppConfig.h"
#include "KanonExceptions.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {
AppConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "kanon");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return AppConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::string writeTempConfig(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path.string();
}

std::string rejectedField(const std::vector<std::string>& args) {
    try {
        (void)parseArgs(args);
    } catch (const Kanon::ConfigurationException& e) {
        return e.field();
    }
    return "<accepted>";
}
}

// ============================================================================
// Command line
// ============================================================================

TEST(AppConfigTest, DefaultsWithRequiredArguments) {
    const AppConfig config = parseArgs({"people.csv", "--qi", "age,zip"});
    EXPECT_EQ(config.datasetPath, "people.csv");
    EXPECT_EQ(config.quasiIdentifiers, (std::vector<std::string>{"age", "zip"}));
    EXPECT_EQ(config.k, 2);
    EXPECT_EQ(config.anonymization.categoricalMethod, "generalization");
    EXPECT_EQ(config.anonymization.numericalMethod, "binning");
    EXPECT_EQ(config.anonymization.binCount, 5u);
    EXPECT_EQ(config.anonymization.generalizationLabel, "Other");
    EXPECT_EQ(config.exportFormat, "csv");
    EXPECT_TRUE(config.reportLoss);
    EXPECT_EQ(config.resolvedOutputPath(), "people_anonymized.csv");
}

TEST(AppConfigTest, ParsesAllFlags) {
    const AppConfig config = parseArgs({"data/in.csv", "--qi", "age", "--k", "4",
                                        "--categorical-method", "suppression",
                                        "--numerical-method", "microaggregation",
                                        "--bins", "3", "--other-label", "*",
                                        "--delimiter", ";", "-o", "out.csv",
                                        "--report-loss", "false", "--log-level", "debug",
                                        "--log-format", "json", "--type", "zip=categorical"});
    EXPECT_EQ(config.k, 4);
    EXPECT_EQ(config.anonymization.categoricalMethod, "suppression");
    EXPECT_EQ(config.anonymization.numericalMethod, "microaggregation");
    EXPECT_EQ(config.anonymization.binCount, 3u);
    EXPECT_EQ(config.anonymization.generalizationLabel, "*");
    EXPECT_EQ(config.delimiter, ';');
    EXPECT_EQ(config.resolvedOutputPath(), "out.csv");
    EXPECT_FALSE(config.reportLoss);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(config.logFormat, LogFormat::JSON);
    ASSERT_EQ(config.columnTypeOverrides.count("zip"), 1u);
    EXPECT_EQ(config.columnTypeOverrides.at("zip"), ColumnType::CATEGORICAL);
}

TEST(AppConfigTest, RejectsInvalidK) {
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--k", "2.5"}), "k");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--k", "abc"}), "k");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--k", "1"}), "k");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--k", "-5"}), "k");
}

TEST(AppConfigTest, RejectsInvalidValues) {
    EXPECT_EQ(rejectedField({"p.csv"}), "quasi_identifiers");
    EXPECT_EQ(rejectedField({"--qi", "a"}), "dataset");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--bins", "0"}), "bin_count");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--numerical-method", "rounding"}), "numerical_method");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--categorical-method", "masking"}), "categorical_method");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--export", "xlsx"}), "export");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--log-level", "loud"}), "log_level");
    EXPECT_EQ(rejectedField({"p.csv", "--qi", "a", "--unknown"}), "--unknown");
    EXPECT_EQ(rejectedField({"p.csv", "--qi"}), "--qi");
}

TEST(AppConfigTest, HelpSkipsValidation) {
    const AppConfig config = parseArgs({"--help"});
    EXPECT_TRUE(config.showHelp);
    EXPECT_NE(usageText("kanon").find("--qi"), std::string::npos);
}

TEST(AppConfigTest, ParquetOutputExtension) {
    const AppConfig config = parseArgs({"people.csv", "--qi", "age", "--export", "parquet"});
    EXPECT_EQ(config.resolvedOutputPath(), "people_anonymized.parquet");
}

TEST(AppConfigTest, StrictIntegerParser) {
    EXPECT_EQ(parseIntStrict(" 12 ", "bins", 1), 12);
    EXPECT_THROW(parseIntStrict("", "bins", 1), Kanon::ConfigurationException);
    EXPECT_THROW(parseIntStrict("3x", "bins", 1), Kanon::ConfigurationException);
    EXPECT_THROW(parseIntStrict("99999999999999", "bins", 1), Kanon::ConfigurationException);
}

// ============================================================================
// Config file
// ============================================================================

TEST(AppConfigTest, ConfigFileThenCommandLineOverrides) {
    const std::string path = writeTempConfig("kanon_test_config.yaml",
                                             "# anonymization run\n"
                                             "dataset: \"people.csv\"\n"
                                             "quasi_identifiers: [age, zip]\n"
                                             "k: 4\n"
                                             "numerical_method: microaggregation\n"
                                             "type.zip: categorical\n"
                                             "report_loss: no\n");
    const AppConfig config = parseArgs({"--config", path, "--k", "5"});
    EXPECT_EQ(config.datasetPath, "people.csv");
    EXPECT_EQ(config.quasiIdentifiers, (std::vector<std::string>{"age", "zip"}));
    EXPECT_EQ(config.k, 5);
    EXPECT_EQ(config.anonymization.numericalMethod, "microaggregation");
    EXPECT_EQ(config.columnTypeOverrides.at("zip"), ColumnType::CATEGORICAL);
    EXPECT_FALSE(config.reportLoss);
    std::filesystem::remove(path);
}

TEST(AppConfigTest, JsonStyleConfigFile) {
    const std::string path = writeTempConfig("kanon_test_config.json",
                                             "{\n"
                                             "  \"dataset\": \"p.csv\",\n"
                                             "  \"quasi_identifiers\": [\"age\", \"zip\"],\n"
                                             "  \"bins\": 7\n"
                                             "}\n");
    const AppConfig config = AppConfig::fromFile(path, AppConfig{});
    EXPECT_EQ(config.datasetPath, "p.csv");
    EXPECT_EQ(config.quasiIdentifiers, (std::vector<std::string>{"age", "zip"}));
    EXPECT_EQ(config.anonymization.binCount, 7u);
    std::filesystem::remove(path);
}

TEST(AppConfigTest, ConfigFileErrorsNameTheLine) {
    const std::string path = writeTempConfig("kanon_test_bad.yaml", "dataset: p.csv\nk: 2.5\n");
    try {
        (void)AppConfig::fromFile(path, AppConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Kanon::ConfigurationException& e) {
        EXPECT_EQ(e.field(), "k");
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    std::filesystem::remove(path);

    EXPECT_THROW(AppConfig::fromFile("/nonexistent/kanon.yaml", AppConfig{}), Kanon::ConfigurationException);
}
