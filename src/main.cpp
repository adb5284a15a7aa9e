#include "AppConfig.h"
#include "CsvTableReader.h"
#include "KAnonymity.h"
#include "KanonExceptions.h"
#include "Logger.h"
#include "TableExporter.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitData = 2;

int exitCodeFor(const Kanon::KanonException& e) {
    switch (e.kind()) {
        case Kanon::ErrorKind::CONFIGURATION:
        case Kanon::ErrorKind::VALIDATION:
            return kExitConfig;
        case Kanon::ErrorKind::DATASET:
        case Kanon::ErrorKind::IO:
            return kExitData;
    }
    return kExitConfig;
}

void printLossTable(const InformationLossMetrics& metrics) {
    size_t width = 0;
    for (const auto& [name, value] : metrics) width = std::max(width, name.size());

    std::cout << "\nInformation loss\n";
    for (const auto& [name, value] : metrics) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << name << "  "
                  << std::right << std::fixed << std::setprecision(4) << value << "\n";
    }
}

bool exportTable(const TypedTable& table, const AppConfig& config, const std::string& path, std::string& error) {
    if (config.exportFormat == "parquet") {
        return TableExporter::writeParquetFile(table, path, error);
    }
    return TableExporter::writeCsvFile(table, path, config.delimiter, error);
}
}

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::fromArgs(argc, argv);
    } catch (const Kanon::KanonException& e) {
        std::cerr << "[Kanon][Error] " << e.what() << "\n";
        std::cerr << usageText(argv[0]);
        return exitCodeFor(e);
    }
    if (config.showHelp) {
        std::cout << usageText(argv[0]);
        return kExitOk;
    }

    auto logger = std::make_shared<StreamLogger>(std::cerr, config.logLevel, config.logFormat);

    try {
        CsvTableReader reader(config.delimiter);
        reader.setColumnTypeOverrides(config.columnTypeOverrides);
        const TypedTable original = reader.readFile(config.datasetPath);
        logger->info("kanon.cli", "Loaded dataset", {{"path", config.datasetPath},
                                                      {"rows", std::to_string(original.rowCount())},
                                                      {"columns", std::to_string(original.colCount())}});

        const KAnonymity engine(config.k, logger);
        AnonymizationReport report;
        const TypedTable anonymized = engine.anonymize(original, config.quasiIdentifiers, config.anonymization, &report);

        const std::string outputPath = config.resolvedOutputPath();
        std::string error;
        if (!exportTable(anonymized, config, outputPath, error)) {
            throw Kanon::IOException(error);
        }
        logger->info("kanon.cli", "Wrote anonymized table", {{"path", outputPath},
                                                              {"format", config.exportFormat},
                                                              {"rows_suppressed", std::to_string(report.rowsSuppressed)}});

        if (config.reportLoss) {
            printLossTable(engine.evaluateInformationLoss(original, anonymized, config.quasiIdentifiers));
        }
    } catch (const Kanon::KanonException& e) {
        std::cerr << "[Kanon][Error] " << e.what() << "\n";
        return exitCodeFor(e);
    } catch (const std::exception& e) {
        std::cerr << "[Kanon][Exception] " << e.what() << "\n";
        return kExitData;
    }
    return kExitOk;
}
