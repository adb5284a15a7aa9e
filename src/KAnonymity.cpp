#include "KAnonymity.h"
#include "CategoricalTransforms.h"
#include "CommonUtils.h"
#include "EquivalenceClasses.h"
#include "KanonExceptions.h"
#include "NumericTransforms.h"
#include <unordered_set>

namespace {
constexpr const char* kComponent = "kanon.anonymization";
}

KAnonymity::KAnonymity(int k, std::shared_ptr<Logger> logger)
    : k_(k), logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()) {
    if (k_ < 2) {
        throw Kanon::ConfigurationException("k", std::to_string(k_), "k must be an integer greater than or equal to 2");
    }
}

std::vector<size_t> KAnonymity::validateInputs(const TypedTable& table,
                                               const std::vector<std::string>& quasiIdentifiers) const {
    if (!table.isRowAligned()) {
        logger_->error(kComponent, "Invalid input: table columns are not row-aligned");
        throw Kanon::ValidationException("Table columns are not row-aligned");
    }
    if (quasiIdentifiers.empty()) {
        logger_->error(kComponent, "Invalid input: empty quasi-identifier set");
        throw Kanon::ValidationException("At least one quasi-identifier is required");
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> missing;
    std::vector<size_t> indices;
    indices.reserve(quasiIdentifiers.size());
    for (const auto& name : quasiIdentifiers) {
        if (!seen.insert(name).second) {
            logger_->error(kComponent, "Invalid input: duplicate quasi-identifier", {{"column", name}});
            throw Kanon::ValidationException("Duplicate quasi-identifier: " + name);
        }
        const int idx = table.findColumnIndex(name);
        if (idx < 0) {
            missing.push_back(name);
        } else {
            indices.push_back(static_cast<size_t>(idx));
        }
    }
    if (!missing.empty()) {
        const std::string list = CommonUtils::joinList(missing, ", ");
        logger_->error(kComponent, "Missing columns in table", {{"missing", list}});
        throw Kanon::ValidationException("All quasi-identifiers must be columns in the table; missing: " + list, missing);
    }
    return indices;
}

TypedColumn KAnonymity::transformNumeric(const TypedColumn& col, const AnonymizationOptions& options) const {
    if (options.numericalMethod == "binning") {
        if (options.binCount == 0) {
            throw Kanon::ConfigurationException("bin_count", "0", "bin_count must be >= 1");
        }
        return NumericTransforms::discretizeQuantile(col, options.binCount);
    }
    if (options.numericalMethod == "microaggregation") {
        return NumericTransforms::microaggregate(col, static_cast<size_t>(k_));
    }
    throw Kanon::ConfigurationException("numerical_method",
                                        options.numericalMethod,
                                        "Unsupported numerical anonymization method: " + options.numericalMethod);
}

TypedColumn KAnonymity::transformCategorical(const TypedColumn& col, const AnonymizationOptions& options) const {
    if (options.categoricalMethod == "generalization") {
        return CategoricalTransforms::generalizeRare(col, static_cast<size_t>(k_), options.generalizationLabel);
    }
    if (options.categoricalMethod == "suppression") {
        return CategoricalTransforms::suppressRare(col, static_cast<size_t>(k_));
    }
    throw Kanon::ConfigurationException("categorical_method",
                                        options.categoricalMethod,
                                        "Unsupported categorical anonymization method: " + options.categoricalMethod);
}

TypedTable KAnonymity::anonymize(const TypedTable& table,
                                 const std::vector<std::string>& quasiIdentifiers,
                                 const AnonymizationOptions& options,
                                 AnonymizationReport* report) const {
    const std::vector<size_t> qiIndices = validateInputs(table, quasiIdentifiers);

    logger_->info(kComponent, "Starting anonymization with k=" + std::to_string(k_),
                  {{"rows", std::to_string(table.rowCount())},
                   {"columns", std::to_string(table.colCount())},
                   {"quasi_identifiers", CommonUtils::joinList(quasiIdentifiers)},
                   {"categorical_method", options.categoricalMethod},
                   {"numerical_method", options.numericalMethod},
                   {"bin_count", std::to_string(options.binCount)}});

    AnonymizationReport local;
    local.rowCount = table.rowCount();

    // Work on a copy; an exception below discards it together with any transformed columns.
    TypedTable result = table;
    for (size_t i = 0; i < qiIndices.size(); ++i) {
        TypedColumn& col = result.column(qiIndices[i]);
        if (col.type == ColumnType::NUMERIC) {
            logger_->debug(kComponent, "Anonymizing numerical column: " + col.name + " using method " + options.numericalMethod);
            col = transformNumeric(col, options);
            local.columnMethods.emplace_back(col.name, options.numericalMethod);
        } else {
            logger_->debug(kComponent, "Anonymizing categorical column: " + col.name + " using method " + options.categoricalMethod);
            col = transformCategorical(col, options);
            local.columnMethods.emplace_back(col.name, options.categoricalMethod);
        }
    }

    const size_t k = static_cast<size_t>(k_);
    local.verifiedAfterTransform = EquivalenceClasses::isKAnonymous(result, qiIndices, k);
    local.kAnonymousAfterRepair = local.verifiedAfterTransform;
    if (!local.verifiedAfterTransform) {
        logger_->warning(kComponent, "K-anonymity not satisfied after initial processing, applying suppression");
        local.repairApplied = true;
        local.rowsSuppressed = EquivalenceClasses::suppressUndersized(result, qiIndices, k, &local.undersizedClasses);
        local.kAnonymousAfterRepair = EquivalenceClasses::isKAnonymous(result, qiIndices, k);
        if (!local.kAnonymousAfterRepair) {
            logger_->warning(kComponent, "Suppressed rows form an equivalence class smaller than k",
                             {{"rows_suppressed", std::to_string(local.rowsSuppressed)}, {"k", std::to_string(k_)}});
        }
    }

    logger_->info(kComponent, "Anonymization complete",
                  {{"original_rows", std::to_string(table.rowCount())},
                   {"anonymized_rows", std::to_string(result.rowCount())},
                   {"columns_anonymized", std::to_string(quasiIdentifiers.size())},
                   {"repair_applied", local.repairApplied ? "true" : "false"},
                   {"rows_suppressed", std::to_string(local.rowsSuppressed)}});

    if (report) *report = std::move(local);
    return result;
}

bool KAnonymity::verify(const TypedTable& table, const std::vector<std::string>& quasiIdentifiers) const {
    const std::vector<size_t> qiIndices = validateInputs(table, quasiIdentifiers);
    return EquivalenceClasses::isKAnonymous(table, qiIndices, static_cast<size_t>(k_));
}

TypedTable KAnonymity::applySuppression(const TypedTable& table,
                                        const std::vector<std::string>& quasiIdentifiers,
                                        size_t* rowsSuppressedOut) const {
    const std::vector<size_t> qiIndices = validateInputs(table, quasiIdentifiers);
    TypedTable result = table;
    const size_t suppressed = EquivalenceClasses::suppressUndersized(result, qiIndices, static_cast<size_t>(k_));
    if (rowsSuppressedOut) *rowsSuppressedOut = suppressed;
    return result;
}

InformationLossMetrics KAnonymity::evaluateInformationLoss(const TypedTable& original,
                                                           const TypedTable& anonymized,
                                                           const std::vector<std::string>& quasiIdentifiers) const {
    return ::evaluateInformationLoss(original, anonymized, quasiIdentifiers);
}
