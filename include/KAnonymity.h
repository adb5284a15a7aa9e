#pragma once
#include "InformationLoss.h"
#include "Logger.h"
#include "TypedTable.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct AnonymizationOptions {
    std::string categoricalMethod = "generalization"; // generalization|suppression
    std::string numericalMethod = "binning";          // binning|microaggregation
    size_t binCount = 5;
    std::string generalizationLabel = "Other";
};

struct AnonymizationReport {
    size_t rowCount = 0;
    // (column, method) in quasi-identifier order.
    std::vector<std::pair<std::string, std::string>> columnMethods;
    bool verifiedAfterTransform = false;
    bool repairApplied = false;
    size_t undersizedClasses = 0;
    size_t rowsSuppressed = 0;
    // Informational only; repair is single pass and may leave an undersized all-null class.
    bool kAnonymousAfterRepair = false;
};

/**
 * @brief k-anonymity over a set of quasi-identifier columns.
 * @details Numeric quasi-identifiers are binned or microaggregated, categorical ones generalized or
 *          suppressed; rows still in classes smaller than k then lose every quasi-identifier value.
 *          Instances are immutable and hold no per-call state.
 */
class KAnonymity {
public:
    /**
     * @throws Kanon::ConfigurationException when k < 2.
     */
    explicit KAnonymity(int k = 2, std::shared_ptr<Logger> logger = nullptr);

    int k() const noexcept { return k_; }

    /**
     * @brief Returns an anonymized copy of table; table itself is never modified.
     * @pre quasiIdentifiers is non-empty, duplicate-free and names columns of table.
     * @post Same row count and column order as table; only quasi-identifier columns differ.
     * @throws Kanon::ValidationException on a malformed table or a bad quasi-identifier set
     *         (missingColumns() lists every absent name).
     * @throws Kanon::ConfigurationException on an unsupported method name or binCount == 0.
     */
    TypedTable anonymize(const TypedTable& table,
                         const std::vector<std::string>& quasiIdentifiers,
                         const AnonymizationOptions& options = AnonymizationOptions{},
                         AnonymizationReport* report = nullptr) const;

    /**
     * @brief True iff every quasi-identifier tuple occurs at least k times.
     * @throws Kanon::ValidationException when a quasi-identifier is not a column of table.
     */
    bool verify(const TypedTable& table, const std::vector<std::string>& quasiIdentifiers) const;

    /**
     * @brief Copy of table with all quasi-identifiers nulled for rows in classes smaller than k.
     * @throws Kanon::ValidationException when a quasi-identifier is not a column of table.
     */
    TypedTable applySuppression(const TypedTable& table,
                                const std::vector<std::string>& quasiIdentifiers,
                                size_t* rowsSuppressedOut = nullptr) const;

    InformationLossMetrics evaluateInformationLoss(const TypedTable& original,
                                                   const TypedTable& anonymized,
                                                   const std::vector<std::string>& quasiIdentifiers) const;

private:
    int k_;
    std::shared_ptr<Logger> logger_;

    std::vector<size_t> validateInputs(const TypedTable& table, const std::vector<std::string>& quasiIdentifiers) const;
    TypedColumn transformNumeric(const TypedColumn& col, const AnonymizationOptions& options) const;
    TypedColumn transformCategorical(const TypedColumn& col, const AnonymizationOptions& options) const;
};
