#include "InformationLoss.h"
#include "CommonUtils.h"
#include "EquivalenceClasses.h"
#include "KanonExceptions.h"
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

std::vector<size_t> resolveColumns(const TypedTable& table,
                                   const std::vector<std::string>& names,
                                   const std::string& tableRole) {
    std::vector<size_t> indices;
    std::vector<std::string> missing;
    for (const auto& name : names) {
        const int idx = table.findColumnIndex(name);
        if (idx < 0) {
            missing.push_back(name);
        } else {
            indices.push_back(static_cast<size_t>(idx));
        }
    }
    if (!missing.empty()) {
        throw Kanon::ValidationException("Missing columns in " + tableRole + " table: " + CommonUtils::joinList(missing, ", "),
                                         missing);
    }
    return indices;
}

size_t distinctLabels(const TypedColumn& col) {
    const auto& values = std::get<StrVec>(col.values);
    std::unordered_set<std::string> seen;
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.isMissing(r)) seen.insert(values[r]);
    }
    return seen.size();
}

bool observedRange(const TypedColumn& col, double& minOut, double& maxOut) {
    const auto& values = std::get<NumVec>(col.values);
    bool any = false;
    minOut = std::numeric_limits<double>::infinity();
    maxOut = -std::numeric_limits<double>::infinity();
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.isMissing(r)) continue;
        minOut = std::min(minOut, values[r]);
        maxOut = std::max(maxOut, values[r]);
        any = true;
    }
    return any;
}
}

InformationLossMetrics evaluateInformationLoss(const TypedTable& original,
                                               const TypedTable& anonymized,
                                               const std::vector<std::string>& quasiIdentifiers) {
    if (quasiIdentifiers.empty()) {
        throw Kanon::ValidationException("At least one quasi-identifier is required");
    }
    if (original.rowCount() != anonymized.rowCount()) {
        throw Kanon::ValidationException("Row count mismatch: original has " + std::to_string(original.rowCount()) +
                                         ", anonymized has " + std::to_string(anonymized.rowCount()));
    }
    const std::vector<size_t> originalIdx = resolveColumns(original, quasiIdentifiers, "original");
    const std::vector<size_t> anonymizedIdx = resolveColumns(anonymized, quasiIdentifiers, "anonymized");

    InformationLossMetrics metrics;
    const size_t rows = anonymized.rowCount();
    const double rowsD = static_cast<double>(rows);

    size_t totalSuppressed = 0;
    for (size_t i = 0; i < quasiIdentifiers.size(); ++i) {
        const size_t nulls = anonymized.column(anonymizedIdx[i]).missingCount();
        totalSuppressed += nulls;
        metrics[quasiIdentifiers[i] + "_suppression_rate"] = rows == 0 ? 0.0 : static_cast<double>(nulls) / rowsD * 100.0;
    }
    const double totalCells = rowsD * static_cast<double>(quasiIdentifiers.size());
    metrics["overall_suppression_rate"] = rows == 0 ? 0.0 : static_cast<double>(totalSuppressed) / totalCells * 100.0;

    for (size_t i = 0; i < quasiIdentifiers.size(); ++i) {
        const TypedColumn& before = original.column(originalIdx[i]);
        const TypedColumn& after = anonymized.column(anonymizedIdx[i]);
        if (before.type != ColumnType::NUMERIC || after.type != ColumnType::CATEGORICAL) continue;

        const size_t labels = distinctLabels(after);
        double minv = 0.0;
        double maxv = 0.0;
        if (labels == 0 || !observedRange(before, minv, maxv)) continue;
        metrics[quasiIdentifiers[i] + "_avg_generalization"] = (maxv - minv) / static_cast<double>(labels);
    }

    const auto classes = EquivalenceClasses::build(anonymized, anonymizedIdx);
    metrics["equivalence_class_count"] = static_cast<double>(classes.size());
    metrics["avg_equivalence_class_size"] = classes.empty() ? 0.0 : rowsD / static_cast<double>(classes.size());

    return metrics;
}
