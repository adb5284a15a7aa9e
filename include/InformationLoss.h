#pragma once
#include "TypedTable.h"
#include <map>
#include <string>
#include <vector>

using InformationLossMetrics = std::map<std::string, double>;

/**
 * @brief Utility-loss metrics comparing an original table with its anonymized counterpart.
 * @details Keys:
 *   "<col>_suppression_rate"     nulls in col / rows * 100, for each quasi-identifier
 *   "overall_suppression_rate"   nulls over all quasi-identifier cells / (rows * |qi|) * 100
 *   "<col>_avg_generalization"   (original max - original min) / distinct labels, only for columns that
 *                                were numeric originally and are categorical after anonymization
 *   "equivalence_class_count"    classes over the anonymized quasi-identifier tuple, null groups included
 *   "avg_equivalence_class_size" rows / equivalence_class_count
 * With zero rows every rate and the average class size are 0.
 * @throws Kanon::ValidationException when a quasi-identifier is missing from either table, the set is empty,
 *         or the row counts differ.
 */
InformationLossMetrics evaluateInformationLoss(const TypedTable& original,
                                               const TypedTable& anonymized,
                                               const std::vector<std::string>& quasiIdentifiers);
