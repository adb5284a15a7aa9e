#include "CategoricalTransforms.h"
#include "KanonExceptions.h"
#include <vector>

namespace CategoricalTransforms {
namespace {
using StrVec = std::vector<std::string>;

const StrVec& categoricalValues(const TypedColumn& col, const char* operation) {
    if (col.type != ColumnType::CATEGORICAL || !std::holds_alternative<StrVec>(col.values)) {
        throw Kanon::DatasetException(std::string(operation) + " requires a categorical column: " + col.name);
    }
    return std::get<StrVec>(col.values);
}
}

std::unordered_map<std::string, size_t> valueCounts(const TypedColumn& col) {
    const StrVec& values = categoricalValues(col, "Frequency analysis");
    std::unordered_map<std::string, size_t> counts;
    counts.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.isMissing(r)) continue;
        ++counts[values[r]];
    }
    return counts;
}

TypedColumn generalizeRare(const TypedColumn& col, size_t k, const std::string& label) {
    const StrVec& values = categoricalValues(col, "Generalization");
    const auto counts = valueCounts(col);

    TypedColumn out = col;
    auto& outValues = std::get<StrVec>(out.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.isMissing(r)) continue;
        if (counts.at(values[r]) < k) outValues[r] = label;
    }
    return out;
}

TypedColumn suppressRare(const TypedColumn& col, size_t k) {
    const StrVec& values = categoricalValues(col, "Suppression");
    const auto counts = valueCounts(col);

    TypedColumn out = col;
    out.missing.resize(values.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.isMissing(r)) continue;
        if (counts.at(values[r]) < k) out.setMissing(r);
    }
    return out;
}

} // namespace CategoricalTransforms
