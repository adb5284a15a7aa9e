/**
 * @file test_numeric_transforms.cpp
 * @brief Quantile binning and microaggregation of numeric columns.
 */

#include <gtest/gtest.h>
#include "KanonExceptions.h"
#include "NumericTransforms.h"
#include "StatsUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

using StrVec = std::vector<std::string>;
using NumVec = std::vector<double>;

// 40 ages with an unflagged NaN in every third row.
static TypedColumn agesWithNaN() {
    NumVec values;
    for (int i = 0; i < 40; ++i) {
        values.push_back(i % 3 == 0 ? std::numeric_limits<double>::quiet_NaN() : static_cast<double>(i));
    }
    return TypedColumn::numeric("age", values);
}

static std::set<std::string> distinctLabels(const TypedColumn& col) {
    std::set<std::string> out;
    const auto& values = std::get<StrVec>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.isMissing(r)) out.insert(values[r]);
    }
    return out;
}

// ============================================================================
// StatsUtils
// ============================================================================

TEST(StatsUtilsTest, PercentileInterpolates) {
    const NumVec sorted{10, 20, 30, 40};
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 0.5), 25.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 1.0), 40.0);
}

TEST(StatsUtilsTest, RangeMean) {
    const NumVec values{1, 2, 3, 10};
    EXPECT_DOUBLE_EQ(StatsUtils::rangeMean(values, 0, 3), 2.0);
    EXPECT_DOUBLE_EQ(StatsUtils::rangeMean(values, 3, 4), 10.0);
    EXPECT_DOUBLE_EQ(StatsUtils::rangeMean(values, 2, 2), 0.0);
}

TEST(StatsUtilsTest, EdgesCollapseOnSkewedInput) {
    const NumVec sorted{1, 1, 1, 1, 1, 1, 1, 1, 1, 100};
    const auto edges = StatsUtils::quantileBinEdges(sorted, 4);
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_DOUBLE_EQ(edges.front(), 1.0);
    EXPECT_DOUBLE_EQ(edges.back(), 100.0);
}

TEST(StatsUtilsTest, ConstantInputKeepsTwoEqualEdges) {
    const auto edges = StatsUtils::quantileBinEdges({7, 7, 7}, 3);
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_DOUBLE_EQ(edges[0], 7.0);
    EXPECT_DOUBLE_EQ(edges[1], 7.0);
}

// ============================================================================
// Quantile binning
// ============================================================================

TEST(QuantileBinningTest, SixDistinctValuesFiveBins) {
    auto col = TypedColumn::numeric("age", {21, 22, 23, 58, 59, 60});
    NumVec edges;
    auto out = NumericTransforms::discretizeQuantile(col, 5, &edges);

    EXPECT_EQ(out.type, ColumnType::CATEGORICAL);
    EXPECT_EQ(out.name, "age");
    EXPECT_EQ(edges, (NumVec{21, 22, 23, 58, 59, 60}));

    const auto& labels = std::get<StrVec>(out.values);
    EXPECT_EQ(labels, (StrVec{"21.00-22.00", "22.00-23.00", "23.00-58.00",
                              "58.00-59.00", "59.00-60.00", "59.00-60.00"}));
}

TEST(QuantileBinningTest, LabelCountNeverExceedsBinCount) {
    NumVec values;
    for (int i = 0; i < 97; ++i) values.push_back(static_cast<double>((i * 37) % 101));
    auto col = TypedColumn::numeric("v", values);

    for (size_t bins : {1u, 2u, 3u, 5u, 10u}) {
        NumVec edges;
        auto out = NumericTransforms::discretizeQuantile(col, bins, &edges);
        EXPECT_LE(distinctLabels(out).size(), bins);
        EXPECT_TRUE(std::is_sorted(edges.begin(), edges.end()));

        // Every value's label brackets the value.
        const auto& labels = std::get<StrVec>(out.values);
        for (size_t r = 0; r < values.size(); ++r) {
            const auto dash = labels[r].find('-');
            ASSERT_NE(dash, std::string::npos);
            const double low = std::stod(labels[r].substr(0, dash));
            const double high = std::stod(labels[r].substr(dash + 1));
            EXPECT_LE(low, values[r] + 0.005);
            EXPECT_GE(high, values[r] - 0.005);
        }
    }
}

TEST(QuantileBinningTest, SkewedColumnYieldsFewerBins) {
    auto col = TypedColumn::numeric("income", {1, 1, 1, 1, 1, 1, 1, 1, 1, 100});
    auto out = NumericTransforms::discretizeQuantile(col, 4);
    const auto labels = distinctLabels(out);
    ASSERT_EQ(labels.size(), 1u);
    EXPECT_EQ(*labels.begin(), "1.00-100.00");
}

TEST(QuantileBinningTest, ConstantColumnSingleLabel) {
    auto col = TypedColumn::numeric("v", {3.5, 3.5, 3.5});
    auto out = NumericTransforms::discretizeQuantile(col, 5);
    EXPECT_EQ(std::get<StrVec>(out.values), (StrVec{"3.50-3.50", "3.50-3.50", "3.50-3.50"}));
}

TEST(QuantileBinningTest, NullsStayNull) {
    auto col = TypedColumn::numeric("v", {1, 0, 3, 4}, {0, 1, 0, 0});
    auto out = NumericTransforms::discretizeQuantile(col, 2);
    EXPECT_TRUE(out.isMissing(1));
    EXPECT_EQ(out.missingCount(), 1u);
    EXPECT_FALSE(std::get<StrVec>(out.values)[0].empty());
}

TEST(QuantileBinningTest, NaNCellsBinnedAsNulls) {
    const auto col = agesWithNaN();
    EXPECT_EQ(col.missingCount(), 14u);

    NumVec edges;
    auto out = NumericTransforms::discretizeQuantile(col, 4, &edges);
    for (double e : edges) EXPECT_TRUE(std::isfinite(e));
    EXPECT_DOUBLE_EQ(edges.front(), 1.0);
    EXPECT_DOUBLE_EQ(edges.back(), 38.0);

    const auto& labels = std::get<StrVec>(out.values);
    for (size_t r = 0; r < labels.size(); ++r) {
        EXPECT_EQ(out.isMissing(r), r % 3 == 0) << r;
        if (!out.isMissing(r)) EXPECT_EQ(labels[r].find("nan"), std::string::npos) << labels[r];
    }
    EXPECT_GT(distinctLabels(out).size(), 1u);
}

TEST(QuantileBinningTest, RejectsCategoricalColumn) {
    auto col = TypedColumn::categorical("zip", {"A"});
    EXPECT_THROW(NumericTransforms::discretizeQuantile(col, 3), Kanon::DatasetException);
}

TEST(QuantileBinningTest, RangeLabelFormat) {
    EXPECT_EQ(NumericTransforms::rangeLabel(1.0, 2.346), "1.00-2.35");
    EXPECT_EQ(NumericTransforms::rangeLabel(-3.0, 0.0), "-3.00-0.00");
}

// ============================================================================
// Microaggregation
// ============================================================================

TEST(MicroaggregationTest, AgeScenarioGroupsOfThree) {
    auto col = TypedColumn::numeric("age", {21, 22, 23, 58, 59, 60});
    auto out = NumericTransforms::microaggregate(col, 3);
    EXPECT_EQ(out.type, ColumnType::NUMERIC);
    EXPECT_EQ(std::get<NumVec>(out.values), (NumVec{22, 22, 22, 59, 59, 59}));
}

TEST(MicroaggregationTest, UnsortedInputKeepsRowPositions) {
    auto col = TypedColumn::numeric("age", {60, 21, 59, 22});
    auto out = NumericTransforms::microaggregate(col, 2);
    EXPECT_EQ(std::get<NumVec>(out.values), (NumVec{59.5, 21.5, 59.5, 21.5}));
}

TEST(MicroaggregationTest, EqualValuesSplitAcrossGroupsByPosition) {
    auto out = NumericTransforms::microaggregate(TypedColumn::numeric("v", {1, 2, 2, 3}), 2);
    EXPECT_EQ(std::get<NumVec>(out.values), (NumVec{1.5, 1.5, 2.5, 2.5}));
}

TEST(MicroaggregationTest, GroupCountIsCeilOfRowsOverK) {
    NumVec values;
    for (int i = 0; i < 11; ++i) values.push_back(static_cast<double>(i));
    auto out = NumericTransforms::microaggregate(TypedColumn::numeric("v", values), 4);

    std::map<double, size_t> groups;
    for (double v : std::get<NumVec>(out.values)) ++groups[v];
    ASSERT_EQ(groups.size(), 3u);
    auto it = groups.begin();
    EXPECT_EQ(it->second, 4u);
    ++it;
    EXPECT_EQ(it->second, 4u);
    ++it;
    EXPECT_EQ(it->second, 3u); // remainder group kept
    EXPECT_DOUBLE_EQ(it->first, 9.0);
}

TEST(MicroaggregationTest, NullsExcluded) {
    auto col = TypedColumn::numeric("v", {10, 0, 20}, {0, 1, 0});
    auto out = NumericTransforms::microaggregate(col, 2);
    EXPECT_TRUE(out.isMissing(1));
    const auto& values = std::get<NumVec>(out.values);
    EXPECT_DOUBLE_EQ(values[0], 15.0);
    EXPECT_DOUBLE_EQ(values[2], 15.0);
}

TEST(MicroaggregationTest, NaNCellsExcludedFromGroups) {
    auto out = NumericTransforms::microaggregate(agesWithNaN(), 3);
    const auto& values = std::get<NumVec>(out.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (r % 3 == 0) {
            EXPECT_TRUE(out.isMissing(r)) << r;
        } else {
            EXPECT_TRUE(std::isfinite(values[r])) << r;
        }
    }
    // Present values 1,2,4,5,7,...: the top group is {37, 38} with mean 37.5.
    EXPECT_DOUBLE_EQ(values[38], 37.5);
    EXPECT_DOUBLE_EQ(values[1], 7.0 / 3.0);
}

TEST(MicroaggregationTest, RejectsCategoricalColumn) {
    auto col = TypedColumn::categorical("zip", {"A"});
    EXPECT_THROW(NumericTransforms::microaggregate(col, 2), Kanon::DatasetException);
}
