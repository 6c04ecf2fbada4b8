/// @file drift_engine_test.cpp
/// @brief Tests for the drift engine orchestration

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/error.h"
#include "drift/drift_engine.h"

namespace drifter::drift {
namespace {

Column NumericColumn(const std::string& name, const std::vector<double>& values) {
    Column column{name, {}};
    for (double v : values) {
        column.values.emplace_back(v);
    }
    return column;
}

Column RepeatedText(const std::string& name,
                    const std::vector<std::pair<std::string, int>>& counts,
                    int factor = 1) {
    Column column{name, {}};
    for (int f = 0; f < factor; ++f) {
        for (const auto& [category, count] : counts) {
            for (int i = 0; i < count; ++i) {
                column.values.emplace_back(category);
            }
        }
    }
    return column;
}

Column TextColumn(const std::string& name, const std::vector<std::string>& values) {
    Column column{name, {}};
    for (const auto& v : values) {
        column.values.emplace_back(v);
    }
    return column;
}

std::vector<double> UniformLevels(size_t n, int levels, std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, levels - 1);
    std::vector<double> values(n);
    for (auto& v : values) {
        v = static_cast<double>(dist(rng));
    }
    return values;
}

std::vector<std::string> DrawCategories(size_t n, std::mt19937& rng) {
    static const std::vector<std::string> kNames = {"web", "ios", "android", "api", "batch", "other"};
    std::discrete_distribution<size_t> dist({30, 25, 20, 12, 8, 5});
    std::vector<std::string> values(n);
    for (auto& v : values) {
        v = kNames[dist(rng)];
    }
    return values;
}

std::vector<double> Normal(size_t n, double mean, std::mt19937& rng) {
    std::normal_distribution<double> dist(mean, 1.0);
    std::vector<double> values(n);
    for (auto& v : values) {
        v = dist(rng);
    }
    return values;
}

Dataset MakeDataset(const std::string& name, std::vector<Column> columns) {
    auto dataset = Dataset::Create(name, std::move(columns));
    EXPECT_TRUE(dataset.ok()) << dataset.status();
    return std::move(*dataset);
}

std::unique_ptr<DriftEngine> MakeEngine(DriftConfig config = DriftConfig::Default()) {
    auto engine = DriftEngine::Create(std::move(config));
    EXPECT_TRUE(engine.ok()) << engine.status();
    return std::move(*engine);
}

const auto kRunTime = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

// =============================================================================
// Construction
// =============================================================================

TEST(DriftEngineTest, InvalidConfigurationFailsCreate) {
    DriftConfig config;
    config.thresholds.per_test[TestKind::kPopulationStabilityIndex] = -1.0;

    auto engine = DriftEngine::Create(config);
    ASSERT_FALSE(engine.ok());
    EXPECT_EQ(GetErrorCode(engine.status()), ErrorCode::kConfigurationError);
}

TEST(DriftEngineTest, CreateIsTheOnlyConstructionPath) {
    static_assert(!std::is_constructible_v<DriftEngine, DriftConfig>);
    static_assert(!std::is_default_constructible_v<DriftEngine>);

    DriftConfig config;
    config.num_threads = 2;
    auto engine = DriftEngine::Create(config);
    ASSERT_TRUE(engine.ok()) << engine.status();
    EXPECT_EQ((*engine)->GetConfig().num_threads, 2u);
}

TEST(DriftEngineTest, FormatRunTimestamp) {
    EXPECT_EQ(FormatRunTimestamp(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatRunTimestamp(kRunTime), "2023-11-14T22:13:20Z");
}

// =============================================================================
// Scenarios
// =============================================================================

TEST(DriftEngineTest, CollapsedCategoriesAreFlagged) {
    auto reference = MakeDataset("ref", {NumericColumn("A", {1, 1, 2, 2, 3, 3})});
    auto current = MakeDataset("cur", {NumericColumn("A", {1, 1, 1, 1, 1, 1})});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok()) << report.status();
    ASSERT_EQ(report->results.size(), 1u);

    const auto& result = report->results[0];
    EXPECT_EQ(result.status, ColumnStatus::kDrifted);
    EXPECT_EQ(*result.test, TestKind::kChiSquared);
    EXPECT_GT(result.score, result.threshold);
    EXPECT_GT(result.score, DefaultThreshold(TestKind::kChiSquared));

    // chi2 = 6 on 2 degrees of freedom
    EXPECT_NEAR(result.score, 1.0 - std::exp(-3.0), 1e-9);
    EXPECT_NEAR(result.statistic, std::sqrt(0.5), 1e-12);
    EXPECT_TRUE(report->overall_drift);
}

TEST(DriftEngineTest, IdenticalContinuousSamplesDoNotDrift) {
    std::mt19937 rng(11);
    auto values = Normal(1000, 0.0, rng);
    auto reference = MakeDataset("ref", {NumericColumn("B", values)});
    auto current = MakeDataset("cur", {NumericColumn("B", values)});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());

    const auto& result = report->results[0];
    EXPECT_EQ(result.kind, ColumnKind::kContinuous);
    EXPECT_NEAR(result.score, 0.0, 1e-12);
    EXPECT_FALSE(result.drifted);
    EXPECT_EQ(result.severity, Severity::kNone);
    EXPECT_FALSE(report->overall_drift);
}

TEST(DriftEngineTest, ShiftedColumnIsFlagged) {
    std::mt19937 rng(12);
    auto values = Normal(500, 0.0, rng);
    auto shifted = values;
    for (auto& v : shifted) {
        v += 2.0;
    }

    auto reference = MakeDataset("ref", {NumericColumn("x", values)});
    auto current = MakeDataset("cur", {NumericColumn("x", shifted)});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report->results[0].drifted);
    EXPECT_EQ(report->results[0].severity, Severity::kHigh);
    EXPECT_TRUE(report->results[0].ranges_overlap);
}

TEST(DriftEngineTest, FalsePositiveRateNearSignificanceLevel) {
    auto engine = MakeEngine();
    std::mt19937 rng(2024);

    constexpr int kTrials = 400;
    int drifted = 0;
    for (int trial = 0; trial < kTrials; ++trial) {
        auto result = engine->EvaluateColumn(NumericColumn("x", Normal(300, 0.0, rng)),
                                             NumericColumn("x", Normal(300, 0.0, rng)));
        ASSERT_TRUE(result.IsEvaluated());
        if (result.drifted) {
            ++drifted;
        }
    }

    // Nominal alpha is 0.05
    const double rate = static_cast<double>(drifted) / kTrials;
    EXPECT_GT(rate, 0.01);
    EXPECT_LT(rate, 0.10);
}

TEST(DriftEngineTest, DiscreteFalsePositiveRateNearSignificanceLevel) {
    auto engine = MakeEngine();
    std::mt19937 rng(2025);

    constexpr int kTrials = 400;
    int drifted = 0;
    for (int trial = 0; trial < kTrials; ++trial) {
        auto result = engine->EvaluateColumn(NumericColumn("visits", UniformLevels(200, 5, rng)),
                                             NumericColumn("visits", UniformLevels(200, 5, rng)));
        ASSERT_TRUE(result.IsEvaluated());
        ASSERT_EQ(result.kind, ColumnKind::kDiscrete);
        if (result.drifted) {
            ++drifted;
        }
    }

    const double rate = static_cast<double>(drifted) / kTrials;
    EXPECT_GT(rate, 0.01);
    EXPECT_LT(rate, 0.10);
}

TEST(DriftEngineTest, CategoricalFalsePositiveRateNearSignificanceLevel) {
    auto engine = MakeEngine();
    std::mt19937 rng(2026);

    constexpr int kTrials = 400;
    int drifted = 0;
    for (int trial = 0; trial < kTrials; ++trial) {
        auto result = engine->EvaluateColumn(TextColumn("channel", DrawCategories(200, rng)),
                                             TextColumn("channel", DrawCategories(200, rng)));
        ASSERT_TRUE(result.IsEvaluated());
        ASSERT_EQ(result.kind, ColumnKind::kCategorical);
        ASSERT_EQ(*result.test, TestKind::kChiSquared);
        if (result.drifted) {
            ++drifted;
        }
    }

    const double rate = static_cast<double>(drifted) / kTrials;
    EXPECT_GT(rate, 0.01);
    EXPECT_LT(rate, 0.10);
}

TEST(DriftEngineTest, SmallContinuousSamplesStayContinuous) {
    auto engine = MakeEngine();
    std::mt19937 rng(2027);

    constexpr int kTrials = 400;
    int drifted = 0;
    for (int trial = 0; trial < kTrials; ++trial) {
        auto result = engine->EvaluateColumn(NumericColumn("x", Normal(15, 0.0, rng)),
                                             NumericColumn("x", Normal(15, 0.0, rng)));
        ASSERT_TRUE(result.IsEvaluated());
        ASSERT_EQ(result.kind, ColumnKind::kContinuous);
        ASSERT_EQ(*result.test, TestKind::kKolmogorovSmirnov);
        if (result.drifted) {
            ++drifted;
        }
    }

    // The asymptotic KS p-value is conservative at this size
    const double rate = static_cast<double>(drifted) / kTrials;
    EXPECT_LT(rate, 0.10);
}

// =============================================================================
// Report structure
// =============================================================================

TEST(DriftEngineTest, ColumnOrderMatchesReference) {
    std::mt19937 rng(13);
    std::vector<Column> ref_columns;
    std::vector<Column> cur_columns;
    std::vector<std::string> names;
    for (int i = 15; i >= 0; --i) {
        names.push_back("col_" + std::to_string(i));
        ref_columns.push_back(NumericColumn(names.back(), Normal(200, 0.0, rng)));
    }
    // Current lists its columns in a different order
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        cur_columns.push_back(NumericColumn(*it, Normal(200, 0.0, rng)));
    }

    DriftConfig config;
    config.num_threads = 4;
    auto report = MakeEngine(config)->Compare(MakeDataset("ref", std::move(ref_columns)),
                                              MakeDataset("cur", std::move(cur_columns)),
                                              kRunTime);
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report->results.size(), names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(report->results[i].column, names[i]);
    }
    EXPECT_EQ(report->requested_columns, names);
}

TEST(DriftEngineTest, InlineAndPooledRunsAgree) {
    std::mt19937 rng(14);
    std::vector<Column> ref_columns;
    std::vector<Column> cur_columns;
    for (int i = 0; i < 8; ++i) {
        const std::string name = "f" + std::to_string(i);
        ref_columns.push_back(NumericColumn(name, Normal(150, 0.0, rng)));
        cur_columns.push_back(NumericColumn(name, Normal(150, i * 0.2, rng)));
    }
    auto reference = MakeDataset("ref", std::move(ref_columns));
    auto current = MakeDataset("cur", std::move(cur_columns));

    DriftConfig inline_config;
    inline_config.num_threads = 1;
    DriftConfig pooled_config;
    pooled_config.num_threads = 3;

    auto inline_report = MakeEngine(inline_config)->Compare(reference, current, kRunTime);
    auto pooled_report = MakeEngine(pooled_config)->Compare(reference, current, kRunTime);
    ASSERT_TRUE(inline_report.ok());
    ASSERT_TRUE(pooled_report.ok());
    ASSERT_EQ(inline_report->results.size(), pooled_report->results.size());
    for (size_t i = 0; i < inline_report->results.size(); ++i) {
        EXPECT_EQ(inline_report->results[i].column, pooled_report->results[i].column);
        EXPECT_EQ(inline_report->results[i].score, pooled_report->results[i].score);
        EXPECT_EQ(inline_report->results[i].status, pooled_report->results[i].status);
    }
    EXPECT_EQ(inline_report->overall_drift, pooled_report->overall_drift);
}

TEST(DriftEngineTest, RepeatedRunsAreIdentical) {
    std::mt19937 rng(15);
    auto reference = MakeDataset("ref", {
        NumericColumn("x", Normal(300, 0.0, rng)),
        RepeatedText("c", {{"a", 100}, {"b", 200}}),
    });
    auto current = MakeDataset("cur", {
        NumericColumn("x", Normal(300, 0.3, rng)),
        RepeatedText("c", {{"a", 150}, {"b", 150}}),
    });

    auto engine = MakeEngine();
    auto first = engine->Compare(reference, current, kRunTime);
    auto second = engine->Compare(reference, current, kRunTime);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(first->run_timestamp, second->run_timestamp);
    ASSERT_EQ(first->results.size(), second->results.size());
    for (size_t i = 0; i < first->results.size(); ++i) {
        EXPECT_EQ(first->results[i].statistic, second->results[i].statistic);
        EXPECT_EQ(first->results[i].p_value, second->results[i].p_value);
        EXPECT_EQ(first->results[i].score, second->results[i].score);
        EXPECT_EQ(first->results[i].severity, second->results[i].severity);
    }
    EXPECT_EQ(first->drifted_fraction, second->drifted_fraction);
}

// =============================================================================
// Partial failures
// =============================================================================

TEST(DriftEngineTest, AllNullColumnIsIsolated) {
    std::mt19937 rng(16);
    std::vector<Column> ref_columns;
    std::vector<Column> cur_columns;
    for (int i = 0; i < 9; ++i) {
        const std::string name = "healthy_" + std::to_string(i);
        ref_columns.push_back(NumericColumn(name, Normal(200, 0.0, rng)));
        cur_columns.push_back(NumericColumn(name, Normal(200, i < 3 ? 1.5 : 0.0, rng)));
    }

    auto baseline = MakeEngine()->Compare(MakeDataset("ref", ref_columns),
                                          MakeDataset("cur", cur_columns), kRunTime);
    ASSERT_TRUE(baseline.ok());

    ref_columns.insert(ref_columns.begin() + 4, Column{"empty", std::vector<Value>(200)});
    cur_columns.insert(cur_columns.begin() + 4, Column{"empty", std::vector<Value>(200)});
    auto report = MakeEngine()->Compare(MakeDataset("ref", ref_columns),
                                        MakeDataset("cur", cur_columns), kRunTime);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->results.size(), 10u);
    EXPECT_EQ(report->not_evaluated_count, 1u);
    EXPECT_EQ(report->evaluated_count, 9u);

    const TestResult* empty = report->FindResult("empty");
    ASSERT_NE(empty, nullptr);
    EXPECT_EQ(empty->status, ColumnStatus::kNotEvaluated);
    EXPECT_EQ(empty->reason_code, ErrorCode::kDegenerateColumn);
    EXPECT_FALSE(empty->reason.empty());

    for (const auto& expected : baseline->results) {
        const TestResult* actual = report->FindResult(expected.column);
        ASSERT_NE(actual, nullptr);
        EXPECT_EQ(actual->status, expected.status);
        EXPECT_EQ(actual->score, expected.score);
    }
    EXPECT_EQ(report->drifted_count, baseline->drifted_count);
    EXPECT_EQ(report->drifted_fraction, baseline->drifted_fraction);
}

TEST(DriftEngineTest, SchemaMismatchIsReportedNotFatal) {
    auto reference = MakeDataset("ref", {
        NumericColumn("shared", {1, 2, 3, 4, 5, 6}),
        NumericColumn("only_ref", {1, 2, 3, 4, 5, 6}),
    });
    auto current = MakeDataset("cur", {
        NumericColumn("only_cur", {1, 2, 3, 4, 5, 6}),
        NumericColumn("shared", {1, 2, 3, 4, 5, 6}),
    });

    DriftConfig config;
    config.columns = {"only_ref", "shared", "only_cur", "nowhere"};
    auto report = MakeEngine(config)->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok()) << report.status();

    ASSERT_EQ(report->results.size(), 1u);
    EXPECT_EQ(report->results[0].column, "shared");
    EXPECT_EQ(report->results[0].status, ColumnStatus::kNotDrifted);

    ASSERT_EQ(report->schema_mismatches.size(), 3u);
    EXPECT_EQ(report->schema_mismatches[0].column, "only_ref");
    EXPECT_TRUE(report->schema_mismatches[0].in_reference);
    EXPECT_FALSE(report->schema_mismatches[0].in_current);
    EXPECT_EQ(report->schema_mismatches[1].column, "only_cur");
    EXPECT_FALSE(report->schema_mismatches[1].in_reference);
    EXPECT_TRUE(report->schema_mismatches[1].in_current);
    EXPECT_EQ(report->schema_mismatches[2].column, "nowhere");
    EXPECT_FALSE(report->schema_mismatches[2].in_reference);
    EXPECT_FALSE(report->schema_mismatches[2].in_current);
    for (const auto& mismatch : report->schema_mismatches) {
        EXPECT_EQ(mismatch.reason_code, ErrorCode::kSchemaMismatch) << mismatch.column;
        EXPECT_FALSE(mismatch.reason.empty());
    }
    EXPECT_EQ(report->schema_mismatches[1].reason,
              "column is missing from reference dataset 'ref'");

    EXPECT_EQ(report->not_evaluated_count, 3u);
    EXPECT_EQ(report->requested_columns.size(), 4u);
}

TEST(DriftEngineTest, ColumnAddedInCurrentIsReported) {
    auto reference = MakeDataset("ref", {
        NumericColumn("a", {1, 2, 3, 4, 5, 6}),
        NumericColumn("b", {1, 2, 3, 4, 5, 6}),
    });
    auto current = MakeDataset("cur", {
        NumericColumn("new_feature", {1, 2, 3, 4, 5, 6}),
        NumericColumn("b", {1, 2, 3, 4, 5, 6}),
        NumericColumn("a", {1, 2, 3, 4, 5, 6}),
    });

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok()) << report.status();

    ASSERT_EQ(report->results.size(), 2u);
    EXPECT_EQ(report->results[0].column, "a");
    EXPECT_EQ(report->results[1].column, "b");

    ASSERT_EQ(report->schema_mismatches.size(), 1u);
    const auto& added = report->schema_mismatches[0];
    EXPECT_EQ(added.column, "new_feature");
    EXPECT_FALSE(added.in_reference);
    EXPECT_TRUE(added.in_current);
    EXPECT_EQ(added.reason_code, ErrorCode::kSchemaMismatch);

    EXPECT_EQ(report->requested_columns,
              (std::vector<std::string>{"a", "b", "new_feature"}));
    EXPECT_EQ(report->not_evaluated_count, 1u);
}

TEST(DriftEngineTest, SmallSampleIsInsufficientData) {
    auto reference = MakeDataset("ref", {NumericColumn("x", {1.5, 2.5})});
    auto current = MakeDataset("cur", {NumericColumn("x", {1.5, 9.5})});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->results[0].status, ColumnStatus::kNotEvaluated);
    EXPECT_EQ(report->results[0].reason_code, ErrorCode::kInsufficientData);
    EXPECT_FALSE(report->overall_drift);
}

TEST(DriftEngineTest, ConstantReferenceWithVarianceTestIsDegenerate) {
    DriftConfig config;
    config.tests.per_column["x"] = TestKind::kWasserstein;

    auto reference = MakeDataset("ref", {NumericColumn("x", std::vector<double>(50, 3.0))});
    auto current = MakeDataset("cur", {NumericColumn("x", std::vector<double>(50, 4.0))});

    auto report = MakeEngine(config)->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    const auto& result = report->results[0];
    EXPECT_EQ(result.status, ColumnStatus::kNotEvaluated);
    EXPECT_EQ(result.reason_code, ErrorCode::kDegenerateColumn);
    EXPECT_EQ(*result.test, TestKind::kWasserstein);
    EXPECT_FALSE(result.ranges_overlap);
}

TEST(DriftEngineTest, NumericTestOnTextColumnIsNotEvaluated) {
    DriftConfig config;
    config.tests.per_column["c"] = TestKind::kKolmogorovSmirnov;

    auto reference = MakeDataset("ref", {RepeatedText("c", {{"a", 10}, {"b", 10}})});
    auto current = MakeDataset("cur", {RepeatedText("c", {{"a", 10}, {"b", 10}})});

    auto report = MakeEngine(config)->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->results[0].status, ColumnStatus::kNotEvaluated);
    EXPECT_EQ(report->results[0].reason_code, ErrorCode::kInvalidArgument);
}

// =============================================================================
// Invariance and configuration
// =============================================================================

const std::vector<std::pair<std::string, int>> kReferenceCounts = {{"a", 40}, {"b", 35}, {"c", 25}};
const std::vector<std::pair<std::string, int>> kCurrentCounts = {{"a", 25}, {"b", 35}, {"c", 40}};

TEST(DriftEngineTest, PsiScoreIgnoresDuplication) {
    DriftConfig config;
    config.tests.categorical = TestKind::kPopulationStabilityIndex;
    auto engine = MakeEngine(config);

    auto small = engine->Compare(MakeDataset("ref", {RepeatedText("c", kReferenceCounts)}),
                                 MakeDataset("cur", {RepeatedText("c", kCurrentCounts)}),
                                 kRunTime);
    auto large = engine->Compare(MakeDataset("ref", {RepeatedText("c", kReferenceCounts, 10)}),
                                 MakeDataset("cur", {RepeatedText("c", kCurrentCounts, 10)}),
                                 kRunTime);
    ASSERT_TRUE(small.ok());
    ASSERT_TRUE(large.ok());
    EXPECT_NEAR(small->results[0].score, large->results[0].score, 1e-9);
}

TEST(DriftEngineTest, ChiSquaredEffectSizeIgnoresDuplication) {
    auto engine = MakeEngine();

    auto small = engine->Compare(MakeDataset("ref", {RepeatedText("c", kReferenceCounts)}),
                                 MakeDataset("cur", {RepeatedText("c", kCurrentCounts)}),
                                 kRunTime);
    auto large = engine->Compare(MakeDataset("ref", {RepeatedText("c", kReferenceCounts, 10)}),
                                 MakeDataset("cur", {RepeatedText("c", kCurrentCounts, 10)}),
                                 kRunTime);
    ASSERT_TRUE(small.ok());
    ASSERT_TRUE(large.ok());

    // Cramér's V depends on proportions only; the p-value sharpens with size
    EXPECT_NEAR(small->results[0].statistic, large->results[0].statistic, 1e-9);
    ASSERT_TRUE(small->results[0].p_value.has_value());
    ASSERT_TRUE(large->results[0].p_value.has_value());
    EXPECT_LT(*large->results[0].p_value, *small->results[0].p_value);
    EXPECT_GT(large->results[0].score, small->results[0].score);
}

TEST(DriftEngineTest, MixedKindsCompareAsCategorical) {
    auto reference = MakeDataset("ref", {NumericColumn("x", {1, 2, 1, 2, 1, 2, 1, 2, 1, 2, 1, 2})});
    Column current_column = RepeatedText("x", {{"1", 6}, {"unknown", 6}});
    auto current = MakeDataset("cur", {current_column});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->results[0].kind, ColumnKind::kCategorical);
    EXPECT_EQ(*report->results[0].test, TestKind::kChiSquared);
    EXPECT_TRUE(report->results[0].drifted);
}

TEST(DriftEngineTest, PerColumnThresholdOverride) {
    std::mt19937 rng(17);
    auto values = Normal(400, 0.0, rng);
    auto slightly = Normal(400, 0.25, rng);

    DriftConfig config;
    config.tests.continuous = TestKind::kWasserstein;
    config.tests.per_column["x"] = TestKind::kWasserstein;
    config.thresholds.per_column["x"] = 10.0;

    auto reference = MakeDataset("ref", {NumericColumn("x", values), NumericColumn("y", values)});
    auto current = MakeDataset("cur", {NumericColumn("x", slightly), NumericColumn("y", slightly)});

    auto report = MakeEngine(config)->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    EXPECT_DOUBLE_EQ(report->FindResult("x")->threshold, 10.0);
    EXPECT_FALSE(report->FindResult("x")->drifted);
    EXPECT_DOUBLE_EQ(report->FindResult("y")->threshold, 0.1);
    EXPECT_TRUE(report->FindResult("y")->drifted);
}

TEST(DriftEngineTest, SummariesAreFilled) {
    auto reference = MakeDataset("ref", {Column{"x", {Value{1.0}, Value{}, Value{3.0},
                                                      Value{5.0}, Value{7.0}, Value{9.0}}}});
    auto current = MakeDataset("cur", {NumericColumn("x", {1, 3, 5, 7, 9, 11})});

    auto report = MakeEngine()->Compare(reference, current, kRunTime);
    ASSERT_TRUE(report.ok());
    const auto& result = report->results[0];
    EXPECT_EQ(result.reference.count, 6u);
    EXPECT_EQ(result.reference.null_count, 1u);
    EXPECT_EQ(result.reference.distinct_count, 5u);
    EXPECT_DOUBLE_EQ(*result.reference.mean, 5.0);
    EXPECT_DOUBLE_EQ(*result.current.max, 11.0);
    EXPECT_EQ(report->reference_rows, 6u);
    EXPECT_EQ(report->run_timestamp, "2023-11-14T22:13:20Z");
}

}  // namespace
}  // namespace drifter::drift
