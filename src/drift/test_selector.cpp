/// @file test_selector.cpp
/// @brief Test selection policy implementation

#include "drift/test_selector.h"

#include <string>
#include <utility>

#include <absl/strings/str_cat.h>

namespace drifter::drift {

TestFamily FamilyOf(TestKind kind) {
    return IsFrequencyTest(kind) ? TestFamily::kFrequency : TestFamily::kDistance;
}

TestSelector::TestSelector(DriftConfig::TestSelectionConfig config)
    : config_(std::move(config)) {}

ColumnKind TestSelector::ResolveKind(const ColumnProfile& reference,
                                     const ColumnProfile& current) {
    if (reference.kind == ColumnKind::kCategorical || current.kind == ColumnKind::kCategorical) {
        return ColumnKind::kCategorical;
    }
    if (reference.AllNull()) {
        return current.kind;
    }
    if (current.AllNull()) {
        return reference.kind;
    }
    // Numeric on both sides: one continuous sample makes the pair continuous
    if (reference.kind == ColumnKind::kContinuous || current.kind == ColumnKind::kContinuous) {
        return ColumnKind::kContinuous;
    }
    return ColumnKind::kDiscrete;
}

TestPlan TestSelector::Skip(ColumnKind kind, std::optional<TestKind> test,
                            const absl::Status& why) {
    TestPlan plan;
    plan.family = TestFamily::kSkip;
    plan.kind = kind;
    plan.test = test;
    plan.skip_code = GetErrorCode(why);
    plan.skip_reason = std::string(why.message());
    return plan;
}

TestPlan TestSelector::Select(const ColumnProfile& reference,
                              const ColumnProfile& current) const {
    const ColumnKind kind = ResolveKind(reference, current);

    if (reference.AllNull()) {
        return Skip(kind, std::nullopt,
                    DegenerateColumnError("all values are missing in the reference dataset"));
    }
    if (current.AllNull()) {
        return Skip(kind, std::nullopt,
                    DegenerateColumnError("all values are missing in the current dataset"));
    }

    TestKind test;
    auto override_it = config_.per_column.find(reference.column);
    if (override_it != config_.per_column.end()) {
        test = override_it->second;
    } else {
        switch (kind) {
            case ColumnKind::kContinuous:
                test = config_.continuous;
                break;
            case ColumnKind::kDiscrete:
                test = config_.discrete;
                break;
            case ColumnKind::kCategorical:
            default:
                test = config_.categorical;
                break;
        }
    }

    if (RequiresNumeric(test) && kind == ColumnKind::kCategorical) {
        return Skip(kind, test,
                    InvalidArgumentError(absl::StrCat(
                        std::string(TestKindDisplayName(test)),
                        " needs numeric values but the column is categorical")));
    }

    if (RequiresVariance(test) && reference.ZeroVariance()) {
        return Skip(kind, test,
                    DegenerateColumnError(absl::StrCat(
                        "reference column has a single distinct value; ",
                        std::string(TestKindDisplayName(test)), " needs non-zero variance")));
    }

    TestPlan plan;
    plan.family = FamilyOf(test);
    plan.kind = kind;
    plan.test = test;
    return plan;
}

}  // namespace drifter::drift
