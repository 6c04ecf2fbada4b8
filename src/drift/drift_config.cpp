/// @file drift_config.cpp
/// @brief Drift configuration loading and validation

#include "drift/drift_config.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <yaml-cpp/yaml.h>

#include "common/error.h"

namespace drifter::drift {

namespace {

bool IsPositiveFinite(double value) {
    return std::isfinite(value) && value > 0.0;
}

absl::StatusOr<TestKind> ParseTestNode(const YAML::Node& node) {
    return ParseTestKind(node.as<std::string>());
}

/// @brief Populate config from a parsed YAML document
absl::StatusOr<DriftConfig> ParseYaml(const YAML::Node& yaml) {
    DriftConfig config = DriftConfig::Default();

    if (!yaml || yaml.IsNull()) {
        return config;
    }
    if (!yaml.IsMap()) {
        return ConfigurationError("Drift configuration must be a YAML mapping");
    }

    if (auto th = yaml["thresholds"]) {
        if (th["global"]) {
            config.thresholds.global = th["global"].as<double>();
        }
        if (th["per_test"]) {
            for (const auto& kv : th["per_test"]) {
                DRIFTER_ASSIGN_OR_RETURN(TestKind kind, ParseTestNode(kv.first));
                config.thresholds.per_test[kind] = kv.second.as<double>();
            }
        }
        if (th["per_column"]) {
            for (const auto& kv : th["per_column"]) {
                config.thresholds.per_column[kv.first.as<std::string>()] = kv.second.as<double>();
            }
        }
    }

    if (auto tests = yaml["tests"]) {
        if (tests["continuous"]) {
            DRIFTER_ASSIGN_OR_RETURN(config.tests.continuous, ParseTestNode(tests["continuous"]));
        }
        if (tests["discrete"]) {
            DRIFTER_ASSIGN_OR_RETURN(config.tests.discrete, ParseTestNode(tests["discrete"]));
        }
        if (tests["categorical"]) {
            DRIFTER_ASSIGN_OR_RETURN(config.tests.categorical, ParseTestNode(tests["categorical"]));
        }
        if (tests["per_column"]) {
            for (const auto& kv : tests["per_column"]) {
                DRIFTER_ASSIGN_OR_RETURN(TestKind kind, ParseTestNode(kv.second));
                config.tests.per_column[kv.first.as<std::string>()] = kind;
            }
        }
    }

    if (auto prof = yaml["profiling"]) {
        if (prof["cardinality_cutoff"]) {
            config.profiling.cardinality_cutoff = prof["cardinality_cutoff"].as<size_t>();
        }
        if (prof["discrete_ratio"]) {
            config.profiling.discrete_ratio = prof["discrete_ratio"].as<double>();
        }
        if (prof["column_types"]) {
            for (const auto& kv : prof["column_types"]) {
                DRIFTER_ASSIGN_OR_RETURN(DeclaredType type,
                                         ParseDeclaredType(kv.second.as<std::string>()));
                config.profiling.column_types[kv.first.as<std::string>()] = type;
            }
        }
    }

    if (auto bins = yaml["binning"]) {
        if (bins["psi_bins"]) {
            config.binning.psi_bins = bins["psi_bins"].as<size_t>();
        }
        if (bins["psi_epsilon"]) {
            config.binning.psi_epsilon = bins["psi_epsilon"].as<double>();
        }
        if (bins["kl_bins"]) {
            config.binning.kl_bins = bins["kl_bins"].as<size_t>();
        }
        if (bins["kl_epsilon"]) {
            config.binning.kl_epsilon = bins["kl_epsilon"].as<double>();
        }
    }

    if (auto agg = yaml["aggregation"]) {
        if (agg["rule"]) {
            DRIFTER_ASSIGN_OR_RETURN(config.aggregation.rule,
                                     ParseAggregationRule(agg["rule"].as<std::string>()));
        }
        if (agg["fraction"]) {
            config.aggregation.fraction = agg["fraction"].as<double>();
        }
        if (agg["include_not_evaluated"]) {
            config.aggregation.include_not_evaluated = agg["include_not_evaluated"].as<bool>();
        }
    }

    if (auto sev = yaml["severity"]) {
        if (sev["medium_ratio"]) {
            config.severity.medium_ratio = sev["medium_ratio"].as<double>();
        }
        if (sev["high_ratio"]) {
            config.severity.high_ratio = sev["high_ratio"].as<double>();
        }
    }

    if (yaml["min_sample_size"]) {
        config.min_sample_size = yaml["min_sample_size"].as<size_t>();
    }
    if (yaml["trim_quantile"]) {
        config.trim_quantile = yaml["trim_quantile"].as<double>();
    }
    if (yaml["wasserstein_min_std"]) {
        config.wasserstein_min_std = yaml["wasserstein_min_std"].as<double>();
    }
    if (yaml["columns"]) {
        for (const auto& item : yaml["columns"]) {
            config.columns.push_back(item.as<std::string>());
        }
    }
    if (yaml["num_threads"]) {
        config.num_threads = yaml["num_threads"].as<size_t>();
    }
    if (yaml["small_sample_warning_rows"]) {
        config.small_sample_warning_rows = yaml["small_sample_warning_rows"].as<size_t>();
    }

    return config;
}

}  // namespace

DriftConfig DriftConfig::Default() {
    return DriftConfig{};
}

absl::StatusOr<DriftConfig> DriftConfig::LoadFromFile(const std::string& path) {
    try {
        return ParseYaml(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        return NotFoundError(absl::StrCat("Configuration file not found: ", path));
    } catch (const YAML::Exception& e) {
        return ConfigurationError(
            absl::StrCat("Failed to parse drift configuration ", path, ": ", e.what()));
    }
}

absl::StatusOr<DriftConfig> DriftConfig::LoadFromString(std::string_view yaml_content) {
    try {
        return ParseYaml(YAML::Load(std::string(yaml_content)));
    } catch (const YAML::Exception& e) {
        return ConfigurationError(
            absl::StrCat("Failed to parse drift configuration: ", e.what()));
    }
}

absl::StatusOr<DriftConfig> DriftConfig::LoadWithEnv(
    const std::string& path,
    const std::string& env_prefix) {

    auto config_or = LoadFromFile(path);
    if (!config_or.ok()) {
        return config_or;
    }

    DriftConfig config = *config_or;
    DRIFTER_RETURN_IF_ERROR(config.ApplyEnvironment(env_prefix));
    return config;
}

absl::Status DriftConfig::ApplyEnvironment(const std::string& env_prefix) {
    auto get_env = [&env_prefix](const std::string& name) -> std::string {
        std::string env_name = env_prefix + name;
        const char* value = std::getenv(env_name.c_str());
        return value ? std::string(value) : "";
    };

    auto parse_double = [&env_prefix](const std::string& name, const std::string& raw,
                                      double* out) -> absl::Status {
        if (!absl::SimpleAtod(raw, out)) {
            return ConfigurationError(
                absl::StrCat(env_prefix, name, " is not a number: '", raw, "'"));
        }
        return absl::OkStatus();
    };

    auto parse_size = [&env_prefix](const std::string& name, const std::string& raw,
                                    size_t* out) -> absl::Status {
        uint64_t value = 0;
        if (!absl::SimpleAtoi(raw, &value)) {
            return ConfigurationError(
                absl::StrCat(env_prefix, name, " is not a non-negative integer: '", raw, "'"));
        }
        *out = static_cast<size_t>(value);
        return absl::OkStatus();
    };

    std::string global_threshold = get_env("GLOBAL_THRESHOLD");
    if (!global_threshold.empty()) {
        double value = 0.0;
        DRIFTER_RETURN_IF_ERROR(parse_double("GLOBAL_THRESHOLD", global_threshold, &value));
        thresholds.global = value;
    }

    std::string min_samples = get_env("MIN_SAMPLE_SIZE");
    if (!min_samples.empty()) {
        DRIFTER_RETURN_IF_ERROR(parse_size("MIN_SAMPLE_SIZE", min_samples, &min_sample_size));
    }

    std::string threads = get_env("NUM_THREADS");
    if (!threads.empty()) {
        DRIFTER_RETURN_IF_ERROR(parse_size("NUM_THREADS", threads, &num_threads));
    }

    std::string rule = get_env("AGGREGATION_RULE");
    if (!rule.empty()) {
        DRIFTER_ASSIGN_OR_RETURN(aggregation.rule, ParseAggregationRule(rule));
    }

    std::string fraction = get_env("AGGREGATION_FRACTION");
    if (!fraction.empty()) {
        DRIFTER_RETURN_IF_ERROR(parse_double("AGGREGATION_FRACTION", fraction, &aggregation.fraction));
    }

    return absl::OkStatus();
}

absl::Status DriftConfig::Validate() const {
    // p-value scores live in [0, 1], so their thresholds must stay below 1
    auto check_threshold = [](double value, TestKind kind, std::string_view what) -> absl::Status {
        if (!IsPositiveFinite(value)) {
            return ConfigurationError(
                absl::StrCat(std::string(what), " must be a positive number, got ", value));
        }
        if (ScoreKindOf(kind) == ScoreKind::kPValue && value >= 1.0) {
            return ConfigurationError(
                absl::StrCat(std::string(what), " for ", std::string(TestKindToString(kind)),
                             " must be below 1 (score = 1 - p-value), got ", value));
        }
        return absl::OkStatus();
    };

    for (const auto& [kind, value] : thresholds.per_test) {
        DRIFTER_RETURN_IF_ERROR(check_threshold(value, kind, "Per-test threshold"));
    }

    if (thresholds.global.has_value()) {
        for (TestKind kind : {tests.continuous, tests.discrete, tests.categorical}) {
            DRIFTER_RETURN_IF_ERROR(check_threshold(*thresholds.global, kind, "Global threshold"));
        }
        for (const auto& [column, kind] : tests.per_column) {
            if (thresholds.per_column.count(column) == 0) {
                DRIFTER_RETURN_IF_ERROR(check_threshold(*thresholds.global, kind, "Global threshold"));
            }
        }
    }

    for (const auto& [column, value] : thresholds.per_column) {
        if (!IsPositiveFinite(value)) {
            return ConfigurationError(
                absl::StrCat("Threshold for column '", column, "' must be a positive number, got ",
                             value));
        }
        const std::string what = absl::StrCat("Threshold for column '", column, "'");
        auto test_it = tests.per_column.find(column);
        if (test_it != tests.per_column.end()) {
            DRIFTER_RETURN_IF_ERROR(check_threshold(value, test_it->second, what));
            continue;
        }
        // Without an override the column may get any kind's default test
        auto type_it = profiling.column_types.find(column);
        if (type_it != profiling.column_types.end() &&
            type_it->second == DeclaredType::kCategorical) {
            DRIFTER_RETURN_IF_ERROR(check_threshold(value, tests.categorical, what));
            continue;
        }
        for (TestKind kind : {tests.continuous, tests.discrete, tests.categorical}) {
            DRIFTER_RETURN_IF_ERROR(check_threshold(value, kind, what));
        }
    }

    if (!std::isfinite(profiling.discrete_ratio) ||
        profiling.discrete_ratio < 0.0 || profiling.discrete_ratio > 1.0) {
        return ConfigurationError(absl::StrCat(
            "profiling.discrete_ratio must be in [0, 1], got ", profiling.discrete_ratio));
    }

    if (binning.psi_bins < 2) {
        return ConfigurationError(
            absl::StrCat("binning.psi_bins must be at least 2, got ", binning.psi_bins));
    }
    if (binning.kl_bins < 2) {
        return ConfigurationError(
            absl::StrCat("binning.kl_bins must be at least 2, got ", binning.kl_bins));
    }
    if (!IsPositiveFinite(binning.psi_epsilon) || binning.psi_epsilon >= 1.0) {
        return ConfigurationError(absl::StrCat(
            "binning.psi_epsilon must be in (0, 1), got ", binning.psi_epsilon));
    }
    if (!IsPositiveFinite(binning.kl_epsilon) || binning.kl_epsilon >= 1.0) {
        return ConfigurationError(absl::StrCat(
            "binning.kl_epsilon must be in (0, 1), got ", binning.kl_epsilon));
    }

    if (!std::isfinite(aggregation.fraction) ||
        aggregation.fraction < 0.0 || aggregation.fraction > 1.0) {
        return ConfigurationError(absl::StrCat(
            "aggregation.fraction must be in [0, 1], got ", aggregation.fraction));
    }

    if (!(severity.medium_ratio > 1.0) || !(severity.high_ratio > severity.medium_ratio) ||
        !std::isfinite(severity.high_ratio)) {
        return ConfigurationError(absl::StrCat(
            "Severity ratios must satisfy 1 < medium_ratio < high_ratio, got ",
            severity.medium_ratio, " and ", severity.high_ratio));
    }

    if (min_sample_size == 0) {
        return ConfigurationError("min_sample_size must be at least 1");
    }

    if (trim_quantile.has_value() &&
        (!std::isfinite(*trim_quantile) || *trim_quantile <= 0.0 || *trim_quantile > 1.0)) {
        return ConfigurationError(
            absl::StrCat("trim_quantile must be in (0, 1], got ", *trim_quantile));
    }

    if (!IsPositiveFinite(wasserstein_min_std)) {
        return ConfigurationError(absl::StrCat(
            "wasserstein_min_std must be a positive number, got ", wasserstein_min_std));
    }

    for (size_t i = 0; i < columns.size(); ++i) {
        for (size_t j = i + 1; j < columns.size(); ++j) {
            if (columns[i] == columns[j]) {
                return ConfigurationError(
                    absl::StrCat("Column '", columns[i], "' is requested more than once"));
            }
        }
    }

    return absl::OkStatus();
}

}  // namespace drifter::drift
