/// @file main.cpp
/// @brief Drifter command line entry point

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "drift/drift_config.h"
#include "drift/drift_engine.h"
#include "io/csv_reader.h"
#include "io/report_writer.h"

namespace {

constexpr int kExitNoDrift = 0;
constexpr int kExitError = 1;
constexpr int kExitDrift = 2;

constexpr char kVersion[] = "1.0.0";

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Drifter - statistical data drift detection between two datasets"};

    std::string reference_path;
    std::string current_path;
    std::string config_path;
    std::string output_path;
    std::string log_level = "info";
    std::optional<size_t> threads;
    std::vector<std::string> columns;
    char delimiter = ',';
    bool json_stdout = false;
    bool version_flag = false;

    app.add_option("-r,--reference", reference_path, "Reference (baseline) CSV file");
    app.add_option("-c,--current", current_path, "Current CSV file to check for drift");
    app.add_option("--config", config_path, "Path to YAML drift configuration")
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", output_path, "Write the JSON report to this file");
    app.add_option("--log-level", log_level, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--threads", threads, "Worker threads (0 = hardware concurrency, 1 = inline)");
    app.add_option("--columns", columns, "Compare only these columns, in this order");
    app.add_option("--delimiter", delimiter, "CSV field delimiter");
    app.add_flag("--json", json_stdout, "Print the JSON report instead of the table");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "drifter v" << kVersion << std::endl;
        return kExitNoDrift;
    }

    if (reference_path.empty() || current_path.empty()) {
        std::cerr << "Both --reference and --current are required" << std::endl;
        std::cerr << app.help() << std::endl;
        return kExitError;
    }

    // Initialize logging
    drifter::LogConfig log_config;
    log_config.level = drifter::ParseLogLevel(log_level);
    drifter::InitLogging(log_config);

    DRIFTER_LOG_INFO("drifter v{} starting (log level {})", kVersion,
                     drifter::LogLevelToString(log_config.level));

    // Load configuration
    drifter::drift::DriftConfig config;
    if (!config_path.empty()) {
        auto config_or = drifter::drift::DriftConfig::LoadWithEnv(config_path);
        if (!config_or.ok()) {
            DRIFTER_LOG_ERROR("Failed to load config: {}", config_or.status().message());
            drifter::ShutdownLogging();
            return kExitError;
        }
        config = *config_or;
        DRIFTER_LOG_INFO("Loaded configuration from {}", config_path);
    } else {
        config = drifter::drift::DriftConfig::Default();
        auto status = config.ApplyEnvironment();
        if (!status.ok()) {
            DRIFTER_LOG_ERROR("Invalid environment override: {}", status.message());
            drifter::ShutdownLogging();
            return kExitError;
        }
    }

    // Apply CLI overrides
    if (threads.has_value()) {
        config.num_threads = *threads;
    }
    if (!columns.empty()) {
        config.columns = columns;
    }

    auto engine_or = drifter::drift::DriftEngine::Create(std::move(config));
    if (!engine_or.ok()) {
        DRIFTER_LOG_ERROR("Invalid configuration: {}", engine_or.status().message());
        drifter::ShutdownLogging();
        return kExitError;
    }
    auto& engine = *engine_or;

    // Load datasets
    drifter::io::CsvOptions csv_options;
    csv_options.delimiter = delimiter;
    drifter::io::CsvReader reader(csv_options);

    auto reference = reader.ReadFile(reference_path);
    if (!reference.ok()) {
        DRIFTER_LOG_ERROR("Failed to load reference dataset: {}", reference.status().message());
        drifter::ShutdownLogging();
        return kExitError;
    }
    auto current = reader.ReadFile(current_path);
    if (!current.ok()) {
        DRIFTER_LOG_ERROR("Failed to load current dataset: {}", current.status().message());
        drifter::ShutdownLogging();
        return kExitError;
    }

    auto report = engine->Compare(*reference, *current);
    if (!report.ok()) {
        DRIFTER_LOG_ERROR("Drift check failed: {}", report.status().message());
        drifter::ShutdownLogging();
        return kExitError;
    }

    if (json_stdout) {
        std::cout << drifter::io::ReportToJsonString(*report) << std::endl;
    } else {
        std::cout << drifter::io::RenderTable(*report) << std::flush;
    }

    if (!output_path.empty()) {
        auto status = drifter::io::WriteJsonReport(*report, output_path);
        if (!status.ok()) {
            DRIFTER_LOG_ERROR("Failed to write report: {}", status.message());
            drifter::ShutdownLogging();
            return kExitError;
        }
    }

    const bool drifted = report->overall_drift;
    drifter::ShutdownLogging();
    return drifted ? kExitDrift : kExitNoDrift;
}
