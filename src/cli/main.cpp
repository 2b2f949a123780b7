/// @file main.cpp
/// @brief wcopt command-line entry point

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <absl/strings/str_cat.h>
#include <absl/time/civil_time.h>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "engine/dataset_loader.h"
#include "engine/engine_config.h"
#include "engine/graph_sync.h"
#include "query/catalog.h"
#include "query/serialization.h"
#include "storage/csv_reader.h"
#include "storage/store_factory.h"

namespace {

using json = nlohmann::json;

constexpr const char* kVersion = "1.0.0";

/// @brief Stores and engine settings shared by every command
struct Runtime {
    wcopt::engine::EngineConfig engine;
    std::unique_ptr<wcopt::storage::TabularStore> tabular;
    std::unique_ptr<wcopt::storage::GraphStore> graph;
};

int Print(int status_code, const json& body) {
    std::cout << wcopt::query::RenderJson(body) << std::endl;
    return status_code < 400 ? 0 : 1;
}

int PrintError(const absl::Status& status) {
    WCOPT_LOG_ERROR("{}", status.ToString());
    return Print(500, json{{"error", std::string(status.message())}});
}

wcopt::LogConfig BuildLogConfig(const wcopt::Config& config, const std::string& cli_level) {
    wcopt::LogConfig log_config;
    const std::string level = cli_level.empty() ? config.GetString("logging.level", "info")
                                                : cli_level;
    if (auto parsed = wcopt::ParseLogLevel(level)) {
        log_config.level = *parsed;
    }
    const std::string file = config.GetString("logging.file");
    if (!file.empty()) {
        log_config.enable_file = true;
        log_config.file_path = file;
    }
    return log_config;
}

absl::StatusOr<Runtime> OpenRuntime(const wcopt::Config& config, const std::string& as_of) {
    Runtime runtime;
    auto engine = wcopt::engine::EngineConfig::FromConfig(config);
    if (!engine.ok()) {
        return engine.status();
    }
    runtime.engine = *engine;
    if (!as_of.empty()) {
        absl::CivilDay day;
        if (!absl::ParseCivilTime(as_of, &day)) {
            return absl::InvalidArgumentError(
                absl::StrCat("--as-of is not a YYYY-MM-DD date: ", as_of));
        }
        runtime.engine.as_of = day;
    }

    auto settings = wcopt::storage::StoreSettings::FromConfig(config);
    if (!settings.ok()) {
        return settings.status();
    }
    auto tabular = wcopt::storage::CreateTabularStore(*settings);
    if (!tabular.ok()) {
        return tabular.status();
    }
    runtime.tabular = std::move(tabular).value();
    auto connected = runtime.tabular->Connect();
    if (!connected.ok()) {
        return connected;
    }

    auto graph = wcopt::storage::CreateGraphStore(*settings);
    if (!graph.ok()) {
        return graph.status();
    }
    runtime.graph = std::move(graph).value();
    auto graph_connected = runtime.graph->Connect();
    if (!graph_connected.ok()) {
        // Graph-backed analyses answer from the tabular store instead
        WCOPT_LOG_WARN("Graph store {} unavailable: {}", runtime.graph->BackendName(),
                       graph_connected.ToString());
    }
    return runtime;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"wcopt - supply-chain and working-capital analytics"};
    app.require_subcommand(1);

    std::string config_path;
    std::string log_level;
    std::string as_of;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--as-of", as_of, "Reference date for age computations (YYYY-MM-DD)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    auto* list_cmd = app.add_subcommand("list", "List the available analyses");

    std::string analysis;
    std::string params_text = "{}";
    auto* run_cmd = app.add_subcommand("run", "Run one analysis");
    run_cmd->add_option("analysis", analysis, "Analysis name")->required();
    run_cmd->add_option("-p,--params", params_text, "Parameters as a JSON object");

    std::string category;
    std::string csv_path;
    auto* upload_cmd = app.add_subcommand("upload", "Replace a dataset from a CSV file");
    upload_cmd->add_option("category", category, "Dataset category")->required();
    upload_cmd->add_option("csv", csv_path, "CSV file")->required()->check(CLI::ExistingFile);

    std::string sql;
    auto* sql_cmd = app.add_subcommand("sql", "Run a read-only SQL query");
    sql_cmd->add_option("query", sql, "SELECT statement")->required();

    auto* resync_cmd = app.add_subcommand("resync-graph",
                                          "Rebuild the graph from the suppliers and "
                                          "purchase_orders tables");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "wcopt v" << kVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto config = wcopt::Config::Load(path);
    if (!config.ok()) {
        std::cerr << "Failed to load config: " << config.status().message() << std::endl;
        return 1;
    }

    wcopt::InitLogging(BuildLogConfig(*config, log_level));
    WCOPT_LOG_DEBUG("wcopt v{} starting", kVersion);

    auto runtime = OpenRuntime(*config, as_of);
    if (!runtime.ok()) {
        int code = PrintError(runtime.status());
        wcopt::ShutdownLogging();
        return code;
    }

    wcopt::MetricsRegistry metrics;
    wcopt::query::AnalysisCatalog catalog(*runtime->tabular, *runtime->graph, runtime->engine,
                                          metrics);

    int exit_code = 0;
    if (*list_cmd) {
        json analyses = json::array();
        for (const auto& info : catalog.List()) {
            analyses.push_back(wcopt::query::DescribeAnalysis(info));
        }
        exit_code = Print(200, analyses);
    } else if (*run_cmd) {
        json params;
        try {
            params = json::parse(params_text);
        } catch (const json::parse_error& e) {
            exit_code = Print(400, json{{"error", absl::StrCat("Invalid --params JSON: ", e.what())}});
            wcopt::ShutdownLogging();
            return exit_code;
        }
        auto response = catalog.Run(analysis, params);
        exit_code = Print(response.status_code, response.body);
    } else if (*sql_cmd) {
        auto response = catalog.Run("run_sql_query", json{{"sql", sql}});
        exit_code = Print(response.status_code, response.body);
    } else if (*upload_cmd) {
        auto table = wcopt::storage::ReadCsvFile(csv_path);
        if (!table.ok()) {
            exit_code = Print(400, json{{"error", std::string(table.status().message())}});
        } else {
            wcopt::engine::DatasetLoader loader(*runtime->tabular, runtime->graph.get());
            const std::string filename = std::filesystem::path(csv_path).filename().string();
            auto report = loader.Load(category, filename, std::move(table).value());
            if (report.ok()) {
                exit_code = Print(200, json(*report));
            } else if (wcopt::IsClientError(report.status())) {
                exit_code = Print(400, json{{"error", std::string(report.status().message())}});
            } else {
                exit_code = PrintError(report.status());
            }
        }
    } else if (*resync_cmd) {
        wcopt::engine::GraphSync sync(*runtime->graph);
        auto report = sync.Resync(*runtime->tabular);
        exit_code = report.ok() ? Print(200, json(*report)) : PrintError(report.status());
    }

    WCOPT_LOG_DEBUG("Metrics:\n{}", metrics.ExportText());

    auto disconnected = runtime->graph->Disconnect();
    if (!disconnected.ok()) {
        WCOPT_LOG_WARN("Graph disconnect failed: {}", disconnected.ToString());
    }
    disconnected = runtime->tabular->Disconnect();
    if (!disconnected.ok()) {
        WCOPT_LOG_WARN("Store disconnect failed: {}", disconnected.ToString());
    }
    wcopt::ShutdownLogging();
    return exit_code;
}
