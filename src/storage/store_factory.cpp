/// @file store_factory.cpp
/// @brief Backend selection

#include "storage/store_factory.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/logging.h"
#include "storage/memory/memory_graph_store.h"

namespace wcopt::storage {

namespace {

absl::StatusOr<uint16_t> ReadPort(const Config& config, std::string_view key, uint16_t fallback) {
    int64_t port = config.GetInt(key, fallback);
    if (port <= 0 || port > 65535) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid port for ", absl::string_view(key.data(), key.size()), ": ", port));
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

absl::StatusOr<StoreSettings> StoreSettings::FromConfig(const Config& config) {
    StoreSettings settings;

    settings.tabular_backend =
        absl::AsciiStrToLower(config.GetString("tabular.backend", settings.tabular_backend));
    if (settings.tabular_backend != "sqlite" && settings.tabular_backend != "clickhouse") {
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown tabular backend: ", settings.tabular_backend));
    }

    settings.sqlite.path = config.GetString("tabular.sqlite.path", settings.sqlite.path);
    settings.sqlite.busy_timeout = std::chrono::milliseconds(
        config.GetInt("tabular.sqlite.busy_timeout_ms", settings.sqlite.busy_timeout.count()));
    settings.sqlite.wal = config.GetBool("tabular.sqlite.wal", settings.sqlite.wal);

    auto& ch = settings.clickhouse;
    ch.host = config.GetString("tabular.clickhouse.host", ch.host);
    auto ch_port = ReadPort(config, "tabular.clickhouse.port", ch.port);
    if (!ch_port.ok()) {
        return ch_port.status();
    }
    ch.port = *ch_port;
    ch.database = config.GetString("tabular.clickhouse.database", ch.database);
    ch.user = config.GetString("tabular.clickhouse.user", ch.user);
    ch.password = config.GetString("tabular.clickhouse.password", ch.password);
    ch.use_compression = config.GetBool("tabular.clickhouse.compression", ch.use_compression);

    settings.graph_backend =
        absl::AsciiStrToLower(config.GetString("graph.backend", settings.graph_backend));
    if (settings.graph_backend != "memory" && settings.graph_backend != "falkordb") {
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown graph backend: ", settings.graph_backend));
    }

    auto& fk = settings.falkordb;
    fk.host = config.GetString("graph.falkordb.host", fk.host);
    auto fk_port = ReadPort(config, "graph.falkordb.port", fk.port);
    if (!fk_port.ok()) {
        return fk_port.status();
    }
    fk.port = *fk_port;
    fk.graph = config.GetString("graph.falkordb.graph", fk.graph);
    fk.password = config.GetString("graph.falkordb.password", fk.password);

    return settings;
}

absl::StatusOr<std::unique_ptr<TabularStore>> CreateTabularStore(const StoreSettings& settings) {
    if (settings.tabular_backend == "clickhouse") {
#ifdef WCOPT_HAS_CLICKHOUSE
        return std::unique_ptr<TabularStore>(
            std::make_unique<ClickHouseStore>(settings.clickhouse));
#else
        return absl::UnimplementedError("ClickHouse support not compiled in");
#endif
    }
    WCOPT_LOG_DEBUG("Using SQLite tabular store at {}", settings.sqlite.path);
    return std::unique_ptr<TabularStore>(std::make_unique<SqliteStore>(settings.sqlite));
}

absl::StatusOr<std::unique_ptr<GraphStore>> CreateGraphStore(const StoreSettings& settings) {
    if (settings.graph_backend == "falkordb") {
#ifdef WCOPT_HAS_FALKORDB
        return std::unique_ptr<GraphStore>(std::make_unique<FalkorDbStore>(settings.falkordb));
#else
        return absl::UnimplementedError("FalkorDB support not compiled in");
#endif
    }
    return std::unique_ptr<GraphStore>(std::make_unique<MemoryGraphStore>());
}

}  // namespace wcopt::storage
