/// @file dataset_loader.cpp
/// @brief Dataset upload implementation

#include "engine/dataset_loader.h"

#include <algorithm>
#include <set>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/dataset_reader.h"
#include "engine/datasets.h"
#include "storage/identifier.h"

namespace wcopt::engine {

namespace {

absl::Status NormalizeHeaders(storage::Table* table) {
    std::set<std::string> seen;
    for (size_t i = 0; i < table->columns.size(); ++i) {
        std::string name = storage::NormalizeColumnName(table->columns[i]);
        if (name.empty()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Column ", i + 1, " ('", table->columns[i], "') has no usable name"));
        }
        if (!seen.insert(name).second) {
            return absl::InvalidArgumentError(
                absl::StrCat("Duplicate column '", name, "' after normalization"));
        }
        table->columns[i] = std::move(name);
    }
    for (const auto& row : table->rows) {
        if (row.size() != table->columns.size()) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Row has ", row.size(), " cells, expected ", table->columns.size()));
        }
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<LoadReport> DatasetLoader::Load(std::string_view category,
                                               const std::string& filename,
                                               storage::Table table) {
    auto dataset = ParseDataset(category);
    if (!dataset) {
        return MakeError(ErrorCode::kUnknownDataset,
                         absl::StrCat("Invalid category '", absl::string_view(category.data(), category.size()),
                                      "'. Must be one of: ", AllTableNames()));
    }
    if (table.columns.empty()) {
        return absl::InvalidArgumentError("Upload has no columns");
    }
    WCOPT_RETURN_IF_ERROR(NormalizeHeaders(&table));

    std::vector<std::string> missing;
    for (const auto& column : RequiredColumns(*dataset)) {
        if (std::find(table.columns.begin(), table.columns.end(), column) == table.columns.end()) {
            missing.push_back(column);
        }
    }
    if (!missing.empty()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Missing required columns for ", absl::string_view(category.data(), category.size()), ": ", absl::StrJoin(missing, ", ")));
    }

    const std::string table_name(TableName(*dataset));
    WCOPT_RETURN_IF_ERROR(store_.ReplaceTable(table_name, table));

    storage::UploadRecord record;
    record.category = table_name;
    record.filename = filename;
    record.row_count = table.rows.size();
    WCOPT_ASSIGN_OR_RETURN(storage::UploadRecord logged, store_.RecordUpload(std::move(record)));

    LoadReport report;
    report.category = table_name;
    report.filename = filename;
    report.rows = table.rows.size();
    report.columns = table.columns.size();
    report.upload_id = logged.id;
    report.destination = FeedsGraph(*dataset) ? "tabular + graph" : "tabular";
    WCOPT_LOG_INFO("Loaded {} rows into {} from {}", report.rows, table_name, filename);

    if (!FeedsGraph(*dataset) || graph_ == nullptr) {
        return report;
    }

    DatasetReader reader(store_);
    GraphSync sync(*graph_);
    absl::StatusOr<SyncReport> synced;
    if (*dataset == Dataset::kSuppliers) {
        auto suppliers = reader.Suppliers();
        synced = suppliers.ok() ? sync.SyncSuppliers(*suppliers)
                                : absl::StatusOr<SyncReport>(suppliers.status());
    } else {
        auto orders = reader.PurchaseOrders();
        synced = orders.ok() ? sync.SyncPurchaseOrders(*orders)
                             : absl::StatusOr<SyncReport>(orders.status());
    }
    if (synced.ok()) {
        report.graph_sync = *synced;
    } else {
        WCOPT_LOG_WARN("Graph sync after {} upload failed: {}", table_name,
                       synced.status().ToString());
        report.graph_error = std::string(synced.status().message());
    }
    return report;
}

}  // namespace wcopt::engine
