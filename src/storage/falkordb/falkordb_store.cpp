/// @file falkordb_store.cpp
/// @brief FalkorDB graph store implementation

#include "storage/falkordb/falkordb_store.h"

#include <cmath>
#include <cstdio>
#include <mutex>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <hiredis/hiredis.h>

#include "common/error.h"
#include "common/logging.h"
#include "storage/table.h"

namespace wcopt::storage {

std::string CypherStringLiteral(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '\'';
    for (unsigned char c : value) {
        switch (c) {
            case '\'':
                escaped += "\\'";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                // SECURITY: other control characters are dropped
                if (c >= 32) {
                    escaped += static_cast<char>(c);
                }
                break;
        }
    }
    escaped += '\'';
    return escaped;
}

namespace {

/// @brief Named value for the CYPHER parameter header
struct CypherParam {
    std::string name;
    std::string literal;
};

CypherParam Str(std::string name, std::string_view value) {
    return {std::move(name), CypherStringLiteral(value)};
}

CypherParam OptStr(std::string name, const std::optional<std::string>& value) {
    return {std::move(name), value ? CypherStringLiteral(*value) : "null"};
}

CypherParam OptNum(std::string name, std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return {std::move(name), "null"};
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", *value);
    return {std::move(name), buffer};
}

std::string WithParams(std::string_view cypher, const std::vector<CypherParam>& params) {
    if (params.empty()) {
        return std::string(cypher);
    }
    std::string header = "CYPHER";
    for (const auto& param : params) {
        absl::StrAppend(&header, " ", param.name, "=", param.literal);
    }
    return absl::StrCat(header, " ", cypher);
}

Cell ReplyCell(const redisReply* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    switch (value->type) {
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
            return std::string(value->str, value->len);
        case REDIS_REPLY_INTEGER:
            return std::to_string(value->integer);
        case REDIS_REPLY_DOUBLE:
            return std::string(value->str, value->len);
        default:
            return std::nullopt;
    }
}

std::optional<double> CellNumber(const Cell& cell) {
    double parsed = 0.0;
    if (cell && absl::SimpleAtod(*cell, &parsed)) {
        return parsed;
    }
    return std::nullopt;
}

constexpr const char* kSupplierColumns =
    "s.supplier_id, s.supplier_name, s.lead_time, s.rating, s.otd_rate, s.country";

SupplierNode SupplierFromRow(const Row& row) {
    SupplierNode node;
    node.supplier_id = row.size() > 0 ? row[0].value_or("") : "";
    node.name = row.size() > 1 ? row[1] : std::nullopt;
    node.lead_time = row.size() > 2 ? CellNumber(row[2]) : std::nullopt;
    node.rating = row.size() > 3 ? CellNumber(row[3]) : std::nullopt;
    node.otd_rate = row.size() > 4 ? CellNumber(row[4]) : std::nullopt;
    node.country = row.size() > 5 ? row[5] : std::nullopt;
    return node;
}

}  // namespace

// =============================================================================
// FalkorDbStore Implementation
// =============================================================================

class FalkorDbStore::Impl {
public:
    explicit Impl(FalkorDbConfig config) : config_(std::move(config)) {}

    ~Impl() {
        if (context_ != nullptr) {
            redisFree(context_);
        }
    }

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (context_ != nullptr) {
            return absl::OkStatus();
        }

        struct timeval timeout;
        timeout.tv_sec = config_.connection_timeout.count();
        timeout.tv_usec = 0;

        context_ = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);
        if (context_ == nullptr || context_->err) {
            std::string error_msg = context_ ? context_->errstr : "Unknown error";
            if (context_) {
                redisFree(context_);
                context_ = nullptr;
            }
            return absl::UnavailableError("Failed to connect to FalkorDB: " + error_msg);
        }

        if (!config_.password.empty()) {
            redisReply* reply = static_cast<redisReply*>(
                redisCommand(context_, "AUTH %s", config_.password.c_str()));
            if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
                std::string error_msg = reply ? reply->str : "Unknown error";
                if (reply) freeReplyObject(reply);
                redisFree(context_);
                context_ = nullptr;
                return absl::PermissionDeniedError("FalkorDB authentication failed: " + error_msg);
            }
            freeReplyObject(reply);
        }

        for (const char* index : {"CREATE INDEX ON :Supplier(supplier_id)",
                                  "CREATE INDEX ON :Product(product_id)"}) {
            auto result = RunLocked(index);
            if (!result.ok()) {
                // Servers reject re-creating an existing index
                WCOPT_LOG_DEBUG("FalkorDB index not created: {}", result.status().message());
            }
        }

        WCOPT_LOG_INFO("Connected to FalkorDB at {}:{} graph {}",
                       config_.host, config_.port, config_.graph);
        return absl::OkStatus();
    }

    absl::Status Disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (context_ == nullptr) {
            return absl::OkStatus();
        }
        redisFree(context_);
        context_ = nullptr;
        WCOPT_LOG_INFO("Disconnected from FalkorDB");
        return absl::OkStatus();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return context_ != nullptr;
    }

    /// @brief Run one GRAPH.QUERY and return its result rows
    absl::StatusOr<std::vector<Row>> Run(std::string_view cypher,
                                         const std::vector<CypherParam>& params = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return RunLocked(WithParams(cypher, params));
    }

private:
    absl::StatusOr<std::vector<Row>> RunLocked(const std::string& query) {
        if (context_ == nullptr) {
            return absl::FailedPreconditionError("Not connected to FalkorDB");
        }

        const char* argv[] = {"GRAPH.QUERY", config_.graph.c_str(), query.c_str()};
        const size_t argvlen[] = {11, config_.graph.size(), query.size()};
        redisReply* reply = static_cast<redisReply*>(
            redisCommandArgv(context_, 3, argv, argvlen));

        if (reply == nullptr) {
            std::string error_msg = context_->err ? context_->errstr : "Connection error";
            return absl::UnavailableError("GRAPH.QUERY failed: " + error_msg);
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            std::string error_msg(reply->str, reply->len);
            freeReplyObject(reply);
            return absl::InternalError("GRAPH.QUERY failed: " + error_msg);
        }

        std::vector<Row> rows;
        // [header, rows, statistics] for queries that return; [statistics] otherwise
        if (reply->type == REDIS_REPLY_ARRAY && reply->elements == 3) {
            const redisReply* data = reply->element[1];
            if (data != nullptr && data->type == REDIS_REPLY_ARRAY) {
                for (size_t i = 0; i < data->elements; ++i) {
                    const redisReply* record = data->element[i];
                    Row row;
                    if (record != nullptr && record->type == REDIS_REPLY_ARRAY) {
                        for (size_t j = 0; j < record->elements; ++j) {
                            row.push_back(ReplyCell(record->element[j]));
                        }
                    }
                    rows.push_back(std::move(row));
                }
            }
        }
        freeReplyObject(reply);
        return rows;
    }

    FalkorDbConfig config_;
    mutable std::mutex mutex_;
    redisContext* context_ = nullptr;
};

// =============================================================================
// FalkorDbStore Public Interface
// =============================================================================

FalkorDbStore::FalkorDbStore(FalkorDbConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

FalkorDbStore::~FalkorDbStore() = default;

absl::Status FalkorDbStore::Connect() {
    return impl_->Connect();
}

absl::Status FalkorDbStore::Disconnect() {
    return impl_->Disconnect();
}

bool FalkorDbStore::IsConnected() const {
    return impl_->IsConnected();
}

absl::Status FalkorDbStore::UpsertSupplier(const SupplierNode& supplier) {
    return impl_->Run(
        "MERGE (s:Supplier {supplier_id: $sid}) "
        "SET s.supplier_name = $name, s.lead_time = $lead_time, s.rating = $rating, "
        "s.otd_rate = $otd_rate, s.country = $country",
        {Str("sid", supplier.supplier_id), OptStr("name", supplier.name),
         OptNum("lead_time", supplier.lead_time), OptNum("rating", supplier.rating),
         OptNum("otd_rate", supplier.otd_rate), OptStr("country", supplier.country)})
        .status();
}

absl::Status FalkorDbStore::EnsureSupplier(std::string_view supplier_id) {
    return impl_->Run("MERGE (s:Supplier {supplier_id: $sid})", {Str("sid", supplier_id)})
        .status();
}

absl::Status FalkorDbStore::EnsureProduct(std::string_view product_id) {
    return impl_->Run("MERGE (p:Product {product_id: $pid})", {Str("pid", product_id)})
        .status();
}

absl::Status FalkorDbStore::LinkSupplies(std::string_view supplier_id,
                                         std::string_view product_id) {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(
        "MATCH (s:Supplier {supplier_id: $sid}) MATCH (p:Product {product_id: $pid}) "
        "MERGE (s)-[:SUPPLIES]->(p) RETURN count(p)",
        {Str("sid", supplier_id), Str("pid", product_id)}));
    if (rows.empty() || rows[0].empty() || rows[0][0].value_or("0") == "0") {
        return absl::FailedPreconditionError(absl::StrCat(
            "Cannot link ", supplier_id, " -> ", product_id, ": endpoint node missing"));
    }
    return absl::OkStatus();
}

absl::Status FalkorDbStore::Clear() {
    return impl_->Run("MATCH (n) DETACH DELETE n").status();
}

absl::StatusOr<std::vector<SuppliesEdge>> FalkorDbStore::Network() {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(
        "MATCH (s:Supplier)-[:SUPPLIES]->(p:Product) "
        "RETURN s.supplier_id, s.supplier_name, s.lead_time, p.product_id "
        "ORDER BY s.supplier_name, s.supplier_id, p.product_id"));
    std::vector<SuppliesEdge> network;
    network.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() < 4) {
            continue;
        }
        network.push_back({row[0].value_or(""), row[1], CellNumber(row[2]), row[3].value_or("")});
    }
    return network;
}

absl::StatusOr<std::vector<SoleSourcedProduct>> FalkorDbStore::SingleSourceProducts(
    size_t limit) {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(absl::StrCat(
        "MATCH (p:Product)<-[:SUPPLIES]-(s:Supplier) "
        "WITH p, COUNT(s) AS c, COLLECT(s) AS sups WHERE c = 1 "
        "RETURN p.product_id, sups[0].supplier_id, sups[0].supplier_name "
        "ORDER BY p.product_id LIMIT ", limit)));
    std::vector<SoleSourcedProduct> result;
    for (const auto& row : rows) {
        if (row.size() < 3) {
            continue;
        }
        result.push_back({row[0].value_or(""), row[1].value_or(""), row[2]});
    }
    return result;
}

absl::StatusOr<std::optional<SupplierNode>> FalkorDbStore::FindSupplier(
    std::string_view supplier_id) {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(
        absl::StrCat("MATCH (s:Supplier {supplier_id: $sid}) RETURN ", kSupplierColumns),
        {Str("sid", supplier_id)}));
    if (rows.empty()) {
        return std::optional<SupplierNode>();
    }
    return std::optional<SupplierNode>(SupplierFromRow(rows.front()));
}

absl::StatusOr<std::vector<std::string>> FalkorDbStore::SuppliedProducts(
    std::string_view supplier_id) {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(
        "MATCH (s:Supplier {supplier_id: $sid})-[:SUPPLIES]->(p:Product) "
        "RETURN p.product_id ORDER BY p.product_id",
        {Str("sid", supplier_id)}));
    std::vector<std::string> products;
    for (const auto& row : rows) {
        if (!row.empty() && row[0]) {
            products.push_back(*row[0]);
        }
    }
    return products;
}

absl::StatusOr<std::vector<SupplierNode>> FalkorDbStore::SuppliersOf(
    std::string_view product_id) {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(
        absl::StrCat("MATCH (s:Supplier)-[:SUPPLIES]->(p:Product {product_id: $pid}) RETURN ",
                     kSupplierColumns, " ORDER BY s.supplier_id"),
        {Str("pid", product_id)}));
    std::vector<SupplierNode> suppliers;
    for (const auto& row : rows) {
        suppliers.push_back(SupplierFromRow(row));
    }
    return suppliers;
}

absl::StatusOr<std::vector<SupplierNode>> FalkorDbStore::Suppliers() {
    WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(absl::StrCat(
        "MATCH (s:Supplier) RETURN ", kSupplierColumns, " ORDER BY s.supplier_id")));
    std::vector<SupplierNode> suppliers;
    for (const auto& row : rows) {
        suppliers.push_back(SupplierFromRow(row));
    }
    return suppliers;
}

absl::StatusOr<GraphCounts> FalkorDbStore::Counts() {
    auto count = [this](std::string_view cypher) -> absl::StatusOr<size_t> {
        WCOPT_ASSIGN_OR_RETURN(auto rows, impl_->Run(cypher));
        if (rows.empty() || rows[0].empty()) {
            return 0;
        }
        auto value = CellNumber(rows[0][0]);
        return value ? static_cast<size_t>(*value) : 0;
    };

    GraphCounts counts;
    WCOPT_ASSIGN_OR_RETURN(counts.suppliers, count("MATCH (s:Supplier) RETURN COUNT(s)"));
    WCOPT_ASSIGN_OR_RETURN(counts.products, count("MATCH (p:Product) RETURN COUNT(p)"));
    WCOPT_ASSIGN_OR_RETURN(counts.relationships,
                           count("MATCH ()-[r:SUPPLIES]->() RETURN COUNT(r)"));
    return counts;
}

}  // namespace wcopt::storage
