/// @file engine_config.cpp
/// @brief EngineConfig loading

#include "engine/engine_config.h"

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/error.h"

namespace wcopt::engine {

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig engine;

    engine.holding_cost_rate = config.GetDouble("engine.holding_cost_rate", engine.holding_cost_rate);
    engine.order_cost = config.GetDouble("engine.order_cost", engine.order_cost);
    engine.default_unit_cost = config.GetDouble("engine.default_unit_cost", engine.default_unit_cost);
    engine.default_lead_time_days =
        config.GetDouble("engine.default_lead_time_days", engine.default_lead_time_days);
    engine.default_demand_stddev =
        config.GetDouble("engine.default_demand_stddev", engine.default_demand_stddev);
    engine.default_order_qty = config.GetDouble("engine.default_order_qty", engine.default_order_qty);
    engine.default_annual_revenue =
        config.GetDouble("engine.default_annual_revenue", engine.default_annual_revenue);

    engine.dead_stock_days =
        static_cast<int>(config.GetInt("engine.dead_stock_days", engine.dead_stock_days));
    engine.stockout_horizon_days = static_cast<int>(
        config.GetInt("engine.stockout_horizon_days", engine.stockout_horizon_days));
    engine.anomaly_z_threshold =
        config.GetDouble("engine.anomaly_z_threshold", engine.anomaly_z_threshold);
    engine.forecast_window =
        static_cast<int>(config.GetInt("engine.forecast_window", engine.forecast_window));
    engine.forecast_horizon_days = static_cast<int>(
        config.GetInt("engine.forecast_horizon_days", engine.forecast_horizon_days));

    auto read_cap = [&config](std::string_view key, size_t fallback) -> absl::StatusOr<size_t> {
        int64_t value = config.GetInt(key, static_cast<int64_t>(fallback));
        if (value <= 0) {
            return absl::InvalidArgumentError(absl::StrCat(absl::string_view(key.data(), key.size()), " must be positive"));
        }
        return static_cast<size_t>(value);
    };
    WCOPT_ASSIGN_OR_RETURN(engine.query_row_cap, read_cap("engine.query_row_cap", engine.query_row_cap));
    WCOPT_ASSIGN_OR_RETURN(engine.max_batch_skus,
                           read_cap("engine.max_batch_skus", engine.max_batch_skus));
    WCOPT_ASSIGN_OR_RETURN(engine.max_alternative_suppliers,
                           read_cap("engine.max_alternative_suppliers",
                                    engine.max_alternative_suppliers));

    if (engine.forecast_window <= 0 || engine.dead_stock_days < 0 ||
        engine.stockout_horizon_days <= 0) {
        return absl::InvalidArgumentError("engine day counts must be positive");
    }

    std::string as_of = config.GetString("engine.as_of");
    if (!as_of.empty()) {
        absl::CivilDay day;
        if (!absl::ParseCivilTime(as_of, &day)) {
            return absl::InvalidArgumentError(
                absl::StrCat("engine.as_of is not a YYYY-MM-DD date: ", as_of));
        }
        engine.as_of = day;
    }

    return engine;
}

absl::CivilDay EngineConfig::AsOf() const {
    if (as_of) {
        return *as_of;
    }
    return absl::ToCivilDay(absl::Now(), absl::UTCTimeZone());
}

}  // namespace wcopt::engine
