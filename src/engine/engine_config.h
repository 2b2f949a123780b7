#pragma once

/// @file engine_config.h
/// @brief Formula defaults handed to the engines at construction

#include <cstddef>
#include <optional>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

#include "common/config.h"

namespace wcopt::engine {

/// @brief Defaults used when a parameter or a data column is missing
struct EngineConfig {
    double holding_cost_rate = 0.25;       ///< Annual carrying rate
    double order_cost = 50.0;              ///< Cost per purchase order
    double default_unit_cost = 10.0;       ///< When products has no unit_cost
    double default_lead_time_days = 14.0;
    double default_demand_stddev = 50.0;   ///< When fewer than two sales rows
    double default_order_qty = 100.0;      ///< When products has no EOQ
    double default_annual_revenue = 100000000.0;

    int dead_stock_days = 90;
    int stockout_horizon_days = 14;
    double anomaly_z_threshold = 2.0;
    int forecast_window = 7;
    int forecast_horizon_days = 30;

    size_t query_row_cap = 100;
    size_t max_batch_skus = 20;
    size_t max_alternative_suppliers = 5;

    /// Reference date for age computations; today (UTC) when unset
    std::optional<absl::CivilDay> as_of;

    /// @brief Read the engine.* section over the defaults
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);

    /// @brief as_of, or today in UTC
    absl::CivilDay AsOf() const;
};

}  // namespace wcopt::engine
