#pragma once

/// @file availability.h
/// @brief Per-analysis gate on required datasets being present

#include <optional>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/datasets.h"
#include "engine/outcome.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

/// @brief "Upload a + b data to enable this analysis."
InsufficientData MakeInsufficientData(const std::vector<Dataset>& missing);

/// @brief Decides whether an analysis may run.
///
/// A dataset is available when its table exists and holds at least one row.
/// Store failures surface as statuses, never as missing data.
class AvailabilityResolver {
public:
    explicit AvailabilityResolver(storage::TabularStore& store) : store_(store) {}

    /// @brief Table exists and is non-empty
    absl::StatusOr<bool> IsAvailable(Dataset dataset) const;

    /// @brief nullopt when every dataset is available, else the record
    /// naming all missing ones
    absl::StatusOr<std::optional<InsufficientData>> Check(
        const std::vector<Dataset>& required) const;

    /// @brief Subset of the given datasets that are available
    absl::StatusOr<std::vector<Dataset>> Present(const std::vector<Dataset>& datasets) const;

private:
    storage::TabularStore& store_;
};

}  // namespace wcopt::engine
