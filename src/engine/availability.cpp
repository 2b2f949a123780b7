/// @file availability.cpp
/// @brief Availability resolver implementation

#include "engine/availability.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace wcopt::engine {

InsufficientData MakeInsufficientData(const std::vector<Dataset>& missing) {
    InsufficientData result;
    for (Dataset dataset : missing) {
        result.missing.emplace_back(TableName(dataset));
    }
    result.message = absl::StrCat("Upload ", absl::StrJoin(result.missing, " + "),
                                  " data to enable this analysis.");
    return result;
}

absl::StatusOr<bool> AvailabilityResolver::IsAvailable(Dataset dataset) const {
    const std::string_view table = TableName(dataset);
    WCOPT_ASSIGN_OR_RETURN(bool exists, store_.HasTable(table));
    if (!exists) {
        return false;
    }
    WCOPT_ASSIGN_OR_RETURN(size_t rows, store_.CountRows(table));
    return rows > 0;
}

absl::StatusOr<std::optional<InsufficientData>> AvailabilityResolver::Check(
    const std::vector<Dataset>& required) const {
    std::vector<Dataset> missing;
    for (Dataset dataset : required) {
        WCOPT_ASSIGN_OR_RETURN(bool available, IsAvailable(dataset));
        if (!available) {
            missing.push_back(dataset);
        }
    }
    if (missing.empty()) {
        return std::optional<InsufficientData>();
    }
    return std::optional<InsufficientData>(MakeInsufficientData(missing));
}

absl::StatusOr<std::vector<Dataset>> AvailabilityResolver::Present(
    const std::vector<Dataset>& datasets) const {
    std::vector<Dataset> present;
    for (Dataset dataset : datasets) {
        WCOPT_ASSIGN_OR_RETURN(bool available, IsAvailable(dataset));
        if (available) {
            present.push_back(dataset);
        }
    }
    return present;
}

}  // namespace wcopt::engine
