/// @file stats.cpp
/// @brief Numeric helpers

#include "engine/stats.h"

#include <cmath>
#include <numeric>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

namespace wcopt::engine {

double Round(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

namespace {

double SumSquaredDeviations(const std::vector<double>& values) {
    const double mean = Mean(values);
    double sum = 0.0;
    for (double v : values) {
        sum += (v - mean) * (v - mean);
    }
    return sum;
}

}  // namespace

double SampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    return std::sqrt(SumSquaredDeviations(values) / static_cast<double>(values.size() - 1));
}

double PopulationStdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::sqrt(SumSquaredDeviations(values) / static_cast<double>(values.size()));
}

double Percent(double part, double total) {
    if (total <= 0.0) {
        return 0.0;
    }
    return part * 100.0 / total;
}

std::optional<double> CellNumber(const storage::Cell& cell) {
    if (!cell) {
        return std::nullopt;
    }
    double value = 0.0;
    if (!absl::SimpleAtod(absl::StripAsciiWhitespace(*cell), &value) || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> CellText(const storage::Cell& cell) {
    if (!cell || absl::StripAsciiWhitespace(*cell).empty()) {
        return std::nullopt;
    }
    return *cell;
}

std::optional<absl::CivilDay> CellDay(const storage::Cell& cell) {
    if (!cell) {
        return std::nullopt;
    }
    absl::string_view text = absl::StripAsciiWhitespace(*cell);
    if (text.size() < 10) {
        return std::nullopt;
    }
    absl::CivilDay day;
    if (!absl::ParseCivilTime(text.substr(0, 10), &day)) {
        return std::nullopt;
    }
    return day;
}

bool CellFlag(const storage::Cell& cell) {
    if (!cell) {
        return false;
    }
    std::string value = absl::AsciiStrToLower(absl::StripAsciiWhitespace(*cell));
    return value == "true" || value == "1" || value == "yes" || value == "y" || value == "1.0";
}

std::string FormatDay(absl::CivilDay day) {
    return absl::StrFormat("%04d-%02d-%02d", day.year(), day.month(), day.day());
}

}  // namespace wcopt::engine
