#pragma once

/// @file stats.h
/// @brief Numeric helpers and cell parsing shared by the engines

#include <optional>
#include <string>
#include <vector>

#include <absl/time/civil_time.h>

#include "storage/table.h"

namespace wcopt::engine {

/// @brief Round half away from zero to the given number of decimals
double Round(double value, int digits = 0);

/// @brief Arithmetic mean, 0 for an empty series
double Mean(const std::vector<double>& values);

/// @brief Standard deviation with n - 1 in the denominator; 0 below two values
double SampleStdDev(const std::vector<double>& values);

/// @brief Standard deviation with n in the denominator; 0 for an empty series
double PopulationStdDev(const std::vector<double>& values);

/// @brief Share of a total in percent, 0 when the total is not positive
double Percent(double part, double total);

/// @brief Numeric value of a cell, nullopt for NULL or non-numeric text
std::optional<double> CellNumber(const storage::Cell& cell);

/// @brief Non-blank text of a cell
std::optional<std::string> CellText(const storage::Cell& cell);

/// @brief Date from the first ten characters (YYYY-MM-DD) of a cell
std::optional<absl::CivilDay> CellDay(const storage::Cell& cell);

/// @brief true/1/yes/y (case-insensitive) are true; everything else false
bool CellFlag(const storage::Cell& cell);

/// @brief YYYY-MM-DD
std::string FormatDay(absl::CivilDay day);

}  // namespace wcopt::engine
