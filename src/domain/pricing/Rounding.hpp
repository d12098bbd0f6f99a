#pragma once

#include "domain/value_objects/Money.hpp"

#include <string>

namespace olp::domain {

// How a fractional minor-unit amount becomes a whole one. Only ties differ:
//   HALF_AWAY_FROM_ZERO   2.5 -> 3, -2.5 -> -3
//   HALF_EVEN             2.5 -> 2, -2.5 -> -2, 3.5 -> 4
//   HALF_UP               2.5 -> 3, -2.5 -> -2
enum class RoundingMode { HALF_AWAY_FROM_ZERO, HALF_EVEN, HALF_UP };

RoundingMode rounding_mode_from_string(const std::string& str);
std::string to_string(RoundingMode mode);

// Throws std::domain_error for NaN or infinite input.
Money round_minor_units(double value, RoundingMode mode = RoundingMode::HALF_AWAY_FROM_ZERO);

} // namespace olp::domain
