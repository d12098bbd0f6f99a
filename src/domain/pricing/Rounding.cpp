#include "domain/pricing/Rounding.hpp"

#include <cmath>
#include <stdexcept>

namespace olp::domain {

RoundingMode rounding_mode_from_string(const std::string& str) {
    if (str == "half_away_from_zero") return RoundingMode::HALF_AWAY_FROM_ZERO;
    if (str == "half_even") return RoundingMode::HALF_EVEN;
    if (str == "half_up") return RoundingMode::HALF_UP;
    throw std::invalid_argument("Invalid rounding mode: " + str);
}

std::string to_string(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::HALF_AWAY_FROM_ZERO: return "half_away_from_zero";
        case RoundingMode::HALF_EVEN: return "half_even";
        case RoundingMode::HALF_UP: return "half_up";
    }
    throw std::invalid_argument("Invalid rounding mode");
}

Money round_minor_units(double value, RoundingMode mode) {
    if (!std::isfinite(value)) {
        throw std::domain_error("Cannot round non-finite amount: " + std::to_string(value));
    }

    switch (mode) {
        case RoundingMode::HALF_AWAY_FROM_ZERO:
            return static_cast<Money>(std::round(value));
        case RoundingMode::HALF_UP:
            return static_cast<Money>(std::floor(value + 0.5));
        case RoundingMode::HALF_EVEN: {
            double lower = std::floor(value);
            double diff = value - lower;
            if (diff < 0.5) return static_cast<Money>(lower);
            if (diff > 0.5) return static_cast<Money>(lower + 1.0);
            return static_cast<Money>(std::fmod(lower, 2.0) == 0.0 ? lower : lower + 1.0);
        }
    }
    throw std::invalid_argument("Invalid rounding mode");
}

} // namespace olp::domain
