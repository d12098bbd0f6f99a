#pragma once

#include <string>

namespace olp::config {

struct PricingSettings {
    std::string rounding = "half_away_from_zero";  // "half_away_from_zero", "half_even", "half_up"
};

struct OutputSettings {
    int json_indent = 2;           // negative for compact output
    bool include_discounts = true;
};

struct Settings {
    PricingSettings pricing;
    OutputSettings output;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace olp::config
