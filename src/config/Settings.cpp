#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace olp::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("OLP_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.pricing.rounding = env_or("OLP_ROUNDING", s.pricing.rounding);
    s.output.json_indent = env_int_or("OLP_JSON_INDENT", s.output.json_indent);
    s.output.include_discounts = env_bool_or("OLP_INCLUDE_DISCOUNTS", s.output.include_discounts);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.output.json_indent = 2;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.output.json_indent = -1;
    return s;
}

} // namespace olp::config
