#include "infrastructure/OrderLineJsonCodec.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace olp::domain;

namespace olp::infrastructure {

namespace {

OrderLine parse_order_line(const json& obj) {
    OrderLine line(obj.at("quantity").get<int64_t>(),
                   obj.at("listPrice").get<Money>(),
                   obj.at("listPriceIncludesTax").get<bool>());

    line.set_order_placed_quantity(obj.value("orderPlacedQuantity", int64_t{0}));
    if (obj.contains("initialListPrice") && !obj["initialListPrice"].is_null()) {
        line.set_initial_list_price(obj["initialListPrice"].get<Money>());
    }

    std::vector<TaxLine> tax_lines;
    for (const auto& tax_line : obj.value("taxLines", json::array())) {
        tax_lines.emplace_back(tax_line.value("description", ""),
                               tax_line.at("taxRate").get<double>());
    }
    line.set_tax_lines(std::move(tax_lines));

    for (const auto& adj : obj.value("adjustments", json::array())) {
        line.add_adjustment(Adjustment{
            adjustment_type_from_string(adj.at("type").get<std::string>()),
            adj.at("adjustmentSource").get<std::string>(),
            adj.at("amount").get<Money>(),
            adj.value("description", ""),
        });
    }

    return line;
}

json serialize_prices(const LinePriceSnapshot& p) {
    return json{
        {"quantity", p.quantity},
        {"taxRate", p.tax_rate},
        {"unitPrice", p.unit_price},
        {"unitPriceWithTax", p.unit_price_with_tax},
        {"unitPriceChangeSinceAdded", p.unit_price_change_since_added},
        {"unitPriceWithTaxChangeSinceAdded", p.unit_price_with_tax_change_since_added},
        {"discountedUnitPrice", p.discounted_unit_price},
        {"discountedUnitPriceWithTax", p.discounted_unit_price_with_tax},
        {"proratedUnitPrice", p.prorated_unit_price},
        {"proratedUnitPriceWithTax", p.prorated_unit_price_with_tax},
        {"unitTax", p.unit_tax},
        {"proratedUnitTax", p.prorated_unit_tax},
        {"linePrice", p.line_price},
        {"linePriceWithTax", p.line_price_with_tax},
        {"discountedLinePrice", p.discounted_line_price},
        {"discountedLinePriceWithTax", p.discounted_line_price_with_tax},
        {"proratedLinePrice", p.prorated_line_price},
        {"proratedLinePriceWithTax", p.prorated_line_price_with_tax},
        {"lineTax", p.line_tax},
        {"proratedLineTax", p.prorated_line_tax},
    };
}

json serialize_discount(const Discount& d, RoundingMode rounding) {
    return json{
        {"adjustmentSource", d.adjustment_source},
        {"type", to_string(d.type)},
        {"description", d.description},
        {"amount", round_minor_units(d.amount, rounding)},
        {"amountWithTax", round_minor_units(d.amount_with_tax, rounding)},
    };
}

} // anonymous namespace

std::vector<OrderLine> OrderLineJsonCodec::parse(const std::string& json_str) const {
    auto doc = json::parse(json_str);
    auto& items = doc.is_array() ? doc : (doc = json::array({doc}));

    std::vector<OrderLine> lines;
    lines.reserve(items.size());
    for (const auto& obj : items) {
        lines.push_back(parse_order_line(obj));
    }
    return lines;
}

std::string OrderLineJsonCodec::serialize(const std::vector<olp::services::LinePricing>& pricings,
                                          RoundingMode rounding,
                                          bool include_discounts,
                                          int indent) const {
    json out = json::array();
    for (const auto& pricing : pricings) {
        auto obj = serialize_prices(pricing.prices);
        if (include_discounts) {
            json discounts = json::array();
            for (const auto& discount : pricing.discounts) {
                discounts.push_back(serialize_discount(discount, rounding));
            }
            obj["discounts"] = std::move(discounts);
        }
        out.push_back(std::move(obj));
    }
    return out.dump(indent);
}

} // namespace olp::infrastructure
