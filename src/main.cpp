#include "config/Settings.hpp"
#include "infrastructure/OrderLineJsonCodec.hpp"
#include "services/LinePricingService.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: order_line_pricer [path|-]" << std::endl;
        std::cerr << "       Reads order lines as JSON from path, or stdin when omitted." << std::endl;
        return 1;
    }
    std::string path = argc == 2 ? argv[1] : "";

    try {
        auto settings = olp::config::Settings::from_environment();
        olp::services::LinePricingService service(settings.pricing);
        olp::infrastructure::OrderLineJsonCodec codec;

        auto lines = codec.parse(read_input(path));
        auto pricings = service.price_all(lines);

        std::cout << codec.serialize(pricings, service.rounding(),
                                     settings.output.include_discounts,
                                     settings.output.json_indent)
                  << std::endl;
        std::cerr << "[pricer] Priced " << pricings.size() << " lines (rounding="
                  << settings.pricing.rounding << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[pricer] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
