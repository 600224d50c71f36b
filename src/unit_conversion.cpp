#include <calcmcp/calculator_tools.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include "tool_args.hpp"

namespace calcmcp {

namespace {

using FactorTable = std::unordered_map<std::string, double>;

// Factors to the base unit of each category: metre, kilogram, litre, square metre
const FactorTable& length_units() {
    static const FactorTable table = {
        {"mm", 0.001}, {"millimeter", 0.001}, {"millimeters", 0.001},
        {"cm", 0.01}, {"centimeter", 0.01}, {"centimeters", 0.01},
        {"m", 1.0}, {"meter", 1.0}, {"meters", 1.0}, {"metre", 1.0}, {"metres", 1.0},
        {"km", 1000.0}, {"kilometer", 1000.0}, {"kilometers", 1000.0},
        {"in", 0.0254}, {"inch", 0.0254}, {"inches", 0.0254},
        {"ft", 0.3048}, {"foot", 0.3048}, {"feet", 0.3048},
        {"yd", 0.9144}, {"yard", 0.9144}, {"yards", 0.9144},
        {"mi", 1609.344}, {"mile", 1609.344}, {"miles", 1609.344},
        {"nmi", 1852.0}
    };
    return table;
}

const FactorTable& weight_units() {
    static const FactorTable table = {
        {"mg", 1e-6}, {"milligram", 1e-6}, {"milligrams", 1e-6},
        {"g", 0.001}, {"gram", 0.001}, {"grams", 0.001},
        {"kg", 1.0}, {"kilogram", 1.0}, {"kilograms", 1.0},
        {"t", 1000.0}, {"tonne", 1000.0}, {"tonnes", 1000.0},
        {"oz", 0.028349523125}, {"ounce", 0.028349523125}, {"ounces", 0.028349523125},
        {"lb", 0.45359237}, {"lbs", 0.45359237}, {"pound", 0.45359237}, {"pounds", 0.45359237},
        {"st", 6.35029318}, {"stone", 6.35029318}
    };
    return table;
}

const FactorTable& volume_units() {
    static const FactorTable table = {
        {"ml", 0.001}, {"milliliter", 0.001}, {"milliliters", 0.001},
        {"l", 1.0}, {"liter", 1.0}, {"liters", 1.0}, {"litre", 1.0}, {"litres", 1.0},
        {"m3", 1000.0},
        {"tsp", 0.00492892159375}, {"tbsp", 0.01478676478125},
        {"fl_oz", 0.0295735295625}, {"cup", 0.2365882365},
        {"pt", 0.473176473}, {"pint", 0.473176473}, {"pints", 0.473176473},
        {"qt", 0.946352946}, {"quart", 0.946352946}, {"quarts", 0.946352946},
        {"gal", 3.785411784}, {"gallon", 3.785411784}, {"gallons", 3.785411784}
    };
    return table;
}

const FactorTable& area_units() {
    static const FactorTable table = {
        {"mm2", 1e-6}, {"cm2", 1e-4}, {"m2", 1.0}, {"km2", 1e6},
        {"ha", 1e4}, {"hectare", 1e4}, {"hectares", 1e4},
        {"acre", 4046.8564224}, {"acres", 4046.8564224},
        {"in2", 0.00064516}, {"ft2", 0.09290304}, {"yd2", 0.83612736},
        {"mi2", 2589988.110336}
    };
    return table;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double factor_for(const FactorTable& table, const std::string& unit, const std::string& category) {
    auto it = table.find(lowercase(unit));
    if (it == table.end()) {
        throw std::invalid_argument("unknown " + category + " unit '" + unit + "'");
    }
    return it->second;
}

// Returns 'c', 'f' or 'k'
char temperature_scale(const std::string& unit) {
    std::string u = lowercase(unit);
    if (u == "c" || u == "celsius") return 'c';
    if (u == "f" || u == "fahrenheit") return 'f';
    if (u == "k" || u == "kelvin") return 'k';
    throw std::invalid_argument("unknown temperature unit '" + unit + "'");
}

double convert_temperature(double value, const std::string& from, const std::string& to) {
    double celsius = 0;
    switch (temperature_scale(from)) {
        case 'c': celsius = value; break;
        case 'f': celsius = (value - 32.0) * 5.0 / 9.0; break;
        default: celsius = value - 273.15; break;
    }
    if (celsius < -273.15) {
        throw std::domain_error("temperature below absolute zero");
    }

    switch (temperature_scale(to)) {
        case 'c': return celsius;
        case 'f': return celsius * 9.0 / 5.0 + 32.0;
        default: return celsius + 273.15;
    }
}

} // namespace

json unit_conversion(const json& args) {
    double value = detail::require_number(args, "value");
    std::string from = detail::require_string(args, "fromUnit");
    std::string to = detail::require_string(args, "toUnit");
    std::string category = detail::require_string(args, "category");

    double result = 0;
    if (category == "temperature") {
        result = convert_temperature(value, from, to);
    } else {
        const FactorTable* table = nullptr;
        if (category == "length") {
            table = &length_units();
        } else if (category == "weight") {
            table = &weight_units();
        } else if (category == "volume") {
            table = &volume_units();
        } else if (category == "area") {
            table = &area_units();
        } else {
            throw std::invalid_argument("unknown category '" + category + "'");
        }
        result = value * factor_for(*table, from, category) / factor_for(*table, to, category);
    }

    // Trim representation noise such as 0.30000000000000004
    detail::check_finite(result, "conversion result");
    if (std::fabs(result) < 1e15) {
        result = detail::round_to(result, 10);
    }

    return {
        {"result", canonical_number(result)},
        {"unit", to}
    };
}

} // namespace calcmcp
