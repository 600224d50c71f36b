#ifndef CALCMCP_TOOL_ARGS_HPP
#define CALCMCP_TOOL_ARGS_HPP

// Argument extraction shared by the calculator tools. Every helper throws
// std::invalid_argument with a message naming the offending field.

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace calcmcp {
namespace detail {

using json = nlohmann::json;

inline const json& require(const json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        throw std::invalid_argument("missing required argument '" + key + "'");
    }
    return *it;
}

inline std::string require_string(const json& args, const std::string& key) {
    const json& value = require(args, key);
    if (!value.is_string()) {
        throw std::invalid_argument("argument '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

inline double require_number(const json& args, const std::string& key) {
    const json& value = require(args, key);
    if (!value.is_number()) {
        throw std::invalid_argument("argument '" + key + "' must be a number");
    }
    return value.get<double>();
}

inline double optional_number(const json& args, const std::string& key, double fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw std::invalid_argument("argument '" + key + "' must be a number");
    }
    return it->get<double>();
}

inline std::string optional_string(const json& args, const std::string& key, const std::string& fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw std::invalid_argument("argument '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

inline std::vector<double> require_numbers(const json& args, const std::string& key, std::size_t min_items) {
    const json& value = require(args, key);
    if (!value.is_array()) {
        throw std::invalid_argument("argument '" + key + "' must be an array of numbers");
    }
    std::vector<double> numbers;
    numbers.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_number()) {
            throw std::invalid_argument("argument '" + key + "' must only contain numbers");
        }
        numbers.push_back(item.get<double>());
    }
    if (numbers.size() < min_items) {
        throw std::invalid_argument("argument '" + key + "' needs at least " + std::to_string(min_items) +
                                    " item" + (min_items == 1 ? "" : "s"));
    }
    return numbers;
}

inline double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline double check_finite(double value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw std::domain_error(what + " is not a finite number");
    }
    return value;
}

} // namespace detail
} // namespace calcmcp

#endif // CALCMCP_TOOL_ARGS_HPP
