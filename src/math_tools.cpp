#include <calcmcp/calculator_tools.hpp>
#include <cmath>
#include <stdexcept>
#include "tool_args.hpp"

namespace calcmcp {

namespace {

constexpr double kPi = 3.14159265358979323846;

double to_radians(double degrees) { return degrees * kPi / 180.0; }
double to_degrees(double radians) { return radians * 180.0 / kPi; }

double factorial(double value) {
    if (value < 0 || std::floor(value) != value) {
        throw std::domain_error("factorial requires a non-negative integer");
    }
    if (value > 170) {
        throw std::domain_error("factorial overflows for values above 170");
    }
    double result = 1;
    for (int i = 2; i <= static_cast<int>(value); ++i) {
        result *= i;
    }
    return result;
}

} // namespace

json basic_math(const json& args) {
    std::string operation = detail::require_string(args, "operation");
    std::vector<double> operands = detail::require_numbers(args, "operands", 2);

    double precision = detail::optional_number(args, "precision", 2);
    if (precision < 0 || precision > 15 || std::floor(precision) != precision) {
        throw std::invalid_argument("precision must be an integer between 0 and 15");
    }

    double result = operands[0];
    if (operation == "add") {
        for (std::size_t i = 1; i < operands.size(); ++i) result += operands[i];
    } else if (operation == "subtract") {
        for (std::size_t i = 1; i < operands.size(); ++i) result -= operands[i];
    } else if (operation == "multiply") {
        for (std::size_t i = 1; i < operands.size(); ++i) result *= operands[i];
    } else if (operation == "divide") {
        for (std::size_t i = 1; i < operands.size(); ++i) {
            if (operands[i] == 0) {
                throw std::domain_error("division by zero");
            }
            result /= operands[i];
        }
    } else {
        throw std::invalid_argument("unknown operation '" + operation +
                                    "' (expected add, subtract, multiply or divide)");
    }

    detail::check_finite(result, "result");
    return canonical_number(detail::round_to(result, static_cast<int>(precision)));
}

json advanced_math(const json& args) {
    std::string function = detail::require_string(args, "function");
    double value = detail::require_number(args, "value");
    std::string unit = detail::optional_string(args, "unit", "radians");
    if (unit != "radians" && unit != "degrees") {
        throw std::invalid_argument("unit must be 'radians' or 'degrees'");
    }
    bool degrees = unit == "degrees";

    double result = 0;
    if (function == "sin") {
        result = std::sin(degrees ? to_radians(value) : value);
    } else if (function == "cos") {
        result = std::cos(degrees ? to_radians(value) : value);
    } else if (function == "tan") {
        result = std::tan(degrees ? to_radians(value) : value);
    } else if (function == "asin" || function == "acos") {
        if (value < -1 || value > 1) {
            throw std::domain_error(function + " is only defined on [-1, 1]");
        }
        result = function == "asin" ? std::asin(value) : std::acos(value);
        if (degrees) result = to_degrees(result);
    } else if (function == "atan") {
        result = std::atan(value);
        if (degrees) result = to_degrees(result);
    } else if (function == "log" || function == "ln" || function == "log10") {
        if (value <= 0) {
            throw std::domain_error("logarithm requires a positive value");
        }
        result = function == "log10" ? std::log10(value) : std::log(value);
    } else if (function == "sqrt") {
        if (value < 0) {
            throw std::domain_error("cannot take the square root of a negative number");
        }
        result = std::sqrt(value);
    } else if (function == "abs") {
        result = std::fabs(value);
    } else if (function == "factorial") {
        result = factorial(value);
    } else if (function == "pow") {
        result = std::pow(value, detail::optional_number(args, "exponent", 2));
    } else if (function == "exp") {
        result = std::exp(value);
    } else {
        throw std::invalid_argument("unknown function '" + function + "'");
    }

    return canonical_number(detail::check_finite(result, function + "(" + std::to_string(value) + ")"));
}

} // namespace calcmcp
