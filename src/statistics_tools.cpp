#include <calcmcp/calculator_tools.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>
#include "tool_args.hpp"

namespace calcmcp {

namespace {

double mean(const std::vector<double>& data) {
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

// Sample variance; a single observation has no spread
double variance(const std::vector<double>& data) {
    if (data.size() < 2) {
        return 0;
    }
    double m = mean(data);
    double sum = 0;
    for (double x : data) {
        sum += (x - m) * (x - m);
    }
    return sum / static_cast<double>(data.size() - 1);
}

double percentile(std::vector<double> data, double p) {
    std::sort(data.begin(), data.end());
    double rank = p / 100.0 * static_cast<double>(data.size() - 1);
    std::size_t lower = static_cast<std::size_t>(std::floor(rank));
    std::size_t upper = static_cast<std::size_t>(std::ceil(rank));
    double fraction = rank - static_cast<double>(lower);
    return data[lower] + (data[upper] - data[lower]) * fraction;
}

json modes(const std::vector<double>& data) {
    std::map<double, std::size_t> counts;
    for (double x : data) {
        counts[x]++;
    }
    std::size_t best = 0;
    for (const auto& [value, count] : counts) {
        best = std::max(best, count);
    }
    json result = json::array();
    for (const auto& [value, count] : counts) {
        if (count == best) {
            result.push_back(canonical_number(value));
        }
    }
    return result;
}

} // namespace

json statistics(const json& args) {
    std::vector<double> data = detail::require_numbers(args, "data", 1);
    std::string operation = detail::require_string(args, "operation");

    json result;
    if (operation == "mean") {
        result = canonical_number(mean(data));
    } else if (operation == "median") {
        result = canonical_number(percentile(data, 50));
    } else if (operation == "mode") {
        result = modes(data);
    } else if (operation == "variance") {
        result = canonical_number(variance(data));
    } else if (operation == "std_dev") {
        result = canonical_number(std::sqrt(variance(data)));
    } else if (operation == "percentile") {
        double p = detail::require_number(args, "percentile");
        if (p < 0 || p > 100) {
            throw std::invalid_argument("percentile must be between 0 and 100");
        }
        result = canonical_number(percentile(data, p));
    } else {
        throw std::invalid_argument("unknown operation '" + operation + "'");
    }

    return {
        {"result", result},
        {"count", data.size()}
    };
}

} // namespace calcmcp
