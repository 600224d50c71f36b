#include <calcmcp/calculator_tools.hpp>
#include <cmath>
#include <stdexcept>
#include "tool_args.hpp"

namespace calcmcp {

namespace {

// Monetary results are reported to the cent
json money(double value) {
    return canonical_number(detail::round_to(detail::check_finite(value, "result"), 2));
}

double non_negative(const json& args, const std::string& key) {
    double value = detail::require_number(args, key);
    if (value < 0) {
        throw std::invalid_argument("argument '" + key + "' must not be negative");
    }
    return value;
}

double periods_per_year(const json& args, double fallback) {
    double periods = detail::optional_number(args, "periods", fallback);
    if (periods < 1 || std::floor(periods) != periods) {
        throw std::invalid_argument("argument 'periods' must be a positive integer");
    }
    return periods;
}

// Growth factor of compounding `rate` percent per year, `periods` times a year, for `years`
double growth(double rate, double periods, double years) {
    return std::pow(1.0 + rate / 100.0 / periods, periods * years);
}

json result_of(double result, json breakdown, const std::string& description) {
    return {
        {"result", money(result)},
        {"breakdown", std::move(breakdown)},
        {"description", description}
    };
}

} // namespace

json financial(const json& args) {
    std::string operation = detail::require_string(args, "operation");

    if (operation == "compound_interest") {
        double principal = non_negative(args, "principal");
        double rate = non_negative(args, "rate");
        double time = non_negative(args, "time");
        double periods = periods_per_year(args, 1);

        double amount = principal * growth(rate, periods, time);
        return result_of(amount, {
            {"principal", money(principal)},
            {"interest", money(amount - principal)},
            {"total", money(amount)}
        }, "Final amount with interest compounded " + std::to_string(static_cast<int>(periods)) +
           " time(s) per year");
    }

    if (operation == "simple_interest") {
        double principal = non_negative(args, "principal");
        double rate = non_negative(args, "rate");
        double time = non_negative(args, "time");

        double interest = principal * rate / 100.0 * time;
        return result_of(interest, {
            {"principal", money(principal)},
            {"interest", money(interest)},
            {"total", money(principal + interest)}
        }, "Simple interest earned");
    }

    if (operation == "loan_payment") {
        double principal = non_negative(args, "principal");
        double rate = non_negative(args, "rate");
        double time = non_negative(args, "time");
        double periods = periods_per_year(args, 12);

        double payments = std::round(periods * time);
        if (payments < 1) {
            throw std::invalid_argument("loan term must cover at least one payment");
        }
        double period_rate = rate / 100.0 / periods;
        double payment = period_rate == 0
            ? principal / payments
            : principal * period_rate / (1.0 - std::pow(1.0 + period_rate, -payments));

        return result_of(payment, {
            {"payments", canonical_number(payments)},
            {"total_paid", money(payment * payments)},
            {"total_interest", money(payment * payments - principal)}
        }, "Payment per period");
    }

    if (operation == "roi") {
        double cost = detail::require_number(args, "principal");
        double final_value = non_negative(args, "futureValue");
        if (cost <= 0) {
            throw std::invalid_argument("argument 'principal' must be positive for roi");
        }

        return result_of((final_value - cost) / cost * 100.0, {
            {"cost", money(cost)},
            {"final_value", money(final_value)},
            {"gain", money(final_value - cost)}
        }, "Return on investment in percent");
    }

    if (operation == "present_value") {
        double future_value = non_negative(args, "futureValue");
        double rate = non_negative(args, "rate");
        double time = non_negative(args, "time");
        double periods = periods_per_year(args, 1);

        double present = future_value / growth(rate, periods, time);
        return result_of(present, {
            {"future_value", money(future_value)},
            {"discount", money(future_value - present)}
        }, "Present value of a future amount");
    }

    if (operation == "future_value") {
        double principal = non_negative(args, "principal");
        double rate = non_negative(args, "rate");
        double time = non_negative(args, "time");
        double periods = periods_per_year(args, 1);

        double future = principal * growth(rate, periods, time);
        return result_of(future, {
            {"principal", money(principal)},
            {"growth", money(future - principal)}
        }, "Future value of a present amount");
    }

    throw std::invalid_argument("unknown operation '" + operation + "'");
}

} // namespace calcmcp
