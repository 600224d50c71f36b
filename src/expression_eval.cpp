#include <calcmcp/calculator_tools.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include "tool_args.hpp"

namespace calcmcp {

namespace {

// Every nesting level (sign, parenthesis, function call, exponent) goes through parse_unary
constexpr int kMaxNestingDepth = 256;

/**
 * Recursive descent evaluator.
 *
 *   expression := term (('+' | '-') term)*
 *   term       := unary (('*' | '/' | '%') unary)*
 *   unary      := ('+' | '-') unary | power
 *   power      := primary ('^' unary)?          right associative
 *   primary    := number | name | name '(' expression ')' | '(' expression ')'
 */
class ExpressionParser {
public:
    ExpressionParser(const std::string& text, const std::map<std::string, double>& variables)
        : text_(text), variables_(variables) {}

    double parse() {
        double value = parse_expression();
        skip_whitespace();
        if (pos_ != text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument(what + " at position " + std::to_string(pos_) + " in '" + text_ + "'");
    }

    void skip_whitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    double parse_expression() {
        double value = parse_term();
        for (;;) {
            if (consume('+')) {
                value += parse_term();
            } else if (consume('-')) {
                value -= parse_term();
            } else {
                return value;
            }
        }
    }

    double parse_term() {
        double value = parse_unary();
        for (;;) {
            if (consume('*')) {
                value *= parse_unary();
            } else if (consume('/')) {
                double divisor = parse_unary();
                if (divisor == 0) {
                    throw std::domain_error("division by zero");
                }
                value /= divisor;
            } else if (consume('%')) {
                double divisor = parse_unary();
                if (divisor == 0) {
                    throw std::domain_error("modulo by zero");
                }
                value = std::fmod(value, divisor);
            } else {
                return value;
            }
        }
    }

    double parse_unary() {
        if (++depth_ > kMaxNestingDepth) {
            throw std::invalid_argument("expression nested too deeply");
        }
        double value;
        if (consume('-')) {
            value = -parse_unary();
        } else if (consume('+')) {
            value = parse_unary();
        } else {
            value = parse_power();
        }
        --depth_;
        return value;
    }

    double parse_power() {
        double base = parse_primary();
        if (consume('^')) {
            return std::pow(base, parse_unary());
        }
        return base;
    }

    double parse_primary() {
        skip_whitespace();
        if (pos_ >= text_.size()) {
            fail("unexpected end of expression");
        }

        if (consume('(')) {
            double value = parse_expression();
            if (!consume(')')) {
                fail("missing ')'");
            }
            return value;
        }

        char c = text_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            const char* start = text_.c_str() + pos_;
            char* end = nullptr;
            double value = std::strtod(start, &end);
            if (end == start) {
                fail("invalid number");
            }
            pos_ += static_cast<std::size_t>(end - start);
            return value;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t begin = pos_;
            while (pos_ < text_.size() &&
                   (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                ++pos_;
            }
            std::string name = text_.substr(begin, pos_ - begin);

            if (consume('(')) {
                double argument = parse_expression();
                if (!consume(')')) {
                    fail("missing ')' after argument of " + name);
                }
                return apply_function(name, argument);
            }
            return lookup(name);
        }

        fail("unexpected '" + std::string(1, c) + "'");
    }

    double lookup(const std::string& name) const {
        auto it = variables_.find(name);
        if (it != variables_.end()) {
            return it->second;
        }
        if (name == "pi") {
            return 3.14159265358979323846;
        }
        if (name == "e") {
            return 2.71828182845904523536;
        }
        throw std::invalid_argument("unknown variable '" + name + "'");
    }

    double apply_function(const std::string& name, double x) const {
        if (name == "sqrt") {
            if (x < 0) throw std::domain_error("sqrt of a negative number");
            return std::sqrt(x);
        }
        if (name == "ln" || name == "log" || name == "log10") {
            if (x <= 0) throw std::domain_error(name + " of a non-positive number");
            return name == "log10" ? std::log10(x) : std::log(x);
        }
        if (name == "sin") return std::sin(x);
        if (name == "cos") return std::cos(x);
        if (name == "tan") return std::tan(x);
        if (name == "asin") return std::asin(x);
        if (name == "acos") return std::acos(x);
        if (name == "atan") return std::atan(x);
        if (name == "abs") return std::fabs(x);
        if (name == "exp") return std::exp(x);
        if (name == "floor") return std::floor(x);
        if (name == "ceil") return std::ceil(x);
        if (name == "round") return std::round(x);
        throw std::invalid_argument("unknown function '" + name + "'");
    }

    const std::string& text_;
    const std::map<std::string, double>& variables_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

} // namespace

double evaluate_expression(const std::string& expression, const std::map<std::string, double>& variables) {
    return ExpressionParser(expression, variables).parse();
}

json expression_eval(const json& args) {
    std::string expression = detail::require_string(args, "expression");

    std::map<std::string, double> variables;
    auto vars_it = args.find("variables");
    if (vars_it != args.end() && !vars_it->is_null()) {
        if (!vars_it->is_object()) {
            throw std::invalid_argument("argument 'variables' must be an object");
        }
        for (const auto& [name, value] : vars_it->items()) {
            if (!value.is_number()) {
                throw std::invalid_argument("variable '" + name + "' must be a number");
            }
            variables[name] = value.get<double>();
        }
    }

    double result = evaluate_expression(expression, variables);
    return canonical_number(detail::check_finite(result, "expression result"));
}

} // namespace calcmcp
