#ifndef CALCMCP_CALCULATOR_TOOLS_HPP
#define CALCMCP_CALCULATOR_TOOLS_HPP

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include <calcmcp/mcp_server.hpp>

using json = nlohmann::json;

namespace calcmcp {

// Registers every calculator tool below on the server.
void register_calculator_tools(MCPServer& server);

// ==================== TOOL HANDLERS ====================
// Each handler takes the tools/call arguments object. Invalid arguments
// throw std::invalid_argument, undefined results throw std::domain_error.

// {operation: add|subtract|multiply|divide, operands: [n, n, ...], precision: 0..15}
json basic_math(const json& args);

// {function, value, unit: radians|degrees, exponent}
json advanced_math(const json& args);

// {expression, variables: {name: number}}
json expression_eval(const json& args);

// {data: [n...], operation: mean|median|mode|std_dev|variance|percentile, percentile}
json statistics(const json& args);

// {value, fromUnit, toUnit, category: length|weight|temperature|volume|area}
json unit_conversion(const json& args);

// {operation, principal, rate, time, periods, futureValue}
json financial(const json& args);

// Evaluate an arithmetic expression. Throws std::invalid_argument on
// syntax errors and unknown names.
double evaluate_expression(const std::string& expression, const std::map<std::string, double>& variables);

// ==================== INPUT SCHEMAS ====================

json basic_math_schema();
json advanced_math_schema();
json expression_eval_schema();
json statistics_schema();
json unit_conversion_schema();
json financial_schema();

} // namespace calcmcp

#endif // CALCMCP_CALCULATOR_TOOLS_HPP
