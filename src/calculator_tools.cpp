#include <calcmcp/calculator_tools.hpp>
#include <iostream>

namespace calcmcp {

json basic_math_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"operation", {{"type", "string"}, {"enum", {"add", "subtract", "multiply", "divide"}}}},
            {"operands", {
                {"type", "array"},
                {"items", {{"type", "number"}}},
                {"minItems", 2}
            }},
            {"precision", {{"type", "integer"}, {"minimum", 0}, {"maximum", 15}, {"default", 2}}}
        }},
        {"required", {"operation", "operands"}}
    };
}

json advanced_math_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"function", {
                {"type", "string"},
                {"enum", {"sin", "cos", "tan", "asin", "acos", "atan", "log", "log10", "ln",
                          "sqrt", "abs", "factorial", "pow", "exp"}}
            }},
            {"value", {{"type", "number"}}},
            {"unit", {{"type", "string"}, {"enum", {"radians", "degrees"}}, {"default", "radians"}}},
            {"exponent", {{"type", "number"}, {"default", 2}, {"description", "Exponent used by pow"}}}
        }},
        {"required", {"function", "value"}}
    };
}

json expression_eval_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"expression", {{"type", "string"}}},
            {"variables", {
                {"type", "object"},
                {"patternProperties", {
                    {"^[a-zA-Z][a-zA-Z0-9_]*$", {{"type", "number"}}}
                }}
            }}
        }},
        {"required", {"expression"}}
    };
}

json statistics_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", {
                {"type", "array"},
                {"items", {{"type", "number"}}},
                {"minItems", 1}
            }},
            {"operation", {
                {"type", "string"},
                {"enum", {"mean", "median", "mode", "std_dev", "variance", "percentile"}}
            }},
            {"percentile", {{"type", "number"}, {"minimum", 0}, {"maximum", 100}}}
        }},
        {"required", {"data", "operation"}}
    };
}

json unit_conversion_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"value", {{"type", "number"}}},
            {"fromUnit", {{"type", "string"}}},
            {"toUnit", {{"type", "string"}}},
            {"category", {
                {"type", "string"},
                {"enum", {"length", "weight", "temperature", "volume", "area"}}
            }}
        }},
        {"required", {"value", "fromUnit", "toUnit", "category"}}
    };
}

json financial_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"operation", {
                {"type", "string"},
                {"enum", {"compound_interest", "simple_interest", "loan_payment", "roi",
                          "present_value", "future_value"}}
            }},
            {"principal", {{"type", "number"}, {"minimum", 0}}},
            {"rate", {{"type", "number"}, {"minimum", 0}}},
            {"time", {{"type", "number"}, {"minimum", 0}}},
            {"periods", {{"type", "integer"}, {"minimum", 1}}},
            {"futureValue", {{"type", "number"}, {"minimum", 0}}}
        }},
        {"required", {"operation"}}
    };
}

void register_calculator_tools(MCPServer& server) {
    server.add_tool("basic_math",
                    "Perform basic mathematical operations (add, subtract, multiply, divide)",
                    basic_math_schema(), basic_math);
    server.add_tool("advanced_math",
                    "Perform advanced mathematical functions (trigonometry, logarithms, etc.)",
                    advanced_math_schema(), advanced_math);
    server.add_tool("expression_eval",
                    "Evaluate mathematical expressions with variable substitution",
                    expression_eval_schema(), expression_eval);
    server.add_tool("statistics",
                    "Perform statistical analysis on data sets",
                    statistics_schema(), statistics);
    server.add_tool("unit_conversion",
                    "Convert between different units of measurement",
                    unit_conversion_schema(), unit_conversion);
    server.add_tool("financial",
                    "Perform financial calculations (interest, loans, ROI)",
                    financial_schema(), financial);

    std::cerr << "Registered " << server.tools().size() << " calculator tools" << std::endl;
}

} // namespace calcmcp
