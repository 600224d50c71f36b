#ifndef CALCMCP_TOOL_REGISTRY_HPP
#define CALCMCP_TOOL_REGISTRY_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcmcp {

// Tool function signature. Failures are reported by throwing; the message
// of the exception is returned to the client as error data.
using ToolFunction = std::function<json(const json& arguments)>;

// Tool metadata as advertised by tools/list
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool definition
struct Tool {
    std::string name;
    std::string description;
    json input_schema;  // documentation only, not enforced
    ToolFunction function;
};

/**
 * Name -> tool mapping.
 *
 * Filled before a transport starts serving and only read afterwards, so it
 * carries no locking of its own.
 */
class ToolRegistry {
public:
    // Registering an existing name replaces the previous tool.
    void add_tool(const std::string& name, const std::string& description,
                  const json& input_schema, ToolFunction func);

    const Tool* find(const std::string& name) const;

    // Order is unspecified.
    std::vector<ToolInfo> list() const;

    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::unordered_map<std::string, Tool> tools_;
};

} // namespace calcmcp

#endif // CALCMCP_TOOL_REGISTRY_HPP
