#include <calcmcp/tool_registry.hpp>

namespace calcmcp {

void ToolRegistry::add_tool(const std::string& name, const std::string& description,
                            const json& input_schema, ToolFunction func) {
    Tool tool;
    tool.name = name;
    tool.description = description;
    tool.input_schema = input_schema;
    tool.function = std::move(func);
    tools_[name] = std::move(tool);
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<ToolInfo> ToolRegistry::list() const {
    std::vector<ToolInfo> infos;
    infos.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        infos.push_back({tool.name, tool.description, tool.input_schema});
    }
    return infos;
}

} // namespace calcmcp
