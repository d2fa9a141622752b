/*
 * sandfs C++ - Tool Provider Implementation
 */
#include <sandfs/core/tool.hpp>

namespace sandfs {

std::vector<AgentTool> ToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    ToolProvider* self = const_cast<ToolProvider*>(this);
    
    const std::vector<std::string> action_list = actions();
    const std::string id = tool_id();
    const std::string desc = description();
    
    for (size_t i = 0; i < action_list.size(); ++i) {
        const std::string action = action_list[i];
        AgentTool tool;
        tool.name = id + "_" + action;
        tool.description = desc + " - " + action + " action";
        tool.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            ToolResult r = self->execute(action, params);
            return r.success ? AgentToolResult::ok(r.data.dump(2))
                             : AgentToolResult::fail(r.error);
        };
        tools.push_back(tool);
    }
    
    return tools;
}

} // namespace sandfs
