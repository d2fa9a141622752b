/*
 * sandfs C++ - Tool Runner
 * 
 * Registry of AgentTools plus the JSON call protocol used to drive them.
 * 
 * Tool Call Format (one JSON object):
 *   {"tool": "tool_name", "arguments": {"param1": "value1"}}
 * 
 * Tool Result Format:
 *   [TOOL_RESULT tool=tool_name success=true]
 *     ... result content ...
 *   [/TOOL_RESULT]
 */
#ifndef sandfs_CORE_TOOL_RUNNER_HPP
#define sandfs_CORE_TOOL_RUNNER_HPP

#include "json.hpp"
#include "tool.hpp"
#include <string>
#include <vector>
#include <map>

namespace sandfs {

struct ParsedToolCall {
    std::string tool_name;
    Json params;
    std::string raw_content;
    bool valid;
    std::string parse_error;
    
    ParsedToolCall() : params(Json::object()), valid(false) {}
};

class ToolRunner {
public:
    ToolRunner();
    ~ToolRunner();
    
    void register_tool(const AgentTool& tool);
    
    // Registers every tool returned by provider.get_agent_tools()
    void register_provider(const ToolProvider& provider);
    
    const std::map<std::string, AgentTool>& tools() const { return tools_; }
    
    // Human readable description of every tool and its parameters
    std::string build_tools_prompt() const;
    
    // Parse a single JSON tool call. Never throws; check `valid`.
    ParsedToolCall parse_tool_call(const std::string& text) const;
    
    AgentToolResult execute_tool(const ParsedToolCall& call);
    
    std::string format_tool_result(const std::string& tool_name, const AgentToolResult& result) const;
    
    // parse + execute + format
    std::string run_line(const std::string& line);

private:
    std::string available_tools() const;
    
    std::map<std::string, AgentTool> tools_;
};

} // namespace sandfs

#endif // sandfs_CORE_TOOL_RUNNER_HPP
