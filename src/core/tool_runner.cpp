/*
 * sandfs C++ - Tool Runner Implementation
 */
#include <sandfs/core/tool_runner.hpp>
#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <sstream>

namespace sandfs {

ToolRunner::ToolRunner() {}

ToolRunner::~ToolRunner() {}

void ToolRunner::register_tool(const AgentTool& tool) {
    LOG_DEBUG("[ToolRunner] Registering tool: %s", tool.name.c_str());
    tools_[tool.name] = tool;
}

void ToolRunner::register_provider(const ToolProvider& provider) {
    std::vector<AgentTool> provided = provider.get_agent_tools();
    for (size_t i = 0; i < provided.size(); ++i) {
        register_tool(provided[i]);
    }
    LOG_DEBUG("[ToolRunner] Provider '%s' registered %zu tools", provider.name(), provided.size());
}

std::string ToolRunner::available_tools() const {
    std::string names;
    for (std::map<std::string, AgentTool>::const_iterator t = tools_.begin(); t != tools_.end(); ++t) {
        if (t != tools_.begin()) names += ", ";
        names += t->first;
    }
    return names;
}

std::string ToolRunner::build_tools_prompt() const {
    if (tools_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "## Available Tools\n\n";
    oss << "Call a tool with one JSON object per line:\n\n";
    oss << "  {\"tool\": \"TOOLNAME\", \"arguments\": {\"param\": \"value\"}}\n\n";
    oss << "Paths are relative to the current directory; a leading '/' means the sandbox root.\n\n";
    oss << "### Tools:\n\n";

    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        const AgentTool& tool = it->second;
        oss << "**" << tool.name << "**: " << tool.description << "\n";

        if (!tool.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < tool.params.size(); ++i) {
                const ToolParamSchema& param = tool.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }

    return oss.str();
}

ParsedToolCall ToolRunner::parse_tool_call(const std::string& text) const {
    ParsedToolCall call;
    call.raw_content = trim(text);

    Json value;
    try {
        value = Json::parse(call.raw_content);
    } catch (const std::exception& e) {
        call.parse_error = e.what();
        return call;
    }

    if (!value.is_object()) {
        call.parse_error = "tool call must be a JSON object";
        return call;
    }
    if (!value.contains("tool") || !value["tool"].is_string()) {
        call.parse_error = "missing \"tool\" name";
        return call;
    }
    call.tool_name = value["tool"].get<std::string>();

    // "params" is accepted as an alias of "arguments"
    const char* args_key = value.contains("arguments") ? "arguments"
                         : (value.contains("params") ? "params" : nullptr);
    if (args_key) {
        if (!value[args_key].is_object()) {
            call.parse_error = std::string("\"") + args_key + "\" must be an object";
            return call;
        }
        call.params = value[args_key];
    }

    call.valid = true;
    return call;
}

AgentToolResult ToolRunner::execute_tool(const ParsedToolCall& call) {
    if (!call.valid) {
        std::ostringstream error_msg;
        error_msg << "Invalid tool call: " << call.parse_error << "\n";
        error_msg << "Expected: {\"tool\": \"name\", \"arguments\": {...}}\n";
        error_msg << "Raw content received:\n" << truncate_safe(call.raw_content, 500);
        if (call.raw_content.size() > 500) {
            error_msg << "... [truncated]";
        }
        return AgentToolResult::fail(error_msg.str());
    }

    std::map<std::string, AgentTool>::iterator it = tools_.find(call.tool_name);
    if (it == tools_.end()) {
        return AgentToolResult::fail("Unknown tool: " + call.tool_name +
                                     "\nAvailable tools: " + available_tools());
    }

    LOG_INFO("[ToolRunner] Executing tool: %s", call.tool_name.c_str());
    LOG_DEBUG("[ToolRunner] Tool params: %s", call.params.dump().c_str());

    if (!it->second.execute) {
        return AgentToolResult::fail("Tool has no executor: " + call.tool_name);
    }

    try {
        AgentToolResult result = it->second.execute(call.params);
        LOG_DEBUG("[ToolRunner] Tool %s result: success=%s, output_len=%zu",
                  call.tool_name.c_str(), result.success ? "yes" : "no",
                  result.output.size());
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[ToolRunner] Tool %s threw exception: %s", call.tool_name.c_str(), e.what());
        return AgentToolResult::fail(std::string("Tool exception: ") + e.what());
    }
}

std::string ToolRunner::format_tool_result(const std::string& tool_name,
                                           const AgentToolResult& result) const {
    std::ostringstream oss;
    oss << "[TOOL_RESULT tool=" << tool_name
        << " success=" << (result.success ? "true" : "false") << "]\n";

    if (result.success) {
        oss << result.output;
    } else {
        oss << "Error: " << result.error;
    }

    oss << "\n[/TOOL_RESULT]";
    return oss.str();
}

std::string ToolRunner::run_line(const std::string& line) {
    ParsedToolCall call = parse_tool_call(line);
    AgentToolResult result = execute_tool(call);
    return format_tool_result(call.tool_name.empty() ? "unknown" : call.tool_name, result);
}

} // namespace sandfs
