/*
 * sandfs C++ - Tool Provider Interface
 * 
 * A ToolProvider exposes a set of named actions that take JSON parameters.
 * get_agent_tools() turns those actions into AgentTool entries (name,
 * description, parameter schema, executor) for a ToolRunner.
 */
#ifndef sandfs_CORE_TOOL_HPP
#define sandfs_CORE_TOOL_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <functional>

namespace sandfs {

class Config;

// ============================================================================
// Tool Definition
// ============================================================================

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    
    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result, as shown to the caller
struct AgentToolResult {
    bool success;
    std::string output;     // Text output
    std::string error;      // Error message if failed
    
    AgentToolResult() : success(false) {}
    
    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }
    
    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;
    
    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

// ============================================================================
// Provider Interface
// ============================================================================

// Structured result of ToolProvider::execute()
struct ToolResult {
    bool success;
    Json data;
    std::string error;
    
    ToolResult() : success(false), data(Json::object()) {}
    
    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }
    
    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
    
    // Failure that still carries structured data
    static ToolResult fail(const std::string& err, const Json& data) {
        ToolResult r = fail(err);
        r.data = data;
        return r;
    }
};

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}
    
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;
    
    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    
    bool is_initialized() const { return initialized_; }
    
    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;
    
    // Default: one generic wrapper per action, routed through execute().
    // Providers override this to give detailed descriptions.
    virtual std::vector<AgentTool> get_agent_tools() const;

protected:
    bool initialized_;
};

} // namespace sandfs

#endif // sandfs_CORE_TOOL_HPP
