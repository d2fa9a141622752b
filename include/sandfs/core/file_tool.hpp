/*
 * sandfs C++ - File Tool
 * 
 * ToolProvider that exposes a SandboxedFileSystem to an agent:
 * 
 *   exists              - Check whether a path exists
 *   current_directory   - Show the current directory
 *   change_directory    - Move the current directory
 *   list_contents       - List the current directory
 *   make_directory      - Create a directory (and parents)
 *   write_file          - Create or overwrite a file
 *   read_file           - Read a UTF-8 text file
 *   get_directory_tree  - Listing of every directory below a path
 * 
 * Every action returns JSON data with at least "status" and "path"; a
 * human-readable "output" is included for successful calls.
 */
#ifndef sandfs_CORE_FILE_TOOL_HPP
#define sandfs_CORE_FILE_TOOL_HPP

#include "tool.hpp"
#include "file_system.hpp"
#include <string>
#include <memory>

namespace sandfs {

class FileToolProvider : public ToolProvider {
public:
    FileToolProvider();
    virtual ~FileToolProvider();
    
    const char* name() const override { return "file_tool"; }
    const char* description() const override {
        return "Sandboxed file and directory operations";
    }
    const char* version() const override { return "1.0.0"; }
    
    // Reads filesystem.root, filesystem.dir_mode, filesystem.max_tree_depth
    // and filesystem.max_read_size
    bool init(const Config& cfg) override;
    void shutdown() override;
    
    const char* tool_id() const override { return "file"; }
    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;
    
    std::vector<AgentTool> get_agent_tools() const override;
    
    // nullptr before init()
    SandboxedFileSystem* file_system() { return fs_.get(); }

private:
    std::unique_ptr<SandboxedFileSystem> fs_;
    size_t max_read_size_;
    
    ToolResult do_exists(const Json& params);
    ToolResult do_current_directory(const Json& params);
    ToolResult do_change_directory(const Json& params);
    ToolResult do_list_contents(const Json& params);
    ToolResult do_make_directory(const Json& params);
    ToolResult do_write_file(const Json& params);
    ToolResult do_read_file(const Json& params);
    ToolResult do_get_directory_tree(const Json& params);
};

} // namespace sandfs

#endif // sandfs_CORE_FILE_TOOL_HPP
