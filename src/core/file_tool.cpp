/*
 * sandfs C++ - File Tool Implementation
 *
 * FileToolProvider: agent-facing wrapper around SandboxedFileSystem.
 */
#include <sandfs/core/file_tool.hpp>
#include <sandfs/core/config.hpp>
#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <sstream>
#include <stdexcept>

namespace sandfs {

// ============================================================================
// Helpers
// ============================================================================

namespace {

template<typename T>
Json base_data(const FsResult<T>& r) {
    Json data;
    data["status"] = fs_status_name(r.status);
    data["path"] = r.path;
    if (!r.success()) {
        data["error"] = r.error;
    }
    return data;
}

// "denied: Access denied: ... (../x)"
template<typename T>
ToolResult failure(const FsResult<T>& r) {
    std::string msg = std::string(fs_status_name(r.status)) + ": " + r.error + " (" + r.path + ")";
    return ToolResult::fail(msg, base_data(r));
}

bool string_param(const Json& params, const char* key, std::string& out) {
    if (!params.contains(key) || !params[key].is_string()) {
        return false;
    }
    out = params[key].get<std::string>();
    return true;
}

ToolResult missing_param(const char* key) {
    return ToolResult::fail(std::string("Missing required parameter: ") + key);
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

FileToolProvider::FileToolProvider() : max_read_size_(50000) {}

FileToolProvider::~FileToolProvider() {
    shutdown();
}

// ============================================================================
// Plugin Interface
// ============================================================================

bool FileToolProvider::init(const Config& cfg) {
    // Re-init always starts from a closed sandbox
    shutdown();

    std::string root = cfg.get_string("filesystem.root", "./sandbox");

    FsOptions options;
    std::string mode_str = cfg.get_string("filesystem.dir_mode", "0700");
    unsigned int mode = 0;
    if (parse_octal_mode(mode_str, mode)) {
        options.dir_mode = mode;
    } else {
        LOG_WARN("[FileTool] Invalid filesystem.dir_mode '%s', using 0700", mode_str.c_str());
    }

    int64_t depth = cfg.get_int("filesystem.max_tree_depth", 64);
    if (depth > 0) {
        options.max_tree_depth = static_cast<size_t>(depth);
    } else {
        LOG_WARN("[FileTool] filesystem.max_tree_depth must be positive, using %zu",
                 options.max_tree_depth);
    }

    int64_t max_read = cfg.get_int("filesystem.max_read_size", 50000);
    max_read_size_ = max_read > 0 ? static_cast<size_t>(max_read) : 50000;

    try {
        fs_.reset(new SandboxedFileSystem(root, options));
    } catch (const std::runtime_error& e) {
        LOG_ERROR("[FileTool] Cannot open sandbox: %s", e.what());
        return false;
    }

    initialized_ = true;
    LOG_INFO("[FileTool] Initialized (max_tree_depth=%zu, max_read_size=%zu)",
             options.max_tree_depth, max_read_size_);
    return true;
}

void FileToolProvider::shutdown() {
    fs_.reset();
    initialized_ = false;
}

// ============================================================================
// ToolProvider Interface
// ============================================================================

std::vector<std::string> FileToolProvider::actions() const {
    std::vector<std::string> acts;
    acts.push_back("exists");
    acts.push_back("current_directory");
    acts.push_back("change_directory");
    acts.push_back("list_contents");
    acts.push_back("make_directory");
    acts.push_back("write_file");
    acts.push_back("read_file");
    acts.push_back("get_directory_tree");
    return acts;
}

ToolResult FileToolProvider::execute(const std::string& action, const Json& params) {
    if (!initialized_ || !fs_) {
        return ToolResult::fail("File tool not initialized");
    }

    if (action == "exists")             return do_exists(params);
    if (action == "current_directory")  return do_current_directory(params);
    if (action == "change_directory")   return do_change_directory(params);
    if (action == "list_contents")      return do_list_contents(params);
    if (action == "make_directory")     return do_make_directory(params);
    if (action == "write_file")         return do_write_file(params);
    if (action == "read_file")          return do_read_file(params);
    if (action == "get_directory_tree") return do_get_directory_tree(params);

    return ToolResult::fail("Unknown action: " + action);
}

// ============================================================================
// Agent Tool Definitions
// ============================================================================

std::vector<AgentTool> FileToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    FileToolProvider* self = const_cast<FileToolProvider*>(this);

    auto bind = [self](AgentTool& tool, const std::string& action) {
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            ToolResult r = self->execute(action, params);
            if (!r.success) {
                return AgentToolResult::fail(r.error);
            }
            return AgentToolResult::ok(r.data.contains("output")
                                       ? r.data["output"].get<std::string>()
                                       : r.data.dump(2));
        };
    };

    // exists
    {
        AgentTool tool;
        tool.name = "exists";
        tool.description = "Check whether a file or directory exists in the sandbox.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "Path to check (relative to the current directory, or absolute from the sandbox root)",
            true
        ));
        bind(tool, "exists");
        tools.push_back(tool);
    }

    // current_directory
    {
        AgentTool tool;
        tool.name = "current_directory";
        tool.description = "Show the current directory, relative to the sandbox root.";
        bind(tool, "current_directory");
        tools.push_back(tool);
    }

    // change_directory
    {
        AgentTool tool;
        tool.name = "change_directory";
        tool.description = "Change the current directory. Relative paths in later calls "
                           "are resolved against it.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "Directory to change to",
            true
        ));
        bind(tool, "change_directory");
        tools.push_back(tool);
    }

    // list_contents
    {
        AgentTool tool;
        tool.name = "list_contents";
        tool.description = "List files and directories in the current directory.";
        bind(tool, "list_contents");
        tools.push_back(tool);
    }

    // make_directory
    {
        AgentTool tool;
        tool.name = "make_directory";
        tool.description = "Create a directory, including any missing parent directories. "
                           "Succeeds if it already exists.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "Directory to create",
            true
        ));
        bind(tool, "make_directory");
        tools.push_back(tool);
    }

    // write_file
    {
        AgentTool tool;
        tool.name = "write_file";
        tool.description = "Write UTF-8 text to a file. Creates parent directories as needed. "
                           "OVERWRITES the whole file: always provide the complete content.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "File to write",
            true
        ));
        tool.params.push_back(ToolParamSchema(
            "content", "string",
            "Complete file content",
            true
        ));
        bind(tool, "write_file");
        tools.push_back(tool);
    }

    // read_file
    {
        AgentTool tool;
        tool.name = "read_file";
        tool.description = "Read the full content of a UTF-8 text file.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "File to read",
            true
        ));
        bind(tool, "read_file");
        tools.push_back(tool);
    }

    // get_directory_tree
    {
        AgentTool tool;
        tool.name = "get_directory_tree";
        tool.description = "List every directory below a path together with its files "
                           "and subdirectories.";
        tool.params.push_back(ToolParamSchema(
            "path", "string",
            "Directory to start from (default: current directory)",
            false
        ));
        bind(tool, "get_directory_tree");
        tools.push_back(tool);
    }

    return tools;
}

// ============================================================================
// Action Implementations
// ============================================================================

ToolResult FileToolProvider::do_exists(const Json& params) {
    std::string path;
    if (!string_param(params, "path", path)) {
        return missing_param("path");
    }

    FsResult<bool> r = fs_->exists(path);
    if (!r.success()) {
        return failure(r);
    }

    Json data = base_data(r);
    data["exists"] = r.value;
    data["output"] = (r.value ? "Exists: " : "Does not exist: ") + r.path;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_current_directory(const Json& params) {
    (void)params;
    std::string cwd = fs_->current_directory();

    Json data;
    data["status"] = fs_status_name(FsStatus::OK);
    data["path"] = cwd;
    data["output"] = cwd;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_change_directory(const Json& params) {
    std::string path;
    if (!string_param(params, "path", path)) {
        return missing_param("path");
    }

    FsResult<std::string> r = fs_->change_directory(path);
    if (!r.success()) {
        return failure(r);
    }

    Json data = base_data(r);
    data["output"] = "Changed directory to " + r.value;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_list_contents(const Json& params) {
    (void)params;
    FsResult<DirListing> r = fs_->list_contents();
    if (!r.success()) {
        return failure(r);
    }

    Json files = Json::array();
    std::ostringstream out;
    for (size_t i = 0; i < r.value.entries.size(); ++i) {
        const DirEntry& e = r.value.entries[i];
        Json entry;
        entry["name"] = e.name;
        entry["type"] = e.is_dir() ? "directory" : "file";
        entry["size"] = e.size;
        files.push_back(entry);

        out << "\"" << e.name << "\" (" << (e.is_dir() ? "directory" : "file") << ")\n";
    }
    out << r.value.count() << " entries";

    Json data = base_data(r);
    data["files"] = files;
    data["count"] = r.value.count();
    data["output"] = out.str();
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_make_directory(const Json& params) {
    std::string path;
    if (!string_param(params, "path", path)) {
        return missing_param("path");
    }

    FsResult<std::string> r = fs_->make_directory(path);
    if (!r.success()) {
        return failure(r);
    }

    Json data = base_data(r);
    data["output"] = "Created directory " + r.value;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_write_file(const Json& params) {
    std::string path;
    std::string content;
    if (!string_param(params, "path", path)) {
        return missing_param("path");
    }
    if (!string_param(params, "content", content)) {
        return missing_param("content");
    }

    FsResult<size_t> r = fs_->write_file(path, content);
    if (!r.success()) {
        return failure(r);
    }

    Json data = base_data(r);
    data["bytes_written"] = r.value;
    data["output"] = "Wrote " + std::to_string(r.value) + " bytes to " + r.path;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_read_file(const Json& params) {
    std::string path;
    if (!string_param(params, "path", path)) {
        return missing_param("path");
    }

    FsResult<std::string> r = fs_->read_file(path);
    if (!r.success()) {
        return failure(r);
    }

    Json data = base_data(r);
    data["content"] = r.value;

    std::string output = r.value;
    if (output.size() > max_read_size_) {
        output = truncate_safe(output, max_read_size_) + "\n\n... [truncated, file too large] ...";
    }
    data["output"] = output;
    return ToolResult::ok(data);
}

ToolResult FileToolProvider::do_get_directory_tree(const Json& params) {
    std::string path;
    if (!string_param(params, "path", path) || path.empty()) {
        path = ".";
    }

    FsResult<DirectoryTree> r = fs_->get_directory_tree(path);
    if (!r.success()) {
        return failure(r);
    }

    Json tree = Json::object();
    std::ostringstream out;
    for (DirectoryTree::const_iterator it = r.value.begin(); it != r.value.end(); ++it) {
        tree[it->first] = it->second;

        out << it->first << ":\n";
        std::vector<std::string> lines = split(it->second, '\n');
        for (size_t i = 0; i < lines.size(); ++i) {
            out << "  " << lines[i] << "\n";
        }
    }

    Json data = base_data(r);
    data["tree"] = tree;
    data["output"] = rtrim(out.str());
    return ToolResult::ok(data);
}

} // namespace sandfs
