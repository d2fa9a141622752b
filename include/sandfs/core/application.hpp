/*
 * sandfs C++ - Application
 * 
 * Command line front end: loads the configuration, opens the sandbox through
 * the file tool and serves JSON tool calls read line by line.
 */
#ifndef sandfs_CORE_APPLICATION_HPP
#define sandfs_CORE_APPLICATION_HPP

#include "config.hpp"
#include "file_tool.hpp"
#include "tool_runner.hpp"
#include <string>
#include <atomic>
#include <iosfwd>

namespace sandfs {

struct AppInfo {
    static constexpr const char* NAME = "sandfs";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();
    
    // Returns false when the process should exit without serving
    // (--help, --version, --tools, or a fatal setup error).
    // Safe to call again: each call starts from a fresh configuration.
    bool init(int argc, char* argv[]);
    
    // Serve tool calls from `in` until EOF or stop(). Returns the exit code.
    int run(std::istream& in, std::ostream& out);
    
    void shutdown();
    
    void stop() { running_ = false; }
    
    // Non-zero when init() failed for a reason other than an informational flag
    int exit_code() const { return exit_code_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_tools();
    
    std::atomic<bool> running_;
    int exit_code_;
    Config config_;
    FileToolProvider file_tool_;
    ToolRunner runner_;
    
    std::string config_file_;
    bool config_explicit_;
    std::string root_override_;
    std::string log_level_override_;
    bool no_color_;
    bool print_tools_;
};

} // namespace sandfs

#endif // sandfs_CORE_APPLICATION_HPP
