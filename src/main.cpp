/*
 * sandfs C++ - Sandboxed File System Tool Server
 * 
 * Usage:
 *   ./sandfs [--root DIR] [config.json] < calls.jsonl
 * 
 * Each input line is a JSON tool call; each result is written to stdout.
 */
#include <sandfs/core/application.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    auto& app = sandfs::Application::instance();
    
    if (!app.init(argc, argv)) {
        // init returns false for --help/--version/--tools or fatal errors
        return app.exit_code();
    }
    
    int result = app.run(std::cin, std::cout);
    app.shutdown();
    
    return result;
}
