/*
 * sandfs C++ - Configuration
 *
 * JSON-backed configuration with dotted key access:
 *
 *   {
 *     "log_level": "info",
 *     "filesystem": { "root": "./sandbox", "max_tree_depth": 64 }
 *   }
 *
 *   cfg.get_string("filesystem.root", ".")
 */
#ifndef sandfs_CORE_CONFIG_HPP
#define sandfs_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace sandfs {

class Config {
public:
    Config();
    
    // Load from a JSON file. Returns false (and logs) on I/O or parse errors;
    // the previous contents are kept in that case.
    bool load_file(const std::string& path);
    
    // Load from a JSON string. Same failure policy as load_file().
    bool load_string(const std::string& text);
    
    bool has(const std::string& key) const;
    
    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);
    
    const Json& raw() const { return data_; }
    const std::string& source() const { return source_; }

private:
    // Walk a dotted key; returns nullptr if any segment is missing
    const Json* find(const std::string& key) const;
    
    // Walk a dotted key, creating intermediate objects
    Json& slot(const std::string& key);
    
    Json data_;
    std::string source_;
};

} // namespace sandfs

#endif // sandfs_CORE_CONFIG_HPP
