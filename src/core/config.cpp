/*
 * sandfs C++ - Configuration Implementation
 */
#include <sandfs/core/config.hpp>
#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace sandfs {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_ERROR("[Config] Cannot open config file: %s", path.c_str());
        return false;
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    
    if (!load_string(content.str())) {
        LOG_ERROR("[Config] Failed to load %s", path.c_str());
        return false;
    }
    
    source_ = path;
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("[Config] JSON parse error: %s", e.what());
        return false;
    }
    
    if (!parsed.is_object()) {
        LOG_ERROR("[Config] Top-level config value must be an object");
        return false;
    }
    
    data_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_unsigned() &&
        v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        LOG_WARN("[Config] '%s' is out of range, using default", key.c_str());
        return default_val;
    }
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) {
        // [-2^63, 2^63): anything else has no int64_t value
        double d = v->get<double>();
        if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            return static_cast<int64_t>(d);
        }
        LOG_WARN("[Config] '%s' is out of range, using default", key.c_str());
        return default_val;
    }
    if (v->is_string()) {
        try {
            return std::stoll(v->get<std::string>());
        } catch (const std::exception&) {
            LOG_WARN("[Config] '%s' is not a number, using default", key.c_str());
        }
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace sandfs
