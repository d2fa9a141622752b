#include <sandfs/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <sstream>

namespace sandfs {

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && 
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    
    // Back up if in the middle of a multi-byte sequence
    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;
    }
    return s.substr(0, len);
}

// ============ UTF-8 utilities ============

bool is_valid_utf8(const std::string& s, size_t* error_offset) {
    size_t i = 0;
    const size_t n = s.size();
    
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        
        if (c < 0x80) {
            ++i;
            continue;
        }
        
        int expected = 0;
        unsigned int cp = 0;
        unsigned int min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            expected = 2;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
            cp = c & 0x07;
            min_cp = 0x10000;
        } else {
            if (error_offset) *error_offset = i;
            return false;
        }
        
        if (i + expected > n) {
            if (error_offset) *error_offset = i;
            return false;
        }
        
        for (int j = 1; j < expected; ++j) {
            unsigned char cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80) {
                if (error_offset) *error_offset = i;
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        
        // Overlong encodings, UTF-16 surrogates, beyond Unicode range
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            if (error_offset) *error_offset = i;
            return false;
        }
        
        i += expected;
    }
    
    return true;
}

// ============ Path utilities ============

std::vector<std::string> path_components(const std::string& path) {
    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i].empty()) {
            result.push_back(parts[i]);
        }
    }
    return result;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    
    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';
    
    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

bool parse_octal_mode(const std::string& s, unsigned int& mode) {
    std::string t = trim(s);
    if (t.empty() || t.size() > 4) return false;
    
    unsigned int value = 0;
    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i] < '0' || t[i] > '7') return false;
        value = value * 8 + static_cast<unsigned int>(t[i] - '0');
    }
    mode = value;
    return true;
}

} // namespace sandfs
