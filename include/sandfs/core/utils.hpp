#ifndef sandfs_CORE_UTILS_HPP
#define sandfs_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace sandfs {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ UTF-8 utilities ============

// Strict UTF-8 validation (rejects overlong forms, surrogates and code
// points above U+10FFFF). On failure, *error_offset receives the byte offset
// of the first invalid sequence.
bool is_valid_utf8(const std::string& s, size_t* error_offset = nullptr);

// ============ Path utilities ============

// Split a path into its non-empty components ("a//b/" -> ["a", "b"])
std::vector<std::string> path_components(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Parse an octal permission string ("0700", "755"). Returns false on junk.
bool parse_octal_mode(const std::string& s, unsigned int& mode);

} // namespace sandfs

#endif // sandfs_CORE_UTILS_HPP
