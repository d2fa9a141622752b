/*
 * sandfs C++ - Sandboxed File System
 * 
 * File and directory operations confined to a root directory, with a
 * virtual current directory layered on top of the real filesystem.
 * 
 * Path resolution:
 *   - "/a/b" is sandbox-absolute: it is re-anchored under the root
 *   - "a/b" is anchored under the current directory
 *   - the anchored path is canonicalized (".", ".." and symlinks) and
 *     must then be the root or a descendant of it
 * 
 * Containment is checked after symlinks are followed, so a link inside the
 * root that points outside of it is rejected just like "../..".
 * 
 * Paths handed back to callers are always sandbox-relative ("/" is the
 * root); real paths never leave this class except through resolve().
 */
#ifndef sandfs_CORE_FILE_SYSTEM_HPP
#define sandfs_CORE_FILE_SYSTEM_HPP

#include "fs_result.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <cstdint>

namespace sandfs {

// ============================================================================
// Types
// ============================================================================

enum class EntryType {
    FILE,
    DIRECTORY
};

struct DirEntry {
    std::string name;
    EntryType type;
    uint64_t size;      // 0 for directories
    
    DirEntry() : type(EntryType::FILE), size(0) {}
    DirEntry(const std::string& n, EntryType t, uint64_t s) : name(n), type(t), size(s) {}
    
    bool is_dir() const { return type == EntryType::DIRECTORY; }
};

struct DirListing {
    std::vector<DirEntry> entries;      // Ordered by name
    
    size_t count() const { return entries.size(); }
};

// Sandbox-relative directory path -> newline-joined listing of its children
typedef std::map<std::string, std::string> DirectoryTree;

struct FsOptions {
    unsigned int dir_mode;      // Mode for created directories (default: 0700)
    unsigned int file_mode;     // Mode for created files (default: 0600)
    size_t max_tree_depth;      // Levels below the start of a tree walk (default: 64)
    
    FsOptions()
        : dir_mode(0700)
        , file_mode(0600)
        , max_tree_depth(64) {}
};

// ============================================================================
// SandboxedFileSystem
// ============================================================================

class SandboxedFileSystem {
public:
    // Creates the root if needed. Throws std::runtime_error if the root
    // cannot be created, resolved, or is not a directory.
    explicit SandboxedFileSystem(const std::string& root, const FsOptions& options = FsOptions());
    
    // Canonical real root
    const std::string& root() const { return root_; }
    const FsOptions& options() const { return options_; }
    
    // Resolve a caller path to a real absolute path inside the root.
    // For collaborators that need to validate a location before using it.
    FsResult<std::string> resolve(const std::string& path) const;
    
    // Real path (already resolved) -> sandbox-relative path
    std::string to_sandbox_path(const std::string& real_path) const;
    
    FsResult<bool> exists(const std::string& path) const;
    
    // Sandbox-relative current directory, "/" at the root
    std::string current_directory() const;
    
    // Value is the new sandbox-relative current directory. On any failure
    // the current directory is left unchanged.
    FsResult<std::string> change_directory(const std::string& path);
    
    // Immediate children of the current directory
    FsResult<DirListing> list_contents() const;
    
    // mkdir -p. Value is the sandbox-relative path of the directory.
    FsResult<std::string> make_directory(const std::string& path);
    
    // Replaces the whole file. Value is the number of bytes written.
    FsResult<size_t> write_file(const std::string& path, const std::string& content);
    
    // Value is the full UTF-8 content
    FsResult<std::string> read_file(const std::string& path) const;
    
    FsResult<DirectoryTree> get_directory_tree(const std::string& path) const;

private:
    SandboxedFileSystem(const SandboxedFileSystem&);
    SandboxedFileSystem& operator=(const SandboxedFileSystem&);
    
    // Pure function of (root_, base, path)
    FsResult<std::string> resolve_from(const std::string& base, const std::string& path) const;
    
    // Expand ".", ".." and symlinks of an absolute path; missing trailing
    // components are kept lexically.
    bool canonicalize(const std::string& path, std::string& out, std::string& error) const;
    
    bool is_within_root(const std::string& real_path) const;
    
    // Create real_path and any missing parents below the root
    bool ensure_directory(const std::string& real_path, std::string& error) const;
    
    bool list_directory(const std::string& real_dir, std::vector<DirEntry>& out,
                        std::string& error) const;
    
    void walk_tree(const std::string& real_dir, const std::string& sandbox_dir, size_t depth,
                   std::set<std::string>& visited, DirectoryTree& tree) const;
    
    std::string cwd_snapshot() const;
    
    std::string root_;
    FsOptions options_;
    
    mutable std::mutex cwd_mutex_;
    std::string current_directory_;     // Real path, guarded by cwd_mutex_
};

} // namespace sandfs

#endif // sandfs_CORE_FILE_SYSTEM_HPP
