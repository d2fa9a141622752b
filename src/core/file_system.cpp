/*
 * sandfs C++ - Sandboxed File System Implementation
 *
 * POSIX implementation: canonicalization walks the path one component at a
 * time with lstat()/readlink(), so symlinks are expanded before the
 * containment check and ".." applies to the resolved target of a link.
 */
#include <sandfs/core/file_system.hpp>
#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

namespace sandfs {

namespace {

// Same limit as the kernel's MAXSYMLINKS
const int MAX_SYMLINK_EXPANSIONS = 40;

const char* DIRECTORY_TAG = " (directory)";

std::string errno_text(int err) {
    return std::string(strerror(err));
}

bool is_missing_errno(int err) {
    return err == ENOENT || err == ENOTDIR;
}

bool entry_name_less(const DirEntry& a, const DirEntry& b) {
    return a.name < b.name;
}

} // namespace

// ============================================================================
// FsStatus
// ============================================================================

const char* fs_status_name(FsStatus status) {
    switch (status) {
        case FsStatus::OK: return "ok";
        case FsStatus::DENIED: return "denied";
        case FsStatus::NOT_FOUND: return "not_found";
        case FsStatus::WRONG_TYPE: return "wrong_type";
        case FsStatus::IO_FAILURE: return "io_failure";
        case FsStatus::DECODE_FAILURE: return "decode_failure";
        default: return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

SandboxedFileSystem::SandboxedFileSystem(const std::string& root, const FsOptions& options)
    : options_(options)
{
    if (root.empty()) {
        throw std::runtime_error("sandbox root must not be empty");
    }
    if (root.find('\0') != std::string::npos) {
        throw std::runtime_error("sandbox root contains a NUL byte");
    }

    // Create the root and its missing parents
    std::string current = (root[0] == '/') ? "" : ".";
    std::vector<std::string> parts = path_components(root);
    for (size_t i = 0; i < parts.size(); ++i) {
        current += "/" + parts[i];
        if (mkdir(current.c_str(), options_.dir_mode) != 0 && errno != EEXIST) {
            throw std::runtime_error("cannot create sandbox root '" + root + "': " + errno_text(errno));
        }
    }

    char resolved[PATH_MAX];
    if (!realpath(root.c_str(), resolved)) {
        throw std::runtime_error("cannot resolve sandbox root '" + root + "': " + errno_text(errno));
    }
    root_ = resolved;

    struct stat st;
    if (stat(root_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw std::runtime_error("sandbox root '" + root + "' is not a directory");
    }

    current_directory_ = root_;

    LOG_INFO("[FileSystem] Sandbox root: %s", root_.c_str());
}

// ============================================================================
// Path resolution
// ============================================================================

bool SandboxedFileSystem::canonicalize(const std::string& path, std::string& out,
                                       std::string& error) const {
    std::deque<std::string> pending;
    std::vector<std::string> parts = path_components(path);
    pending.insert(pending.end(), parts.begin(), parts.end());

    std::vector<std::string> resolved;
    int expansions = 0;

    while (!pending.empty()) {
        std::string comp = pending.front();
        pending.pop_front();

        if (comp == ".") {
            continue;
        }
        if (comp == "..") {
            if (!resolved.empty()) resolved.pop_back();
            continue;
        }

        std::string candidate = "/" + join(resolved, "/");
        candidate = join_path(candidate, comp);

        struct stat st;
        if (lstat(candidate.c_str(), &st) != 0) {
            if (is_missing_errno(errno)) {
                // Not there (yet): keep the name lexically
                resolved.push_back(comp);
                continue;
            }
            error = errno_text(errno);
            return false;
        }

        if (!S_ISLNK(st.st_mode)) {
            resolved.push_back(comp);
            continue;
        }

        if (++expansions > MAX_SYMLINK_EXPANSIONS) {
            error = "too many levels of symbolic links";
            return false;
        }

        char target[PATH_MAX];
        ssize_t len = readlink(candidate.c_str(), target, sizeof(target) - 1);
        if (len < 0) {
            error = errno_text(errno);
            return false;
        }
        target[len] = '\0';

        std::string link_target(target, static_cast<size_t>(len));
        if (!link_target.empty() && link_target[0] == '/') {
            resolved.clear();
        }
        std::vector<std::string> link_parts = path_components(link_target);
        pending.insert(pending.begin(), link_parts.begin(), link_parts.end());
    }

    out = "/" + join(resolved, "/");
    return true;
}

bool SandboxedFileSystem::is_within_root(const std::string& real_path) const {
    if (real_path == root_) return true;
    if (root_ == "/") return !real_path.empty() && real_path[0] == '/';
    return real_path.size() > root_.size() &&
           real_path.compare(0, root_.size(), root_) == 0 &&
           real_path[root_.size()] == '/';
}

FsResult<std::string> SandboxedFileSystem::resolve_from(const std::string& base,
                                                        const std::string& path) const {
    if (path.find('\0') != std::string::npos) {
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, path,
                                           "invalid path: embedded NUL byte");
    }

    // Absolute inputs are sandbox-absolute
    std::string anchored;
    if (!path.empty() && path[0] == '/') {
        size_t start = path.find_first_not_of('/');
        anchored = join_path(root_, start == std::string::npos ? std::string() : path.substr(start));
    } else {
        anchored = join_path(base, path);
    }

    std::string real;
    std::string error;
    if (!canonicalize(anchored, real, error)) {
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, path, error);
    }

    if (!is_within_root(real)) {
        return FsResult<std::string>::fail(FsStatus::DENIED, path,
                                           "Access denied: path is outside the sandbox root");
    }

    return FsResult<std::string>::ok(real, to_sandbox_path(real));
}

FsResult<std::string> SandboxedFileSystem::resolve(const std::string& path) const {
    FsResult<std::string> r = resolve_from(cwd_snapshot(), path);
    if (r.status == FsStatus::DENIED) {
        LOG_WARN("[FileSystem] Denied: '%s' escapes the sandbox", path.c_str());
    }
    return r;
}

std::string SandboxedFileSystem::to_sandbox_path(const std::string& real_path) const {
    if (real_path == root_) return "/";
    if (root_ == "/") return real_path;
    return "/" + real_path.substr(root_.size() + 1);
}

std::string SandboxedFileSystem::cwd_snapshot() const {
    std::lock_guard<std::mutex> lock(cwd_mutex_);
    return current_directory_;
}

// ============================================================================
// Operations
// ============================================================================

FsResult<bool> SandboxedFileSystem::exists(const std::string& path) const {
    FsResult<std::string> resolved = resolve(path);
    if (!resolved.success()) {
        return FsResult<bool>::from(resolved);
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) == 0) {
        return FsResult<bool>::ok(true, resolved.path);
    }
    if (is_missing_errno(errno)) {
        return FsResult<bool>::ok(false, resolved.path);
    }
    return FsResult<bool>::fail(FsStatus::IO_FAILURE, resolved.path, errno_text(errno));
}

std::string SandboxedFileSystem::current_directory() const {
    return to_sandbox_path(cwd_snapshot());
}

FsResult<std::string> SandboxedFileSystem::change_directory(const std::string& path) {
    // Held across resolve/check/commit so a concurrent relative resolution
    // never sees a half-applied change
    std::lock_guard<std::mutex> lock(cwd_mutex_);

    FsResult<std::string> resolved = resolve_from(current_directory_, path);
    if (!resolved.success()) {
        if (resolved.status == FsStatus::DENIED) {
            LOG_WARN("[FileSystem] cd denied: '%s' escapes the sandbox", path.c_str());
        }
        return resolved;
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) != 0) {
        if (is_missing_errno(errno)) {
            return FsResult<std::string>::fail(FsStatus::NOT_FOUND, resolved.path,
                                               "Directory does not exist: " + path);
        }
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, resolved.path, errno_text(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return FsResult<std::string>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                           "Not a directory: " + path);
    }

    current_directory_ = resolved.value;
    LOG_DEBUG("[FileSystem] cd -> %s", resolved.path.c_str());
    return FsResult<std::string>::ok(resolved.path, resolved.path);
}

bool SandboxedFileSystem::list_directory(const std::string& real_dir, std::vector<DirEntry>& out,
                                         std::string& error) const {
    DIR* dir = opendir(real_dir.c_str());
    if (!dir) {
        error = errno_text(errno);
        return false;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;

        std::string entry_path = join_path(real_dir, name);
        struct stat st;
        if (lstat(entry_path.c_str(), &st) != 0) {
            out.push_back(DirEntry(name, EntryType::FILE, 0));
            continue;
        }

        // A link is typed by its target only while that target stays inside
        // the root; dangling, looping and escaping links are bare files
        if (S_ISLNK(st.st_mode)) {
            std::string target;
            std::string link_error;
            if (!canonicalize(entry_path, target, link_error) || !is_within_root(target) ||
                stat(target.c_str(), &st) != 0) {
                out.push_back(DirEntry(name, EntryType::FILE, 0));
                continue;
            }
        }

        if (S_ISDIR(st.st_mode)) {
            out.push_back(DirEntry(name, EntryType::DIRECTORY, 0));
        } else {
            out.push_back(DirEntry(name, EntryType::FILE, static_cast<uint64_t>(st.st_size)));
        }
    }

    closedir(dir);
    std::sort(out.begin(), out.end(), entry_name_less);
    return true;
}

FsResult<DirListing> SandboxedFileSystem::list_contents() const {
    // Re-resolve the cursor: it may have been removed or swapped for a link
    std::string cwd = cwd_snapshot();
    FsResult<std::string> resolved = resolve_from(cwd, ".");
    if (!resolved.success()) {
        LOG_WARN("[FileSystem] Current directory no longer resolves inside the sandbox");
        return FsResult<DirListing>::fail(resolved.status, to_sandbox_path(cwd), resolved.error);
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) != 0) {
        if (is_missing_errno(errno)) {
            return FsResult<DirListing>::fail(FsStatus::NOT_FOUND, resolved.path,
                                              "Current directory does not exist");
        }
        return FsResult<DirListing>::fail(FsStatus::IO_FAILURE, resolved.path, errno_text(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return FsResult<DirListing>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                          "Current directory is not a directory");
    }

    DirListing listing;
    std::string error;
    if (!list_directory(resolved.value, listing.entries, error)) {
        LOG_ERROR("[FileSystem] Cannot list %s: %s", resolved.path.c_str(), error.c_str());
        return FsResult<DirListing>::fail(FsStatus::IO_FAILURE, resolved.path, error);
    }

    return FsResult<DirListing>::ok(listing, resolved.path);
}

bool SandboxedFileSystem::ensure_directory(const std::string& real_path, std::string& error) const {
    if (real_path == root_) return true;

    // Only ever create below the root
    std::string rel = (root_ == "/") ? real_path.substr(1) : real_path.substr(root_.size() + 1);
    std::vector<std::string> parts = path_components(rel);

    std::string current = root_;
    for (size_t i = 0; i < parts.size(); ++i) {
        current = join_path(current, parts[i]);
        if (mkdir(current.c_str(), options_.dir_mode) == 0) {
            continue;
        }
        if (errno != EEXIST) {
            error = errno_text(errno);
            return false;
        }
        struct stat st;
        if (stat(current.c_str(), &st) != 0) {
            error = errno_text(errno);
            return false;
        }
        if (!S_ISDIR(st.st_mode)) {
            error = errno_text(ENOTDIR);
            return false;
        }
    }
    return true;
}

FsResult<std::string> SandboxedFileSystem::make_directory(const std::string& path) {
    FsResult<std::string> resolved = resolve(path);
    if (!resolved.success()) {
        return resolved;
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return FsResult<std::string>::ok(resolved.path, resolved.path);
        }
        return FsResult<std::string>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                           "A file already exists at " + resolved.path);
    }

    std::string error;
    if (!ensure_directory(resolved.value, error)) {
        LOG_ERROR("[FileSystem] mkdir %s failed: %s", resolved.path.c_str(), error.c_str());
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, resolved.path,
                                           "Failed to create directory " + resolved.path + ": " + error);
    }

    LOG_DEBUG("[FileSystem] Created directory %s", resolved.path.c_str());
    return FsResult<std::string>::ok(resolved.path, resolved.path);
}

FsResult<size_t> SandboxedFileSystem::write_file(const std::string& path, const std::string& content) {
    FsResult<std::string> resolved = resolve(path);
    if (!resolved.success()) {
        return FsResult<size_t>::from(resolved);
    }

    size_t bad_offset = 0;
    if (!is_valid_utf8(content, &bad_offset)) {
        return FsResult<size_t>::fail(FsStatus::DECODE_FAILURE, resolved.path,
                                      "Content is not valid UTF-8 (byte " +
                                      std::to_string(bad_offset) + ")");
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return FsResult<size_t>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                          "Cannot write to a directory: " + resolved.path);
        }
        if (!S_ISREG(st.st_mode)) {
            return FsResult<size_t>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                          "Not a regular file: " + resolved.path);
        }
    }

    std::string error;
    size_t slash = resolved.value.rfind('/');
    std::string parent = (slash == 0) ? "/" : resolved.value.substr(0, slash);
    if (!ensure_directory(parent, error)) {
        LOG_ERROR("[FileSystem] Cannot create parent of %s: %s", resolved.path.c_str(), error.c_str());
        return FsResult<size_t>::fail(FsStatus::IO_FAILURE, resolved.path,
                                      "Failed to create parent directory: " + error);
    }

    // O_NOFOLLOW: the final component was resolved already.
    // O_NONBLOCK: never wait on a FIFO that appeared after the stat().
    int fd = open(resolved.value.c_str(),
                  O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW | O_NONBLOCK,
                  options_.file_mode);
    if (fd < 0) {
        error = errno_text(errno);
        LOG_ERROR("[FileSystem] Cannot open %s for writing: %s", resolved.path.c_str(), error.c_str());
        return FsResult<size_t>::fail(FsStatus::IO_FAILURE, resolved.path,
                                      "Failed to write file: " + error);
    }
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        close(fd);
        return FsResult<size_t>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                      "Not a regular file: " + resolved.path);
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = errno_text(errno);
            close(fd);
            LOG_ERROR("[FileSystem] Write to %s failed: %s", resolved.path.c_str(), error.c_str());
            return FsResult<size_t>::fail(FsStatus::IO_FAILURE, resolved.path,
                                          "Failed to write file: " + error);
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        error = errno_text(errno);
        return FsResult<size_t>::fail(FsStatus::IO_FAILURE, resolved.path,
                                      "Failed to write file: " + error);
    }

    LOG_DEBUG("[FileSystem] Wrote %zu bytes to %s", written, resolved.path.c_str());
    return FsResult<size_t>::ok(written, resolved.path);
}

FsResult<std::string> SandboxedFileSystem::read_file(const std::string& path) const {
    FsResult<std::string> resolved = resolve(path);
    if (!resolved.success()) {
        return resolved;
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) != 0) {
        if (is_missing_errno(errno)) {
            return FsResult<std::string>::fail(FsStatus::NOT_FOUND, resolved.path,
                                               "File does not exist");
        }
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, resolved.path, errno_text(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        return FsResult<std::string>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                           "Cannot read a directory");
    }
    if (!S_ISREG(st.st_mode)) {
        return FsResult<std::string>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                           "Not a regular file");
    }

    // O_NONBLOCK: a FIFO swapped in after the stat() must not stall open()
    int fd = open(resolved.value.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        if (is_missing_errno(errno)) {
            return FsResult<std::string>::fail(FsStatus::NOT_FOUND, resolved.path,
                                               "File does not exist");
        }
        std::string error = errno_text(errno);
        LOG_ERROR("[FileSystem] Cannot open %s: %s", resolved.path.c_str(), error.c_str());
        return FsResult<std::string>::fail(FsStatus::IO_FAILURE, resolved.path,
                                           "Failed to read file: " + error);
    }
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        close(fd);
        return FsResult<std::string>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                           "Not a regular file");
    }

    std::string content;
    char buffer[8192];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string error = errno_text(errno);
            close(fd);
            LOG_ERROR("[FileSystem] Read of %s failed: %s", resolved.path.c_str(), error.c_str());
            return FsResult<std::string>::fail(FsStatus::IO_FAILURE, resolved.path,
                                               "Failed to read file: " + error);
        }
        content.append(buffer, static_cast<size_t>(n));
    }
    close(fd);

    size_t bad_offset = 0;
    if (!is_valid_utf8(content, &bad_offset)) {
        return FsResult<std::string>::fail(FsStatus::DECODE_FAILURE, resolved.path,
                                           "File is not valid UTF-8 (byte " +
                                           std::to_string(bad_offset) + ")");
    }

    return FsResult<std::string>::ok(content, resolved.path);
}

// ============================================================================
// Directory tree
// ============================================================================

void SandboxedFileSystem::walk_tree(const std::string& real_dir, const std::string& sandbox_dir,
                                    size_t depth, std::set<std::string>& visited,
                                    DirectoryTree& tree) const {
    visited.insert(real_dir);

    std::vector<DirEntry> entries;
    std::string error;
    if (!list_directory(real_dir, entries, error)) {
        LOG_WARN("[FileSystem] Skipping unreadable directory %s: %s",
                 sandbox_dir.c_str(), error.c_str());
        return;
    }

    std::vector<std::string> lines;
    std::vector<std::string> subdirs;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].is_dir()) {
            subdirs.push_back(entries[i].name);
        } else {
            lines.push_back(entries[i].name);
        }
    }
    for (size_t i = 0; i < subdirs.size(); ++i) {
        lines.push_back(subdirs[i] + DIRECTORY_TAG);
    }
    tree[sandbox_dir] = join(lines, "\n");

    for (size_t i = 0; i < subdirs.size(); ++i) {
        std::string child_sandbox = join_path(sandbox_dir, subdirs[i]);
        std::string child_real = join_path(real_dir, subdirs[i]);

        struct stat st;
        if (lstat(child_real.c_str(), &st) == 0 && S_ISLNK(st.st_mode)) {
            std::string target;
            if (!canonicalize(child_real, target, error)) {
                LOG_WARN("[FileSystem] Not following %s: %s", child_sandbox.c_str(), error.c_str());
                continue;
            }
            if (!is_within_root(target)) {
                LOG_WARN("[FileSystem] Not following %s: link leaves the sandbox",
                         child_sandbox.c_str());
                continue;
            }
            child_real = target;
        }

        if (visited.count(child_real)) {
            LOG_DEBUG("[FileSystem] %s already visited, not descending", child_sandbox.c_str());
            continue;
        }
        if (depth + 1 > options_.max_tree_depth) {
            LOG_WARN("[FileSystem] Tree depth limit (%zu) reached at %s",
                     options_.max_tree_depth, child_sandbox.c_str());
            continue;
        }

        walk_tree(child_real, child_sandbox, depth + 1, visited, tree);
    }
}

FsResult<DirectoryTree> SandboxedFileSystem::get_directory_tree(const std::string& path) const {
    FsResult<std::string> resolved = resolve(path);
    if (!resolved.success()) {
        return FsResult<DirectoryTree>::from(resolved);
    }

    struct stat st;
    if (stat(resolved.value.c_str(), &st) != 0) {
        if (is_missing_errno(errno)) {
            return FsResult<DirectoryTree>::fail(FsStatus::NOT_FOUND, resolved.path,
                                                 "Directory does not exist: " + path);
        }
        return FsResult<DirectoryTree>::fail(FsStatus::IO_FAILURE, resolved.path, errno_text(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return FsResult<DirectoryTree>::fail(FsStatus::WRONG_TYPE, resolved.path,
                                             path + " is not a directory");
    }

    // The start directory itself must be listable
    std::vector<DirEntry> listing;
    std::string error;
    if (!list_directory(resolved.value, listing, error)) {
        return FsResult<DirectoryTree>::fail(FsStatus::IO_FAILURE, resolved.path, error);
    }

    DirectoryTree tree;
    std::set<std::string> visited;
    walk_tree(resolved.value, resolved.path, 0, visited, tree);

    LOG_DEBUG("[FileSystem] Tree of %s: %zu directories", resolved.path.c_str(), tree.size());
    return FsResult<DirectoryTree>::ok(tree, resolved.path);
}

} // namespace sandfs
