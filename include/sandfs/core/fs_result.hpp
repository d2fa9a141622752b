/*
 * sandfs C++ - File System Results
 *
 * Every SandboxedFileSystem operation returns an FsResult<T>. Expected
 * conditions (containment denial, missing targets, wrong entry type, I/O and
 * decode errors) are result variants, never exceptions.
 */
#ifndef sandfs_CORE_FS_RESULT_HPP
#define sandfs_CORE_FS_RESULT_HPP

#include <string>

namespace sandfs {

enum class FsStatus {
    OK = 0,
    DENIED,          // resolved path would escape the root
    NOT_FOUND,       // target does not exist
    WRONG_TYPE,      // file where a directory was expected, or vice versa
    IO_FAILURE,      // underlying system call failed (carries strerror text)
    DECODE_FAILURE   // content is not valid UTF-8
};

// Stable lower-case name ("ok", "denied", "not_found", ...)
const char* fs_status_name(FsStatus status);

template<typename T>
struct FsResult {
    FsStatus status;
    T value;                // Meaningful only when status == OK
    std::string path;       // Sandbox-relative path, or the caller's input if denied
    std::string error;      // Human readable reason when status != OK
    
    FsResult() : status(FsStatus::IO_FAILURE), value() {}
    
    bool success() const { return status == FsStatus::OK; }
    
    // DECODE_FAILURE is a refinement of an I/O failure
    bool is_io_failure() const {
        return status == FsStatus::IO_FAILURE || status == FsStatus::DECODE_FAILURE;
    }
    
    static FsResult ok(const T& value, const std::string& path) {
        FsResult r;
        r.status = FsStatus::OK;
        r.value = value;
        r.path = path;
        return r;
    }
    
    static FsResult fail(FsStatus status, const std::string& path, const std::string& error) {
        FsResult r;
        r.status = status;
        r.path = path;
        r.error = error;
        return r;
    }
    
    // Re-tag a failure of another result type
    template<typename U>
    static FsResult from(const FsResult<U>& other) {
        return fail(other.status, other.path, other.error);
    }
};

} // namespace sandfs

#endif // sandfs_CORE_FS_RESULT_HPP
