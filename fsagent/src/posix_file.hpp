#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>

namespace fsagent {

/// Owns a POSIX file descriptor and closes it on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

    /// Closes now and reports a failed close, which can carry a deferred
    /// write error.
    void close();

private:
    int fd_ = -1;
};

[[noreturn]] void throw_errno(const std::string& what, const std::filesystem::path& path);
[[noreturn]] void throw_errno(const std::string& what);

FileDescriptor open_file(const std::filesystem::path& path, int flags, mode_t mode = 0666);

/// read(2) retried on EINTR. Returns 0 at end of file.
std::size_t read_some(int fd, char* buffer, std::size_t size);
std::size_t pread_some(int fd, char* buffer, std::size_t size, off_t offset);
void write_all(int fd, const char* data, std::size_t size);
void sync_file(int fd, const std::filesystem::path& path);

struct stat stat_path(const std::filesystem::path& path, bool follow_links);

} // namespace fsagent
