#include "posix_file.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace fsagent {

FileDescriptor::~FileDescriptor() {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int FileDescriptor::release() {
    return std::exchange(fd_, -1);
}

void FileDescriptor::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

void FileDescriptor::close() {
    int fd = release();
    if (fd >= 0 && ::close(fd) != 0 && errno != EINTR) {
        throw_errno("close");
    }
}

void throw_errno(const std::string& what, const std::filesystem::path& path) {
    throw std::filesystem::filesystem_error(what, path, std::error_code(errno, std::generic_category()));
}

void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

FileDescriptor open_file(const std::filesystem::path& path, int flags, mode_t mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw_errno("open", path);
    }
    return FileDescriptor(fd);
}

std::size_t read_some(int fd, char* buffer, std::size_t size) {
    while (true) {
        ssize_t n = ::read(fd, buffer, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            throw_errno("read");
        }
    }
}

std::size_t pread_some(int fd, char* buffer, std::size_t size, off_t offset) {
    while (true) {
        ssize_t n = ::pread(fd, buffer, size, offset);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            throw_errno("pread");
        }
    }
}

void write_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("write");
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
}

void sync_file(int fd, const std::filesystem::path& path) {
    if (::fsync(fd) != 0) {
        throw_errno("fsync", path);
    }
}

struct stat stat_path(const std::filesystem::path& path, bool follow_links) {
    struct stat st {};
    int rc = follow_links ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        throw_errno(follow_links ? "stat" : "lstat", path);
    }
    return st;
}

} // namespace fsagent
