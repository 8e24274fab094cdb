#pragma once

#include "posix_file.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace fsagent {

/**
 * Replaces a file atomically through a temporary sibling.
 *
 * Content goes to `.<name>.fsagent-tmp` in the destination's directory.
 * commit() flushes it to disk, copies the destination's permission bits if
 * the destination existed when the AtomicFile was created, and renames the
 * temporary over the destination. Until commit() succeeds the destination is
 * untouched; a destroyed, uncommitted AtomicFile removes its temporary.
 *
 * The temporary name is fixed per destination, so a temporary left behind
 * by a crash is truncated and consumed by the next write to the same file.
 */
class AtomicFile {
public:
    explicit AtomicFile(std::filesystem::path destination);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    void write(const char* data, std::size_t size);
    void write(const std::string& bytes) { write(bytes.data(), bytes.size()); }

    void commit();

    std::size_t bytes_written() const { return bytes_written_; }
    const std::filesystem::path& temp_path() const { return temp_path_; }

    static std::filesystem::path temp_path_for(const std::filesystem::path& destination);

private:
    std::filesystem::path destination_;
    std::filesystem::path temp_path_;
    std::optional<mode_t> preserved_mode_;
    FileDescriptor fd_;
    std::size_t bytes_written_ = 0;
    bool committed_ = false;
};

/// Writes `bytes` to `destination` with AtomicFile. Returns the byte count.
std::size_t write_file_atomically(const std::filesystem::path& destination, const std::string& bytes);

} // namespace fsagent
