#pragma once

#include <cstdint>
#include <filesystem>

namespace fsagent {

/// Destination for mv and cp: `to/<name of from>` when `to` is an existing
/// directory, otherwise `to` itself.
std::filesystem::path target_in_directory(const std::filesystem::path& from, const std::filesystem::path& to);

/// Moves `from` to `to` where rename(2) cannot (EXDEV): recursive copy that
/// keeps symlinks as links, then removal of the source. Throws
/// filesystem_error; the source is only removed after the copy succeeded.
void move_across_devices(const std::filesystem::path& from, const std::filesystem::path& to);

/// Copies a regular file over `to` and gives the copy the permission bits and
/// timestamps of `from`. Returns the size of the copy.
std::uintmax_t copy_file_with_attributes(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace fsagent
