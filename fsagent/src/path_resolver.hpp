#pragma once

#include <filesystem>
#include <string>

namespace fsagent {

/**
 * Turns peer-supplied path strings into absolute, symlink-resolved paths.
 *
 * Home and working directory are fixed at construction. This is the only
 * validation applied to paths: there is no allow-list or jail.
 */
class PathResolver {
public:
    PathResolver(std::filesystem::path home, std::filesystem::path cwd);

    /// Throws ValidationError for empty input and filesystem_error when a
    /// component of the existing prefix cannot be inspected. A non-existent
    /// tail is allowed and normalized lexically.
    std::filesystem::path resolve(const std::string& raw) const;

    const std::filesystem::path& home() const { return home_; }
    const std::filesystem::path& cwd() const { return cwd_; }

private:
    std::filesystem::path expand_user(const std::string& raw) const;

    std::filesystem::path home_;
    std::filesystem::path cwd_;
};

} // namespace fsagent
