#include "path_resolver.hpp"

#include "agent_error.hpp"

#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace fsagent {

namespace {

// Home directory of a named user, or empty when the user is unknown.
std::filesystem::path lookup_user_home(const std::string& user) {
    long size_hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size_hint > 0 ? static_cast<std::size_t>(size_hint) : 16384);
    passwd pwd{};
    passwd* result = nullptr;
    if (::getpwnam_r(user.c_str(), &pwd, buffer.data(), buffer.size(), &result) != 0 || !result ||
        !result->pw_dir) {
        return {};
    }
    return result->pw_dir;
}

} // namespace

PathResolver::PathResolver(std::filesystem::path home, std::filesystem::path cwd)
    : home_(std::move(home)), cwd_(std::move(cwd)) {}

std::filesystem::path PathResolver::resolve(const std::string& raw) const {
    if (raw.empty()) {
        throw ValidationError("empty path");
    }

    std::filesystem::path path = expand_user(raw);
    if (!path.is_absolute()) {
        path = cwd_ / path;
    }

    std::filesystem::path resolved = std::filesystem::weakly_canonical(path);
    // "dir/" on a missing tail keeps an empty last element.
    if (!resolved.has_filename() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

std::filesystem::path PathResolver::expand_user(const std::string& raw) const {
    if (raw[0] != '~') {
        return raw;
    }

    std::string::size_type slash = raw.find('/');
    std::string user = raw.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    std::string rest = slash == std::string::npos ? std::string() : raw.substr(slash + 1);

    std::filesystem::path base = user.empty() ? home_ : lookup_user_home(user);
    if (base.empty()) {
        // Unknown user: leave the path as typed.
        return raw;
    }
    return rest.empty() ? base : base / rest;
}

} // namespace fsagent
