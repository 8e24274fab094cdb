#include "file_transfer.hpp"

#include "logger.hpp"
#include "posix_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <log4cplus/loggingmacros.h>

namespace fsagent {

std::filesystem::path target_in_directory(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    if (std::filesystem::is_directory(to, ec)) {
        return to / from.filename();
    }
    return to;
}

void move_across_devices(const std::filesystem::path& from, const std::filesystem::path& to) {
    LOG4CPLUS_DEBUG(fs_logger(), "mv across devices " << from.string() << " -> " << to.string());
    std::filesystem::copy(from, to,
                          std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks |
                              std::filesystem::copy_options::overwrite_existing);
    std::filesystem::remove_all(from);
}

std::uintmax_t copy_file_with_attributes(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);

    struct stat st = stat_path(from, true);
    if (::chmod(to.c_str(), st.st_mode & 07777) != 0) {
        throw_errno("chmod", to);
    }
    struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, to.c_str(), times, 0) != 0) {
        throw_errno("utimensat", to);
    }
    return std::filesystem::file_size(to);
}

} // namespace fsagent
