#include "atomic_file.hpp"

#include "logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <log4cplus/loggingmacros.h>

namespace fsagent {

AtomicFile::AtomicFile(std::filesystem::path destination)
    : destination_(std::move(destination)), temp_path_(temp_path_for(destination_)) {
    struct stat st {};
    if (::stat(destination_.c_str(), &st) == 0) {
        preserved_mode_ = st.st_mode & 07777;
    } else if (errno != ENOENT) {
        throw_errno("stat", destination_);
    }

    fd_ = open_file(temp_path_, O_WRONLY | O_CREAT | O_TRUNC);
}

AtomicFile::~AtomicFile() {
    fd_.reset();
    if (committed_) {
        return;
    }
    if (::unlink(temp_path_.c_str()) != 0 && errno != ENOENT) {
        LOG4CPLUS_WARN(fs_logger(), "Failed to remove temporary " << temp_path_.string() << ": "
                                                                  << std::strerror(errno));
    }
}

void AtomicFile::write(const char* data, std::size_t size) {
    write_all(fd_.get(), data, size);
    bytes_written_ += size;
}

void AtomicFile::commit() {
    sync_file(fd_.get(), temp_path_);
    if (preserved_mode_ && ::fchmod(fd_.get(), *preserved_mode_) != 0) {
        throw_errno("chmod", temp_path_);
    }
    fd_.close();

    if (::rename(temp_path_.c_str(), destination_.c_str()) != 0) {
        throw_errno("rename", destination_);
    }
    committed_ = true;
}

std::filesystem::path AtomicFile::temp_path_for(const std::filesystem::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".fsagent-tmp");
}

std::size_t write_file_atomically(const std::filesystem::path& destination, const std::string& bytes) {
    AtomicFile file(destination);
    file.write(bytes);
    file.commit();
    return file.bytes_written();
}

} // namespace fsagent
