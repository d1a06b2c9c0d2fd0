/**
 * @file private_file.cpp
 * @brief Owner-only file writes for the token cache and exports
 */

#include "../include/vaulthunter.h"
#include "log.h"

#include <cerrno>
#include <cstring>

#if !defined(_WIN32)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#else
#include <fstream>
#endif

namespace vaulthunter {

#if !defined(_WIN32)
namespace {

/// Closes the descriptor on scope exit
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

} // namespace

void write_private_file(const std::string& path, const std::string& content) {
    const mode_t owner_only = S_IRUSR | S_IWUSR;

    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, owner_only));
    if (fd.get() < 0) {
        throw LocalError("Failed to open " + path + " for writing: " + std::strerror(errno));
    }
    // The mode argument of open() only applies to new files
    if (::fchmod(fd.get(), owner_only) != 0) {
        LOG_WARN("FILE", "Could not restrict permissions of " + path + ": " + std::strerror(errno));
    }

    const char* ptr = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t w = ::write(fd.get(), ptr, remaining);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) {
            throw LocalError("Failed to write " + path + ": " + std::strerror(errno));
        }
        ptr += w;
        remaining -= static_cast<size_t>(w);
    }

    if (::close(fd.release()) != 0) {
        throw LocalError("Failed to write " + path + ": " + std::strerror(errno));
    }
}
#else
void write_private_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw LocalError("Failed to open " + path + " for writing");
    }
    out << content;
    if (!out) {
        throw LocalError("Failed to write " + path);
    }
}
#endif

} // namespace vaulthunter
