#include "persistence/workload_lock.hpp"
#include "common/errors.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace cvault::persistence {

WorkloadLock::WorkloadLock(std::filesystem::path path)
    : path_{std::move(path)} {}

WorkloadLock::~WorkloadLock() {
    unlock();
}

std::error_code WorkloadLock::try_lock() {
    if (fd_ != -1) {
        return {};
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {errno, std::system_category()};
    }

    // flock() locks belong to the open file description, so a second
    // WorkloadLock in the same process is refused just like another process.
    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return make_error_code(Errc::busy);
        }
        return {err, std::system_category()};
    }

    fd_ = fd;
    return {};
}

void WorkloadLock::unlock() {
    if (fd_ != -1) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace cvault::persistence
