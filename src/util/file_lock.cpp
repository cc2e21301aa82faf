#include <cratebox/file_lock.hpp>
#include <cratebox/log.hpp>

#include <cerrno>
#include <cstring>

#ifdef __unix__
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

namespace fs = std::filesystem;

namespace cratebox {

Result<int> FileLock::open_lock_file(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return CrateboxError::at(CrateboxError::Lock,
                "cannot create directory for lock file: " + ec.message(),
                path.string());
        }
    }

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return CrateboxError::at(CrateboxError::Lock,
            std::string("cannot open lock file: ") + strerror(errno),
            path.string());
    }
    return Result<int>::ok(fd);
}

Result<FileLock> FileLock::acquire(const fs::path& path,
                                   const std::string& description) {
    FileLock lock;
    auto got = try_acquire(path, lock);
    if (got.is_err()) return std::move(got).error();

    if (!got.value()) {
        log::warn("blocking on other processes finishing to %s",
                  description.c_str());

        auto fd = open_lock_file(path);
        if (fd.is_err()) return std::move(fd).error();
        lock = FileLock(fd.value(), path);

        while (flock(lock.fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            return CrateboxError::at(CrateboxError::Lock,
                std::string("cannot lock file: ") + strerror(errno),
                path.string());
        }
    }

    log::trace("acquired lock %s", path.c_str());
    return Result<FileLock>::ok(std::move(lock));
}

Result<bool> FileLock::try_acquire(const fs::path& path, FileLock& out) {
    auto fd = open_lock_file(path);
    if (fd.is_err()) return std::move(fd).error();
    FileLock lock(fd.value(), path);

    while (flock(lock.fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) return Result<bool>::ok(false);
        return CrateboxError::at(CrateboxError::Lock,
            std::string("cannot lock file: ") + strerror(errno),
            path.string());
    }

    out = std::move(lock);
    return Result<bool>::ok(true);
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ < 0) return;
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

} // namespace cratebox
