#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <future>
#include <string>
#include <utility>

namespace cratebox {

// Exclusive advisory lock (flock) held on a lock file for the lifetime of
// the object. The file is created on first use and never deleted; its
// content is irrelevant. Locks taken through separate FileLock objects
// exclude each other across processes and across threads of one process.
class FileLock {
public:
    // Open (creating parent directories and the file if needed) and lock
    // `path`. Blocks without timeout while another holder exists; the first
    // contention logs a single warning naming `description`.
    static Result<FileLock> acquire(const std::filesystem::path& path,
                                    const std::string& description);

    // Non-blocking variant: ok(true) when acquired into `out`,
    // ok(false) when somebody else holds the lock.
    static Result<bool> try_acquire(const std::filesystem::path& path,
                                    FileLock& out);

    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // Unlock and close now instead of at destruction
    void release() noexcept;

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

private:
    FileLock(int fd, std::filesystem::path path)
        : fd_(fd), path_(std::move(path)) {}

    static Result<int> open_lock_file(const std::filesystem::path& path);

    int fd_ = -1;
    std::filesystem::path path_;
};

// Run `protected_op` (returning some Result<T>) while holding the lock on
// `path`. The lock is released on every exit: normal return, error return,
// or an exception escaping `protected_op`, which then propagates unchanged.
template<typename F>
auto with_file_lock(const std::filesystem::path& path,
                    const std::string& description,
                    F&& protected_op) -> decltype(protected_op()) {
    auto lock = FileLock::acquire(path, description);
    if (lock.is_err()) return std::move(lock).error();
    FileLock held = std::move(lock).value();
    return protected_op();
}

// Same as with_file_lock, but the blocking open/lock/run/unlock sequence
// happens on a dedicated thread so the caller's thread is never parked on
// the lock. Exceptions surface from future::get().
template<typename F>
auto with_file_lock_async(std::filesystem::path path,
                          std::string description,
                          F protected_op) -> std::future<decltype(protected_op())> {
    return std::async(std::launch::async,
        [path = std::move(path), description = std::move(description),
         op = std::move(protected_op)]() mutable {
            return with_file_lock(path, description, op);
        });
}

} // namespace cratebox
