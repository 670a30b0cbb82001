#pragma once
/// @file FileLockGuard.hpp
/// @brief Whole-file fcntl advisory lock held for the lifetime of a scope

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace SkuMaster {
namespace detail {

/// @brief Scoped whole-file record lock (F_SETLKW, blocking)
/// @details Readers take Shared, writers take Exclusive. The lock is released when
///          the guard goes out of scope. Not copyable or movable.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK
        Exclusive ///< F_WRLCK
    };

    /// @brief Acquire a lock on @p fd
    /// @param ec Set from errno when the lock cannot be taken; locked() is then false
    FileLockGuard(int fd, Mode mode, std::error_code& ec) {
        ec.clear();
        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return;
        }

        struct flock fl{};
        fl.l_type = (mode == Mode::Shared) ? F_RDLCK : F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;

        int rc;
        do {
            rc = ::fcntl(fd, F_SETLKW, &fl);
        } while (rc < 0 && errno == EINTR);

        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return;
        }
        fd_ = fd;
    }

    ~FileLockGuard() {
        if (fd_ < 0)
            return;
        struct flock fl{};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        // 해제 실패는 fd close 시점에 커널이 정리하므로 결과를 확인하지 않는다.
        (void)::fcntl(fd_, F_SETLK, &fl);
    }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    bool locked() const noexcept { return fd_ >= 0; }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace SkuMaster
