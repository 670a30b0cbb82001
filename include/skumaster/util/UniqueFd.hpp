#pragma once
/// @file UniqueFd.hpp
/// @brief Owning wrapper around a POSIX file descriptor

#include <unistd.h>

namespace SkuMaster {
namespace detail {

/// @brief Owns one file descriptor and closes it on destruction
/// @details Move-only. An empty wrapper holds -1.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    /// @return The raw descriptor, or -1 when empty
    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// @brief Close the current descriptor (if any) and adopt @p fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0 && fd_ != fd)
            ::close(fd_);
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace SkuMaster
