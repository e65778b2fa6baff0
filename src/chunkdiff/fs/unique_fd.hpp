#pragma once

#include <utility>

#include <unistd.h>

namespace chunkdiff::detail
{

/**
 * @brief Owns a POSIX file descriptor.
 */
class unique_fd
{
public:
    unique_fd() noexcept = default;
    explicit unique_fd(int fd) noexcept
        : mFd(fd)
    {
    }
    ~unique_fd()
    {
        reset();
    }

    unique_fd(unique_fd &&other) noexcept
        : mFd(std::exchange(other.mFd, -1))
    {
    }
    auto operator=(unique_fd &&other) noexcept -> unique_fd &
    {
        reset(std::exchange(other.mFd, -1));
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int
    {
        return mFd;
    }
    [[nodiscard]] auto is_valid() const noexcept -> bool
    {
        return mFd >= 0;
    }
    explicit operator bool() const noexcept
    {
        return is_valid();
    }

    auto release() noexcept -> int
    {
        return std::exchange(mFd, -1);
    }

    void reset(int fd = -1) noexcept
    {
        if (mFd >= 0)
        {
            // the descriptor is released even if close() fails
            (void)::close(mFd);
        }
        mFd = fd;
    }

private:
    int mFd{-1};
};

} // namespace chunkdiff::detail
