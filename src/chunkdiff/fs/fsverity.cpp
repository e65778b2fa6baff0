#include "fsverity.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <iterator>

#include <linux/fsverity.h>
#include <sys/ioctl.h>

#include <fmt/format.h>

namespace chunkdiff::detail
{

constexpr std::uint32_t verity_block_size = 4096U;
constexpr std::size_t max_verity_digest_size = 64U;

auto enable_fs_verity(int fd) -> result<void>
{
    fsverity_enable_arg arg{};
    arg.version = 1U;
    arg.hash_algorithm = FS_VERITY_HASH_ALG_SHA256;
    arg.block_size = verity_block_size;

    if (::ioctl(fd, FS_IOC_ENABLE_VERITY, &arg) != 0 && errno != EEXIST)
    {
        return collect_system_error();
    }
    return oc::success();
}

auto measure_fs_verity(int fd) -> result<std::string>
{
    alignas(fsverity_digest) std::array<std::byte, sizeof(fsverity_digest)
                                                           + max_verity_digest_size>
            buffer{};
    auto *const header = reinterpret_cast<fsverity_digest *>(buffer.data());
    header->digest_size = max_verity_digest_size;

    if (::ioctl(fd, FS_IOC_MEASURE_VERITY, header) != 0)
    {
        return collect_system_error();
    }

    std::string hex;
    hex.reserve(header->digest_size * 2U);
    auto const *const digest = reinterpret_cast<std::uint8_t const *>(
            buffer.data() + sizeof(fsverity_digest));
    for (std::uint16_t i = 0U; i < header->digest_size; ++i)
    {
        fmt::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
    }
    return hex;
}

auto is_fs_verity_unsupported(system_error::error const &error) noexcept
        -> bool
{
    return error == errc::not_supported
           || error == errc::inappropriate_io_control_operation
           || error == errc::operation_not_supported;
}

} // namespace chunkdiff::detail
