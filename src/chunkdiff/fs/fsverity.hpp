#pragma once

#include <string>

#include <chunkdiff/disappointment.hpp>

namespace chunkdiff::detail
{

/**
 * @brief Enables fs-verity with sha256 and 4096 byte blocks on a read only
 * descriptor, a file which already has it enabled is accepted.
 */
auto enable_fs_verity(int fd) -> result<void>;

/**
 * @brief Returns the hex encoded fs-verity measurement of the file.
 */
auto measure_fs_verity(int fd) -> result<std::string>;

/**
 * @brief Whether the error indicates a file system without fs-verity
 * support.
 */
auto is_fs_verity_unsupported(system_error::error const &error) noexcept
        -> bool;

} // namespace chunkdiff::detail
