#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <sys/types.h>

#include <chunkdiff/disappointment.hpp>

#include "unique_fd.hpp"

namespace chunkdiff::detail
{

//! O_CREAT | O_TRUNC | O_EXCL | O_WRONLY | O_CLOEXEC
extern int const new_file_flags;

/**
 * @brief Splits a path into its cleaned parent directory and base name.
 *
 * The parent of a top level entry is "/", the base name never contains a
 * slash and is never "..".
 */
auto split_path(std::string_view path)
        -> result<std::pair<std::string, std::string>>;

/**
 * @brief Resolves @p unsafePath below the directory @p rootFd in userspace.
 *
 * Symlinks are followed with absolute targets and ".." components clamped
 * to the root. The returned path is relative to the root.
 */
auto secure_join(int rootFd, std::string_view unsafePath) -> result<std::string>;

/**
 * @brief Opens a file without ever leaving the directory @p dirFd.
 *
 * Uses openat2(RESOLVE_IN_ROOT) and falls back to secure_join() on kernels
 * without openat2. With O_CREAT missing parent directories are created.
 */
auto open_file_under_root(int dirFd,
                          std::string_view name,
                          int flags,
                          mode_t mode) -> result<unique_fd>;

/**
 * @brief Opens a directory below @p dirFd and creates it and its missing
 * parents if necessary.
 */
auto open_or_create_dir_under_root(int dirFd,
                                   std::string_view name,
                                   mode_t mode) -> result<unique_fd>;

/**
 * @brief Extends the file behind @p fd by @p size zero bytes at the current
 * position without writing them.
 */
auto append_hole(int fd, std::uint64_t size) -> result<void>;

/**
 * @brief Returns the /proc path referring to an open descriptor.
 */
auto proc_path_for_fd(int fd) -> std::string;

/**
 * @brief Opens the file behind @p fd a second time for reading.
 */
auto reopen_read_only(int fd) -> result<unique_fd>;

} // namespace chunkdiff::detail
