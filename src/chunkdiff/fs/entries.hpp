#pragma once

#include <cstdint>
#include <string_view>

#include <sys/types.h>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/toc.hpp>

#include "file_attrs.hpp"
#include "unique_fd.hpp"

namespace chunkdiff::detail
{

/**
 * @brief The context shared by all entry creation functions.
 */
struct entry_context
{
    int root_fd;
    tar_options const &options;
    xattr_ignore_set const &xattrs_to_ignore;
};

/**
 * @brief Creates the directory described by @p metadata, an existing
 * directory is reused, and applies its attributes.
 */
auto safe_mkdir(entry_context const &ctx,
                mode_t mode,
                file_metadata const &metadata) -> result<void>;

/**
 * @brief Hard links the entry to its already extracted link target.
 */
auto safe_link(entry_context const &ctx,
               mode_t mode,
               file_metadata const &metadata) -> result<void>;

auto safe_symlink(entry_context const &ctx, file_metadata const &metadata)
        -> result<void>;

/**
 * @brief Creates a character device, block device or fifo.
 */
auto safe_mknod(entry_context const &ctx,
                mode_t mode,
                file_metadata const &metadata) -> result<void>;

/**
 * @brief Creates an empty regular file and applies its attributes.
 */
auto create_empty_file(entry_context const &ctx,
                       mode_t mode,
                       file_metadata const &metadata) -> result<void>;

/**
 * @brief Links the open file @p srcFd to @p destFile below @p rootFd,
 * replacing an existing entry.
 */
auto do_hard_link(int rootFd, int srcFd, std::string_view destFile)
        -> result<void>;

/**
 * @brief Places the content of @p srcFd at the location of @p metadata.
 *
 * With @p useHardLinks a hard link is tried first, on success the returned
 * descriptor is invalid and the attributes of the existing inode are kept.
 * Otherwise the content is copied into a new file which is returned for
 * finalization.
 */
auto copy_file_content(int rootFd,
                       int srcFd,
                       file_metadata &metadata,
                       mode_t mode,
                       bool useHardLinks) -> result<unique_fd>;

} // namespace chunkdiff::detail
