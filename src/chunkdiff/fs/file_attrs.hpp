#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <time.h>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff::detail
{

using xattr_ignore_set = std::set<std::string, std::less<>>;

/**
 * @brief Converts an optional timestamp for utimensat(), UTIME_OMIT if it is
 * absent.
 */
auto to_timespec(std::optional<file_time> const &time) noexcept -> timespec;

/**
 * @brief Applies the owner, the xattrs, the timestamps and the mode of
 * @p metadata to an open file.
 *
 * With @p usePath (always for symlinks) the attributes are applied through
 * the path of the entry below @p dirFd without following it. Unsupported
 * xattrs and timestamps are ignored.
 */
auto set_file_attrs(int dirFd,
                    int fd,
                    mode_t mode,
                    file_metadata const &metadata,
                    tar_options const &options,
                    xattr_ignore_set const &xattrsToIgnore,
                    bool usePath) -> result<void>;

/**
 * @brief Rewrites the owners of all entries according to the chown override
 * or the host to container id maps.
 */
auto remap_ids(std::span<file_metadata> entries, tar_options const &options)
        -> result<void>;

/**
 * @brief Collects the distinct uids and gids, each sorted.
 */
auto collect_ids(std::span<file_metadata const> entries)
        -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>>;

/**
 * @brief Checks whether an existing file may be hard linked into place of
 * @p file, i.e. owner, permission bits and xattrs are equal.
 */
auto can_dedup_with_hard_link(file_metadata const &file,
                              int fd,
                              xattr_ignore_set const &xattrsToIgnore)
        -> bool;

} // namespace chunkdiff::detail
