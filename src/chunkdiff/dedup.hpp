#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <sys/types.h>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/layers_cache.hpp>
#include <chunkdiff/toc.hpp>

#include "destination_file.hpp"
#include "fs/entries.hpp"
#include "fs/unique_fd.hpp"

namespace chunkdiff::detail
{

/**
 * @brief Where and how a file may be deduplicated against local content.
 */
struct dedup_options
{
    bool use_hard_links = false;
    std::span<std::string const> ostree_repos;
};

/**
 * @brief Places a file found by the layers cache at the location of
 * @p file.
 *
 * @return an empty optional if no other layer has the file, otherwise the
 *         descriptor of the copy which is invalid if the file has been hard
 *         linked
 */
auto find_file_in_other_layers(layers_cache &cache,
                               file_metadata &file,
                               int rootFd,
                               bool useHardLinks)
        -> result<std::optional<unique_fd>>;

/**
 * @brief Looks for the content of @p file among the payload links of the
 * given OSTree repositories.
 *
 * Files which can't be hard linked due to differing metadata are copied
 * instead. Failures to access a repository count as a miss.
 */
auto find_file_in_ostree_repos(file_metadata &file,
                               std::span<std::string const> ostreeRepos,
                               int rootFd,
                               bool useHardLinks,
                               xattr_ignore_set const &xattrsToIgnore)
        -> result<std::optional<unique_fd>>;

/**
 * @brief Tries every local source for the content of @p file and finalizes
 * the placed file.
 *
 * @return whether the file has been placed
 */
auto find_and_copy_file(entry_context const &ctx,
                        layers_cache &cache,
                        file_metadata &file,
                        dedup_options const &options,
                        mode_t mode,
                        fs_verity_recorder &recorder) -> result<bool>;

/**
 * @brief Checks whether @p length bytes at @p offset of the file
 * @p root / @p path hash to the chunk digest of @p chunk.
 */
auto validate_chunk_checksum(file_entry const &chunk,
                             std::string const &root,
                             std::string const &path,
                             std::uint64_t offset) -> bool;

/**
 * @brief The outcome of deduplicating one file.
 */
struct dedup_job_result
{
    std::size_t index{0U};
    result<bool> found{false};
};

/**
 * @brief Runs find_and_copy_file() for the entries with the given indices on
 * a bounded pool of workers.
 *
 * The results are in the order of @p indices. Fails with
 * errc::resource_unavailable_try_again if the workers can't be started.
 */
auto dedup_files(entry_context const &ctx,
                 layers_cache &cache,
                 std::span<file_metadata> entries,
                 std::span<std::size_t const> indices,
                 dedup_options const &options,
                 std::size_t numWorkers,
                 fs_verity_recorder &recorder)
        -> result<std::vector<dedup_job_result>>;

} // namespace chunkdiff::detail
