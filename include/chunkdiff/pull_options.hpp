#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkdiff
{

/**
 * @brief The layout of a reconstructed layer.
 */
enum class output_format
{
    //! the regular directory tree
    dir,
    //! regular files stored once per digest at "xx/<rest of hex>"
    flat,
};

auto to_string(output_format format) noexcept -> std::string_view;

enum class fs_verity_mode
{
    disabled,
    if_possible,
    required,
};

/**
 * @brief Options which the layer store carries for partial pulls.
 */
struct pull_options
{
    bool enable_partial_images = false;
    bool convert_images = false;
    bool use_hard_links = false;
    bool insecure_allow_unpredictable_image_contents = false;
    std::vector<std::string> ostree_repos;

    /**
     * @brief Interprets the string map of the store configuration.
     *
     * Boolean options are enabled by a case insensitive "true", ostree_repos
     * is a colon separated list.
     */
    static auto parse(std::map<std::string, std::string, std::less<>> const
                              &values) -> pull_options;
};

/**
 * @brief Tunables of the reconstruction engine.
 */
struct differ_tuning
{
    //! number of workers deduplicating files against local content
    std::size_t copy_workers = 32;
    //! the number of ranges a single request is merged down to
    std::size_t max_missing_chunks = 1024;
    //! gaps of at most this many bytes are always merged
    std::uint64_t auto_merge_threshold = 1024;
    std::set<std::string, std::less<>> xattrs_to_ignore{"security.selinux"};
};

struct id_map_entry
{
    std::uint32_t container_id;
    std::uint32_t host_id;
    std::uint32_t size;
};

/**
 * @brief Ownership handling for the reconstructed tree.
 */
struct tar_options
{
    std::vector<id_map_entry> uid_maps;
    std::vector<id_map_entry> gid_maps;
    std::optional<std::pair<std::uint32_t, std::uint32_t>> chown_override;
    bool ignore_chown_errors = false;
};

struct differ_options
{
    fs_verity_mode fs_verity = fs_verity_mode::disabled;
    output_format format = output_format::dir;
};

} // namespace chunkdiff
