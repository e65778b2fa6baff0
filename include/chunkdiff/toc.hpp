#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/pull_options.hpp>

namespace chunkdiff
{

enum class entry_type
{
    reg,
    chunk,
    hardlink,
    symlink,
    dir,
    char_device,
    block_device,
    fifo,
};

auto to_string(entry_type type) noexcept -> std::string_view;
auto parse_entry_type(std::string_view name) -> result<entry_type>;

enum class chunk_kind
{
    data,
    zeros,
};

/**
 * @brief The encoding of the data stream a chunked source addresses.
 */
enum class compressed_file_type
{
    zstd_chunked,
    estargz,
    none,
    hole,
};

using file_time = std::chrono::sys_time<std::chrono::nanoseconds>;

/**
 * @brief One record of a table of contents.
 *
 * A regular file is described by a reg record which may be followed by
 * chunk records covering the rest of its content.
 */
struct file_entry
{
    entry_type type = entry_type::reg;
    std::string name;
    std::string linkname;
    std::int64_t mode = 0;
    std::int64_t size = 0;
    std::int64_t uid = 0;
    std::int64_t gid = 0;
    std::optional<file_time> modtime;
    std::optional<file_time> accesstime;
    std::optional<file_time> changetime;
    std::int64_t devmajor = 0;
    std::int64_t devminor = 0;
    // xattr name to base64 encoded value
    std::map<std::string, std::string> xattrs;

    std::string digest;
    std::int64_t offset = 0;
    std::int64_t end_offset = 0;

    std::int64_t chunk_size = 0;
    std::int64_t chunk_offset = 0;
    std::string chunk_digest;
    chunk_kind chunk_type = chunk_kind::data;
};

struct toc
{
    int version = 0;
    std::vector<file_entry> entries;
    std::string tar_split_digest;
};

/**
 * @brief A file_entry together with the chunks describing its content.
 *
 * The first chunk is a copy of the reg record itself.
 */
struct file_metadata : file_entry
{
    file_metadata() = default;
    explicit file_metadata(file_entry const &entry)
        : file_entry(entry)
    {
    }

    std::vector<file_entry> chunks;
    bool skip_set_attrs = false;
};

/**
 * @brief Parses a JSON encoded table of contents.
 *
 * Keys are matched case insensitively and unknown keys are ignored. Any
 * non whitespace data after the top level object is rejected.
 */
auto parse_toc(std::string_view manifest) -> result<toc>;

/**
 * @brief Encodes a table of contents in the canonical JSON form.
 */
auto serialize_toc(toc const &value) -> std::string;

/**
 * @brief Collapses chunk records into the preceding regular file and infers
 * omitted end offsets by walking the entries backwards from @p tocOffset.
 */
auto merge_entries(compressed_file_type fileType,
                   std::int64_t tocOffset,
                   std::span<file_entry const> entries)
        -> result<std::vector<file_metadata>>;

/**
 * @brief Returns the content addressed location "xx/<rest of hex>" of a
 * file with the given digest.
 */
auto flat_path_for_digest(std::string_view digest) -> result<std::string>;

/**
 * @brief Keeps only the regular files and renames each to its content
 * addressed location, keeping the first file of each digest.
 *
 * If @p nameMap isn't null it receives the mapping from every cleaned
 * original name to its location.
 */
auto make_entries_flat(std::vector<file_metadata> entries,
                       std::map<std::string, std::string> *nameMap)
        -> result<std::vector<file_metadata>>;

/**
 * @brief Computes the digest identifying files which may share an inode.
 *
 * Covers the content digest, the owner, the mode and all xattrs.
 */
auto hard_link_fingerprint(file_entry const &entry) -> result<std::string>;

/**
 * @brief Formats a timestamp as RFC 3339 with nanoseconds.
 */
auto format_file_time(file_time time) -> std::string;
auto parse_file_time(std::string_view text) -> result<file_time>;

/**
 * @brief Encodes the data stored next to the manifest of a chunked layer,
 * i.e. {"format":"dir"}.
 */
auto serialize_layer_data(output_format format) -> std::string;
auto parse_layer_data(std::string_view json) -> result<output_format>;

} // namespace chunkdiff
