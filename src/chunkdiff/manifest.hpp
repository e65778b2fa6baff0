#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/toc.hpp>

#include "tar/tar_split.hpp"

namespace chunkdiff::detail
{

using annotation_map = std::map<std::string, std::string, std::less<>>;

inline constexpr std::string_view zstd_chunked_manifest_checksum_key
        = "io.github.containers.zstd-chunked.manifest-checksum";
inline constexpr std::string_view zstd_chunked_manifest_position_key
        = "io.github.containers.zstd-chunked.manifest-position";
inline constexpr std::string_view zstd_chunked_tar_split_position_key
        = "io.github.containers.zstd-chunked.tarsplit-position";
inline constexpr std::string_view estargz_toc_digest_key
        = "containerd.io/snapshot/stargz/toc.digest";

//! the largest table of contents which is processed in memory
inline constexpr std::uint64_t max_toc_size = std::uint64_t{150} << 20;

/**
 * @brief The validated table of contents of a chunked layer.
 */
struct chunked_manifest
{
    //! the uncompressed JSON document
    std::string json;
    toc parsed;
    //! the decoded tar-split, authenticated by the table of contents
    std::optional<std::string> tar_split;
    std::vector<tar_split_entry> tar_split_entries;
    //! the offset of the table of contents in the blob
    std::uint64_t toc_offset{0};
};

/**
 * @brief Position annotation "offset:length:uncompressedLength[:type]".
 */
struct blob_position
{
    blob_range range{0U, 0U};
    std::uint64_t uncompressed_length{0U};
    std::uint64_t type{0U};
};

auto parse_blob_position(std::string_view annotation, bool withType)
        -> result<blob_position>;

/**
 * @brief Fetches, validates and decodes the table of contents and the
 * tar-split of a zstd:chunked layer.
 *
 * Fetch failures due to a rejected request are reported as
 * chunked_errc::fallback_can_convert, oversized manifests as
 * chunked_errc::fallback_recommended.
 */
auto read_zstd_chunked_manifest(blob_source &source,
                                std::string_view tocDigest,
                                annotation_map const &annotations)
        -> result<chunked_manifest>;

/**
 * @brief Fetches and validates the table of contents of an estargz layer
 * located through the footer of the blob.
 */
auto read_estargz_manifest(blob_source &source,
                           std::uint64_t blobSize,
                           std::string_view tocDigest)
        -> result<chunked_manifest>;

} // namespace chunkdiff::detail
