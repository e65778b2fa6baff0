#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/llfio.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff::detail
{

enum class blob_compression
{
    none,
    gzip,
    zstd,
};

/**
 * @brief Detects the compression of a blob from its first bytes.
 */
auto detect_compression(ro_dynblob head) noexcept -> blob_compression;

/**
 * @brief A plain tar layer rewritten into an uncompressed chunked layer.
 *
 * Every regular file is a single chunk whose data lies in @p file at the
 * offset recorded in the table of contents.
 */
struct converted_layer
{
    llfio::file_handle file;
    toc manifest;
    std::string manifest_json;
    std::string tar_split;
    std::string uncompressed_digest;
    std::int64_t tar_size{0};
};

/**
 * @brief Indexes an uncompressed tar stream already stored in @p tarFile.
 */
auto index_tar_file(llfio::file_handle tarFile) -> result<converted_layer>;

/**
 * @brief Downloads the complete blob into an unnamed temporary file below
 * @p tmpDir, verifies it against @p blobDigest, decompresses it and indexes
 * the tar stream.
 */
auto convert_blob(blob_source &source,
                  std::uint64_t blobSize,
                  std::string_view blobDigest,
                  llfio::path_handle const &tmpDir)
        -> result<converted_layer>;

} // namespace chunkdiff::detail
