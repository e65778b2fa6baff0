#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/layers_cache.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff
{

using annotation_map = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Everything a successful reconstruction produced.
 */
struct differ_output
{
    std::string toc_digest;
    //! only known if the whole blob has been downloaded
    std::string compressed_digest;
    //! the digest of the equivalent uncompressed tar stream, empty if the
    //! insecure option allowed skipping its computation
    std::string uncompressed_digest;
    //! the size of the uncompressed tar stream or -1 if unknown
    std::int64_t size{-1};

    std::vector<std::uint32_t> uids;
    std::vector<std::uint32_t> gids;
    std::optional<std::uint32_t> root_dir_mode;

    //! manifest and layer data to be stored with the layer
    std::map<std::string, std::vector<std::byte>, std::less<>> big_data;
    std::optional<std::string> tar_split;
    //! file name to fs-verity measurement
    std::map<std::string, std::string> fs_verity_digests;
    toc manifest;
};

/**
 * @brief A chunked layer whose table of contents is known.
 */
struct chunked_layer
{
    compressed_file_type file_type{compressed_file_type::zstd_chunked};
    std::string toc_digest;
    //! the JSON encoded table of contents
    std::string manifest;
    toc parsed;
    //! the offset of the table of contents, the end of the last chunk
    std::uint64_t toc_offset{0U};
    std::optional<std::string> tar_split;
    std::int64_t tar_size{-1};
};

/**
 * @brief Reconstructs a layer in a directory reusing local content and
 * fetching only the missing ranges of the blob.
 *
 * A differ can be applied exactly once.
 */
class chunked_differ
{
public:
    chunked_differ(std::shared_ptr<layers_cache> cache,
                   std::shared_ptr<blob_source> source,
                   chunked_layer layer,
                   pull_options options,
                   differ_tuning tuning = {});

    /**
     * @brief Creates a differ which downloads the whole blob and converts it
     * from a plain (compressed) tar stream.
     */
    static auto converting(std::shared_ptr<layers_cache> cache,
                           std::shared_ptr<blob_source> source,
                           std::string_view blobDigest,
                           std::uint64_t blobSize,
                           pull_options options,
                           differ_tuning tuning = {})
            -> std::unique_ptr<chunked_differ>;

    chunked_differ(chunked_differ const &) = delete;
    auto operator=(chunked_differ const &) -> chunked_differ & = delete;

    /**
     * @brief Populates @p target which must be an existing, empty directory.
     *
     * Fails with chunked_errc::differ_already_used on the second call.
     */
    auto apply_diff(std::filesystem::path const &target,
                    tar_options const &options,
                    differ_options const &differOptions)
            -> result<differ_output>;

    [[nodiscard]] auto converts() const noexcept -> bool
    {
        return mConvert;
    }
    [[nodiscard]] auto file_type() const noexcept -> compressed_file_type
    {
        return mLayer.file_type;
    }

private:
    chunked_differ(std::shared_ptr<layers_cache> cache,
                   std::shared_ptr<blob_source> source,
                   std::string_view blobDigest,
                   std::uint64_t blobSize,
                   pull_options options,
                   differ_tuning tuning);

    auto convert(std::filesystem::path const &target, differ_output &output)
            -> result<void>;
    auto reconstruct(std::filesystem::path const &target,
                     tar_options const &options,
                     differ_options const &differOptions,
                     differ_output &output) -> result<void>;

    std::shared_ptr<layers_cache> mCache;
    std::shared_ptr<blob_source> mSource;
    chunked_layer mLayer;
    pull_options mOptions;
    differ_tuning mTuning;

    std::string mBlobDigest;
    std::uint64_t mBlobSize{0U};
    bool mConvert{false};
    bool mSkipValidation{false};
    bool mUsed{false};
};

/**
 * @brief Selects the differ for a blob from its annotations.
 *
 * Fails with chunked_errc::fallback_recommended if the layer should be
 * pulled completely instead and with chunked_errc::fallback_can_convert if
 * it can't be pulled partially but could be converted. With convert_images
 * the latter yields a converting differ.
 */
auto make_differ(std::shared_ptr<layers_cache> cache,
                 std::shared_ptr<blob_source> source,
                 std::string_view blobDigest,
                 std::uint64_t blobSize,
                 annotation_map const &annotations,
                 pull_options const &options,
                 differ_tuning const &tuning = {})
        -> result<std::unique_ptr<chunked_differ>>;

} // namespace chunkdiff
