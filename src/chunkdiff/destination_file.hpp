#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/digest.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/toc.hpp>

#include "fs/entries.hpp"
#include "fs/unique_fd.hpp"

namespace chunkdiff::detail
{

/**
 * @brief Enables fs-verity on finished files and collects their
 * measurements.
 */
class fs_verity_recorder
{
public:
    explicit fs_verity_recorder(fs_verity_mode mode) noexcept
        : mMode(mode)
        , mMutex()
        , mDigests()
    {
    }

    [[nodiscard]] auto enabled() const noexcept -> bool
    {
        return mMode != fs_verity_mode::disabled;
    }

    /**
     * @brief Records the measurement of the read only descriptor @p fd.
     *
     * In if_possible mode file systems without fs-verity are skipped.
     */
    auto record(std::string const &path, int fd) -> result<void>;

    auto take_digests() -> std::map<std::string, std::string>;

private:
    fs_verity_mode mMode;
    std::mutex mMutex;
    std::map<std::string, std::string> mDigests;
};

/**
 * @brief A regular file which is being reconstructed.
 *
 * The content is hashed while it is written, close() verifies it against
 * the digest of the entry and applies the attributes.
 */
class destination_file
{
public:
    destination_file(destination_file &&) noexcept = default;
    auto operator=(destination_file &&) noexcept
            -> destination_file & = default;

    static auto open(entry_context const &ctx,
                     file_metadata const &metadata,
                     bool skipValidation,
                     fs_verity_recorder *recorder) -> result<destination_file>;

    auto write(ro_dynblob data) -> result<void>;

    /**
     * @brief Appends @p size bytes of decoded data read from @p source.
     *
     * Fails with chunked_errc::not_enough_data if the source ends early.
     */
    auto append_from(blob_stream &source, std::uint64_t size) -> result<void>;

    /**
     * @brief Appends @p size zero bytes without storing them.
     */
    auto append_hole(std::uint64_t size) -> result<void>;

    auto close() -> result<void>;

    [[nodiscard]] auto metadata() const noexcept -> file_metadata const &
    {
        return *mMetadata;
    }

private:
    destination_file(entry_context const &ctx,
                     file_metadata const &metadata,
                     unique_fd fd,
                     std::optional<digester> hasher,
                     fs_verity_recorder *recorder) noexcept;

    entry_context const *mCtx;
    file_metadata const *mMetadata;
    unique_fd mFd;
    std::optional<digester> mHasher;
    fs_verity_recorder *mRecorder;
};

} // namespace chunkdiff::detail
