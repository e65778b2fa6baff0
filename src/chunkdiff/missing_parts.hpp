#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff::detail
{

/**
 * @brief A byte range of a file in another local layer.
 */
struct origin_file
{
    std::filesystem::path root;
    std::string path;
    std::uint64_t offset{0};
};

/**
 * @brief A slice of a destination file provided by a missing_part.
 *
 * A chunk without a file is a gap, i.e. bytes of a merged remote range
 * which don't belong to any file.
 */
struct missing_file_chunk
{
    std::uint64_t gap{0};
    bool hole{false};
    file_metadata const *file{nullptr};
    //! the size of the chunk in the source stream
    std::uint64_t compressed_size{0};
    //! the size of the chunk in the destination file
    std::uint64_t uncompressed_size{0};
};

struct missing_part
{
    bool hole{false};
    std::optional<origin_file> origin;
    //! the range in the source stream, also kept for local parts
    blob_range source{0, 0};
    std::vector<missing_file_chunk> chunks;

    [[nodiscard]] auto is_remote() const noexcept -> bool
    {
        return !hole && !origin.has_value();
    }
};

/**
 * @brief Reduces the number of remote requests needed to fetch @p parts.
 *
 * Adjacent single chunk parts of the same file are always combined.
 * Afterwards the gaps between consecutive remote parts are bridged,
 * cheapest first, until at most @p target remote requests remain. Gaps of
 * at most @p autoMergeThreshold bytes are bridged in any case. Local parts
 * lying within a bridged gap are fetched remotely as well.
 */
auto merge_missing_chunks(std::vector<missing_part> parts,
                          std::size_t target,
                          std::uint64_t autoMergeThreshold)
        -> std::vector<missing_part>;

/**
 * @brief Collects the source ranges of the remote parts in order.
 */
auto remote_ranges(std::span<missing_part const> parts)
        -> std::vector<blob_range>;

} // namespace chunkdiff::detail
