#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/span.hpp>
#include <chunkdiff/toc.hpp>

#include "bloom_filter.hpp"

namespace chunkdiff::detail
{

inline constexpr std::uint64_t cache_version = 3U;
inline constexpr std::size_t bloom_filter_scale = 10U;
inline constexpr std::uint32_t bloom_filter_hashes = 3U;
inline constexpr std::uint64_t max_tags_len = 100U * 1000U * 1000U;

/**
 * @brief A location record decoded from the cache file.
 *
 * The path views into the memory backing the cache file.
 */
struct cache_location
{
    std::string_view path;
    std::uint64_t offset;
    std::uint64_t length;
};

/**
 * @brief The index of one layer mapping binary digests to file locations.
 *
 * Layout (little endian):
 *   u64 version | u64 tagLen | u64 digestLen | bloom filter
 *   u64 tagsLen | u64 vdataLen | u64 fnamesLen | tags | vdata | fnames
 *
 * A tag is a binary digest followed by the u64 offset and u64 length of its
 * location record in vdata. The tags are sorted bytewise. A location record
 * is uvarint namePos, uvarint offset, uvarint length where namePos addresses
 * a u32 length prefixed name in fnames.
 *
 * A cache_file doesn't own its memory, the buffer passed to read() must
 * outlive it.
 */
class cache_file
{
public:
    cache_file() noexcept = default;

    /**
     * @brief Serializes the index over the given entries.
     *
     * Every entry with a digest contributes its content digest and its hard
     * link fingerprint, every entry with a chunk digest contributes the
     * chunk digest.
     */
    static auto build(std::span<file_entry const> entries)
            -> result<std::vector<std::byte>>;

    /**
     * @brief Decodes the header of a serialized cache file.
     * @return an empty optional if the file uses a different version
     */
    static auto read(ro_dynblob data) -> result<std::optional<cache_file>>;

    /**
     * @brief Looks up a binary digest.
     *
     * Fails with chunked_errc::corrupt_index if the tag or its location
     * record point outside of the file.
     */
    [[nodiscard]] auto find(ro_dynblob binaryDigest) const
            -> result<std::optional<cache_location>>;

    [[nodiscard]] auto num_tags() const noexcept -> std::size_t
    {
        return mTagLen == 0U ? 0U : mTags.size() / mTagLen;
    }

private:
    std::size_t mTagLen{0};
    std::size_t mDigestLen{0};
    ro_dynblob mTags;
    ro_dynblob mVdata;
    ro_dynblob mFnames;
    bloom_filter mBloomFilter;
};

/**
 * @brief Selects the entries of a manifest which are indexed.
 *
 * A manifest which can't be parsed yields no entries. Entries without a file
 * digest are only kept for the first occurrence of their chunk digest.
 */
auto prepare_cache_entries(std::string_view manifest, output_format format)
        -> result<std::vector<file_entry>>;

} // namespace chunkdiff::detail
