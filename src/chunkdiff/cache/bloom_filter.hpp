#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <chunkdiff/span.hpp>
#include <chunkdiff/utils/binary_codec.hpp>

namespace chunkdiff::detail
{

/**
 * @brief A conventional bloom filter over byte strings.
 *
 * The bit index of hash function @c s for an item @c x is derived from
 * crc32(x[:s % |x|]) ^ crc32(x[s % |x|:]). The serialized form is shared
 * with existing cache files, therefore the hashing scheme must not change.
 */
class bloom_filter
{
public:
    using word_type = std::uint64_t;

    static constexpr unsigned bits_per_word = 64U;
    //! bit indices are 32 bit wide
    static constexpr std::uint64_t max_words
            = std::uint64_t{0xFFFF'FFFFU} / bits_per_word;
    static constexpr std::uint32_t max_hashes = 64U;

    bloom_filter() noexcept = default;

    /**
     * @brief Creates an empty filter with room for @p numBits cells.
     */
    bloom_filter(std::size_t numBits, std::uint32_t k);

    /**
     * @brief Decodes a filter written by write_to().
     * @return an empty optional if @p reader doesn't contain a complete filter
     * or its dimensions are out of range
     */
    static auto read_from(utils::binary_reader &reader)
            -> std::optional<bloom_filter>;

    void write_to(utils::binary_writer &writer) const;

    void add(ro_dynblob item) noexcept;

    /**
     * @brief Returns false if the item definitely is not part of the set.
     */
    [[nodiscard]] auto maybe_contains(ro_dynblob item) const noexcept -> bool;

    [[nodiscard]] auto num_words() const noexcept -> std::size_t
    {
        return mWords.size();
    }
    [[nodiscard]] auto num_hashes() const noexcept -> std::uint32_t
    {
        return mK;
    }

private:
    [[nodiscard]] auto hash_of(ro_dynblob item, std::uint32_t seed) const noexcept
            -> std::pair<std::size_t, word_type>;

    std::vector<word_type> mWords;
    std::uint32_t mK{0};
};

} // namespace chunkdiff::detail
