#include "bloom_filter.hpp"

#include <algorithm>

#include <zlib.h>

#include <chunkdiff/utils/misc.hpp>

namespace chunkdiff::detail
{

namespace
{
auto crc32_of(ro_dynblob data) noexcept -> std::uint32_t
{
    return static_cast<std::uint32_t>(
            ::crc32(0UL, reinterpret_cast<Bytef const *>(data.data()),
                    static_cast<uInt>(data.size())));
}
} // namespace

bloom_filter::bloom_filter(std::size_t numBits, std::uint32_t k)
    : mWords(std::max<std::size_t>(utils::div_ceil(numBits, bits_per_word), 1U))
    , mK(k)
{
}

auto bloom_filter::read_from(utils::binary_reader &reader)
        -> std::optional<bloom_filter>
{
    auto const numWords = reader.read<std::uint64_t>();
    auto const k = reader.read<std::uint32_t>();
    if (!numWords || !k || *numWords == 0U || *k == 0U || *k > max_hashes
        || *numWords > max_words
        || *numWords > reader.remaining() / sizeof(word_type))
    {
        return std::nullopt;
    }

    bloom_filter filter;
    filter.mK = *k;
    filter.mWords.resize(static_cast<std::size_t>(*numWords));
    for (auto &word : filter.mWords)
    {
        word = *reader.read<word_type>();
    }
    return filter;
}

void bloom_filter::write_to(utils::binary_writer &writer) const
{
    writer.write(static_cast<std::uint64_t>(mWords.size()));
    writer.write(mK);
    for (auto const word : mWords)
    {
        writer.write(word);
    }
}

auto bloom_filter::hash_of(ro_dynblob item, std::uint32_t seed) const noexcept
        -> std::pair<std::size_t, word_type>
{
    if (item.empty() || mWords.empty())
    {
        return {0U, 0U};
    }
    auto const mod = static_cast<std::uint64_t>(mWords.size()) * bits_per_word;
    auto const split = seed % item.size();
    auto const hash = static_cast<std::uint64_t>(crc32_of(item.first(split))
                                                 ^ crc32_of(item.subspan(split)))
                      % mod;
    return {static_cast<std::size_t>(hash / bits_per_word),
            word_type{1} << (hash % bits_per_word)};
}

void bloom_filter::add(ro_dynblob item) noexcept
{
    for (std::uint32_t i = 0; i < mK; ++i)
    {
        auto const [index, mask] = hash_of(item, i);
        if (mask != 0U)
        {
            mWords[index] |= mask;
        }
    }
}

auto bloom_filter::maybe_contains(ro_dynblob item) const noexcept -> bool
{
    for (std::uint32_t i = 0; i < mK; ++i)
    {
        auto const [index, mask] = hash_of(item, i);
        if (mask != 0U && (mWords[index] & mask) != mask)
        {
            return false;
        }
    }
    return true;
}

} // namespace chunkdiff::detail
