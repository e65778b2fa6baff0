#include "cache_file.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <set>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/utils/binary_codec.hpp>

namespace chunkdiff::detail
{

namespace
{

auto compare_bytes(ro_dynblob lhs, ro_dynblob rhs) noexcept -> int
{
    auto const common = std::min(lhs.size(), rhs.size());
    if (common != 0U)
    {
        if (auto const r = std::memcmp(lhs.data(), rhs.data(), common); r != 0)
        {
            return r;
        }
    }
    return lhs.size() < rhs.size() ? -1 : (lhs.size() > rhs.size() ? 1 : 0);
}

class cache_file_builder
{
public:
    auto add_location(std::string const &name,
                      std::uint64_t offset,
                      std::uint64_t length) -> std::pair<std::uint64_t,
                                                         std::uint64_t>
    {
        utils::binary_writer location;
        location.write_varint(name_position(name));
        location.write_varint(offset);
        location.write_varint(length);
        auto encoded = location.release();

        auto const vdataOffset = static_cast<std::uint64_t>(mVdata.size());
        mVdata.write_bytes(encoded);
        return {vdataOffset, static_cast<std::uint64_t>(encoded.size())};
    }

    auto add_tag(std::string_view digest,
                 std::pair<std::uint64_t, std::uint64_t> location)
            -> result<void>
    {
        CHUNKDIFF_TRY(auto &&tag, make_binary_digest(digest));
        mDigestLen = tag.size();

        auto const digestEnd = tag.size();
        tag.resize(digestEnd + 2 * sizeof(std::uint64_t));
        store_primitive(rw_dynblob(tag), location.first, digestEnd);
        store_primitive(rw_dynblob(tag), location.second,
                        digestEnd + sizeof(std::uint64_t));

        if (mTagLen == 0U)
        {
            mTagLen = tag.size();
        }
        if (mTagLen != tag.size())
        {
            SPDLOG_DEBUG("digest {} has a different length than the previous "
                         "ones",
                         digest);
            return chunked_errc::invalid_digest;
        }
        mTags.push_back(std::move(tag));
        return oc::success();
    }

    auto finish() -> std::vector<std::byte>
    {
        std::ranges::sort(mTags, [](auto const &lhs, auto const &rhs) {
            return compare_bytes(lhs, rhs) < 0;
        });

        bloom_filter filter(mTags.size() * bloom_filter_scale,
                            bloom_filter_hashes);
        for (auto const &tag : mTags)
        {
            filter.add(ro_dynblob(tag).first(mDigestLen));
        }

        auto const vdata = mVdata.release();
        auto const fnames = mFnames.release();

        utils::binary_writer out;
        out.write(cache_version);
        out.write(static_cast<std::uint64_t>(mTagLen));
        out.write(static_cast<std::uint64_t>(mDigestLen));
        filter.write_to(out);
        out.write(static_cast<std::uint64_t>(mTags.size() * mTagLen));
        out.write(static_cast<std::uint64_t>(vdata.size()));
        out.write(static_cast<std::uint64_t>(fnames.size()));
        for (auto const &tag : mTags)
        {
            out.write_bytes(tag);
        }
        out.write_bytes(vdata);
        out.write_bytes(fnames);
        return out.release();
    }

private:
    auto name_position(std::string const &name) -> std::uint64_t
    {
        if (auto const it = mNamePositions.find(name);
            it != mNamePositions.end())
        {
            return it->second;
        }
        auto const position = static_cast<std::uint64_t>(mFnames.size());
        mNamePositions.emplace(name, position);
        mFnames.write(static_cast<std::uint32_t>(name.size()));
        mFnames.write_bytes(as_bytes(name));
        return position;
    }

    std::vector<std::vector<std::byte>> mTags;
    utils::binary_writer mVdata;
    utils::binary_writer mFnames;
    std::map<std::string, std::uint64_t, std::less<>> mNamePositions;
    std::size_t mTagLen{0};
    std::size_t mDigestLen{0};
};

} // namespace

auto cache_file::build(std::span<file_entry const> entries)
        -> result<std::vector<std::byte>>
{
    cache_file_builder builder;
    for (auto const &entry : entries)
    {
        if (!entry.digest.empty())
        {
            auto const location = builder.add_location(
                    entry.name, 0U, static_cast<std::uint64_t>(entry.size));
            CHUNKDIFF_TRY(builder.add_tag(entry.digest, location));

            CHUNKDIFF_TRY(auto &&fingerprint, hard_link_fingerprint(entry));
            CHUNKDIFF_TRY(builder.add_tag(fingerprint, location));
        }
        if (!entry.chunk_digest.empty())
        {
            auto const location = builder.add_location(
                    entry.name, static_cast<std::uint64_t>(entry.chunk_offset),
                    static_cast<std::uint64_t>(entry.chunk_size));
            CHUNKDIFF_TRY(builder.add_tag(entry.chunk_digest, location));
        }
    }
    return builder.finish();
}

auto cache_file::read(ro_dynblob data) -> result<std::optional<cache_file>>
{
    utils::binary_reader reader(data);

    auto const version = reader.read<std::uint64_t>();
    if (!version)
    {
        return chunked_errc::corrupt_index;
    }
    if (*version != cache_version)
    {
        return std::optional<cache_file>{};
    }

    auto const tagLen = reader.read<std::uint64_t>();
    auto const digestLen = reader.read<std::uint64_t>();
    if (!tagLen || !digestLen)
    {
        return chunked_errc::corrupt_index;
    }
    auto bloom = bloom_filter::read_from(reader);
    if (!bloom)
    {
        return chunked_errc::corrupt_index;
    }

    auto const tagsLen = reader.read<std::uint64_t>();
    auto const vdataLen = reader.read<std::uint64_t>();
    auto const fnamesLen = reader.read<std::uint64_t>();
    if (!tagsLen || !vdataLen || !fnamesLen)
    {
        return chunked_errc::corrupt_index;
    }
    if (*tagsLen > max_tags_len || *digestLen > *tagLen
        || *tagsLen > reader.remaining())
    {
        return chunked_errc::corrupt_index;
    }
    auto const tags = *reader.read_bytes(static_cast<std::size_t>(*tagsLen));

    if (*vdataLen > reader.remaining())
    {
        return chunked_errc::corrupt_index;
    }
    auto const vdata = *reader.read_bytes(static_cast<std::size_t>(*vdataLen));

    if (*fnamesLen > reader.remaining())
    {
        return chunked_errc::corrupt_index;
    }
    auto const fnames
            = *reader.read_bytes(static_cast<std::size_t>(*fnamesLen));

    cache_file file;
    file.mTagLen = static_cast<std::size_t>(*tagLen);
    file.mDigestLen = static_cast<std::size_t>(*digestLen);
    file.mTags = tags;
    file.mVdata = vdata;
    file.mFnames = fnames;
    file.mBloomFilter = std::move(*bloom);
    return std::optional<cache_file>{std::move(file)};
}

auto cache_file::find(ro_dynblob binaryDigest) const
        -> result<std::optional<cache_location>>
{
    auto const numTags = num_tags();
    if (numTags == 0U || binaryDigest.size() != mDigestLen
        || !mBloomFilter.maybe_contains(binaryDigest))
    {
        return std::optional<cache_location>{};
    }

    auto const digestAt = [this](std::size_t i) {
        return mTags.subspan(i * mTagLen, mDigestLen);
    };

    std::size_t first = 0U;
    std::size_t count = numTags;
    while (count > 0U)
    {
        auto const step = count / 2U;
        if (compare_bytes(digestAt(first + step), binaryDigest) < 0)
        {
            first += step + 1U;
            count -= step + 1U;
        }
        else
        {
            count = step;
        }
    }
    if (first == numTags || compare_bytes(digestAt(first), binaryDigest) != 0)
    {
        return std::optional<cache_location>{};
    }

    // there must be two u64 (offset and length) after the digest
    if (mTagLen < mDigestLen + 2 * sizeof(std::uint64_t))
    {
        return chunked_errc::corrupt_index;
    }
    auto const tagTail = mTags.subspan(first * mTagLen + mDigestLen);
    auto const recordOffset = load_primitive<std::uint64_t>(tagTail);
    auto const recordLength
            = load_primitive<std::uint64_t>(tagTail, sizeof(std::uint64_t));
    if (recordOffset > mVdata.size()
        || recordLength > mVdata.size() - recordOffset)
    {
        return chunked_errc::corrupt_index;
    }

    utils::binary_reader record(
            mVdata.subspan(static_cast<std::size_t>(recordOffset),
                           static_cast<std::size_t>(recordLength)));
    auto const namePos = record.read_varint();
    auto const offset = record.read_varint();
    auto const length = record.read_varint();
    if (!namePos || !offset || !length)
    {
        return chunked_errc::corrupt_index;
    }

    if (*namePos > mFnames.size()
        || mFnames.size() - *namePos < sizeof(std::uint32_t))
    {
        return chunked_errc::corrupt_index;
    }
    auto const nameStart = static_cast<std::size_t>(*namePos);
    auto const nameLen = load_primitive<std::uint32_t>(mFnames, nameStart);
    if (mFnames.size() - nameStart - sizeof(std::uint32_t) < nameLen)
    {
        return chunked_errc::corrupt_index;
    }
    auto const name = as_string_view(
            mFnames.subspan(nameStart + sizeof(std::uint32_t), nameLen));

    return std::optional<cache_location>{
            cache_location{name, *offset, *length}
    };
}

auto prepare_cache_entries(std::string_view manifest, output_format format)
        -> result<std::vector<file_entry>>
{
    auto parsed = parse_toc(manifest);
    if (parsed.has_error())
    {
        // the manifest might use a format which isn't indexed
        SPDLOG_DEBUG("could not parse manifest for the cache: {}",
                     parsed.assume_error().message().c_str());
        return std::vector<file_entry>{};
    }

    std::vector<file_entry> entries = std::move(parsed.assume_value().entries);
    if (format == output_format::flat)
    {
        std::vector<file_metadata> files(entries.begin(), entries.end());
        CHUNKDIFF_TRY(auto &&flat, make_entries_flat(std::move(files), nullptr));
        entries.assign(flat.begin(), flat.end());
    }

    std::vector<file_entry> selected;
    selected.reserve(entries.size());
    std::set<std::string, std::less<>> seenChunks;
    for (auto &entry : entries)
    {
        if (!entry.digest.empty())
        {
            selected.push_back(std::move(entry));
            continue;
        }
        // chunks are not deduplicated with hard links, one candidate is
        // enough
        if (!entry.chunk_digest.empty()
            && seenChunks.insert(entry.chunk_digest).second)
        {
            selected.push_back(std::move(entry));
        }
    }
    return selected;
}

} // namespace chunkdiff::detail
