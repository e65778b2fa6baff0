#include "missing_parts.hpp"

#include <algorithm>
#include <limits>

namespace chunkdiff::detail
{

namespace
{

constexpr auto unbridgeable_gap = std::numeric_limits<std::uint64_t>::max();

auto end_of(blob_range const &range) noexcept -> std::uint64_t
{
    return range.offset + range.length;
}

// overlapping or reordered ranges can't be bridged
auto gap_between(missing_part const &prev, missing_part const &next) noexcept
        -> std::uint64_t
{
    auto const prevEnd = end_of(prev.source);
    if (next.source.offset < prevEnd)
    {
        return unbridgeable_gap;
    }
    return next.source.offset - prevEnd;
}

auto is_same_file_continuation(missing_part const &prev,
                               missing_part const &next) noexcept -> bool
{
    return prev.is_remote() && next.is_remote() && prev.chunks.size() == 1U
           && next.chunks.size() == 1U && prev.chunks[0].file != nullptr
           && next.chunks[0].file != nullptr
           && prev.chunks[0].file->name == next.chunks[0].file->name
           && gap_between(prev, next) == 0U;
}

auto is_ordered(std::span<missing_part const> parts) noexcept -> bool
{
    for (std::size_t i = 1U; i < parts.size(); ++i)
    {
        if (gap_between(parts[i - 1U], parts[i]) == unbridgeable_gap)
        {
            return false;
        }
    }
    return true;
}

struct request_gap
{
    std::size_t from;
    std::size_t to;
    std::uint64_t cost;
};

} // namespace

auto merge_missing_chunks(std::vector<missing_part> parts,
                          std::size_t target,
                          std::uint64_t autoMergeThreshold)
        -> std::vector<missing_part>
{
    if (parts.empty())
    {
        return parts;
    }

    std::vector<missing_part> simplified;
    simplified.reserve(parts.size());
    simplified.push_back(std::move(parts.front()));
    for (std::size_t i = 1U; i < parts.size(); ++i)
    {
        auto &prev = simplified.back();
        if (is_same_file_continuation(prev, parts[i]))
        {
            prev.source.length += parts[i].source.length;
            prev.chunks[0].compressed_size += parts[i].chunks[0].compressed_size;
            prev.chunks[0].uncompressed_size
                    += parts[i].chunks[0].uncompressed_size;
        }
        else
        {
            simplified.push_back(std::move(parts[i]));
        }
    }
    parts = std::move(simplified);

    std::vector<request_gap> gaps;
    std::optional<std::size_t> lastRemote;
    std::size_t numRemote = 0U;
    for (std::size_t i = 0U; i < parts.size(); ++i)
    {
        if (!parts[i].is_remote())
        {
            continue;
        }
        ++numRemote;
        if (lastRemote)
        {
            auto const cost = gap_between(parts[*lastRemote], parts[i]);
            if (cost != unbridgeable_gap
                && is_ordered(std::span(parts).subspan(
                        *lastRemote, i - *lastRemote + 1U)))
            {
                gaps.push_back({*lastRemote, i, cost});
            }
        }
        lastRemote = i;
    }
    std::ranges::stable_sort(gaps, {}, &request_gap::cost);

    std::vector<bool> mergeWithPrev(parts.size(), false);
    auto remainingToMerge = static_cast<std::int64_t>(numRemote)
                            - static_cast<std::int64_t>(target);
    for (auto const &gap : gaps)
    {
        if (remainingToMerge <= 0 && gap.cost > autoMergeThreshold)
        {
            continue;
        }
        for (auto i = gap.from + 1U; i <= gap.to; ++i)
        {
            mergeWithPrev[i] = true;
        }
        --remainingToMerge;
    }

    std::vector<missing_part> merged;
    merged.reserve(parts.size());
    merged.push_back(std::move(parts.front()));
    for (std::size_t i = 1U; i < parts.size(); ++i)
    {
        if (!mergeWithPrev[i])
        {
            merged.push_back(std::move(parts[i]));
            continue;
        }
        auto &prev = merged.back();
        auto const gap = parts[i].source.offset - end_of(prev.source);
        prev.source.length += gap + parts[i].source.length;
        prev.hole = false;
        prev.origin.reset();
        if (gap > 0U)
        {
            prev.chunks.push_back(missing_file_chunk{.gap = gap});
        }
        prev.chunks.insert(prev.chunks.end(), parts[i].chunks.begin(),
                           parts[i].chunks.end());
    }
    return merged;
}

auto remote_ranges(std::span<missing_part const> parts)
        -> std::vector<blob_range>
{
    std::vector<blob_range> ranges;
    for (auto const &part : parts)
    {
        if (part.is_remote())
        {
            ranges.push_back(part.source);
        }
    }
    return ranges;
}

} // namespace chunkdiff::detail
