#include "manifest.hpp"

#include <array>
#include <charconv>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>

#include "blob_fan_in.hpp"
#include "compression.hpp"
#include "tar/tar_reader.hpp"

namespace chunkdiff::detail
{

namespace
{

constexpr std::uint64_t manifest_type_crfs = 1U;
constexpr std::uint64_t estargz_footer_size = 51U;

auto parse_uint(std::string_view text) -> result<std::uint64_t>
{
    std::uint64_t value = 0U;
    auto const [end, ec]
            = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
    {
        return chunked_errc::invalid_manifest;
    }
    return value;
}

auto start_fetch(blob_source &source, std::span<blob_range const> ranges)
        -> result<std::unique_ptr<blob_fan_in>>
{
    auto channelsRx = source.fetch(ranges);
    if (channelsRx.has_error())
    {
        if (channelsRx.assume_error() == chunked_errc::bad_request)
        {
            return chunked_errc::fallback_can_convert;
        }
        return std::move(channelsRx).as_failure();
    }
    return blob_fan_in::start(std::move(channelsRx).assume_value(),
                              ranges.size());
}

auto read_next_blob(blob_fan_in &fanIn, std::uint64_t length)
        -> result<std::vector<std::byte>>
{
    auto item = fanIn.next();
    if (!item.has_value())
    {
        return chunked_errc::not_enough_data;
    }
    CHUNKDIFF_TRY(auto &&stream, std::move(*item));

    std::vector<std::byte> blob(static_cast<std::size_t>(length));
    CHUNKDIFF_TRY(auto &&n, read_full(*stream, blob));
    if (n != blob.size())
    {
        return chunked_errc::not_enough_data;
    }
    return blob;
}

auto validate_blob(ro_dynblob blob, std::string_view expected) -> result<void>
{
    CHUNKDIFF_TRY(auto &&matches, verify_digest(blob, expected));
    if (!matches)
    {
        SPDLOG_ERROR("invalid checksum of a chunked layer manifest, expected "
                     "{}",
                     expected);
        return chunked_errc::checksum_mismatch;
    }
    return oc::success();
}

auto read_tar_split(blob_fan_in &fanIn,
                    blob_position const &position,
                    chunked_manifest &manifest) -> result<void>
{
    CHUNKDIFF_TRY(auto &&compressed,
                  read_next_blob(fanIn, position.range.length));
    CHUNKDIFF_TRY(validate_blob(compressed, manifest.parsed.tar_split_digest));

    CHUNKDIFF_TRY(auto &&zstd, zstd_decoder::create());
    CHUNKDIFF_TRY(auto &&decoded, decode_all(*zstd, compressed));
    manifest.tar_split = std::string(as_string_view(decoded));

    CHUNKDIFF_TRY(manifest.tar_split_entries,
                  parse_tar_split(*manifest.tar_split));
    // the files are created from the table of contents, but exports use
    // the tar-split
    return ensure_toc_matches_tar_split(manifest.parsed,
                                        manifest.tar_split_entries);
}

} // namespace

auto parse_blob_position(std::string_view annotation, bool withType)
        -> result<blob_position>
{
    std::array<std::uint64_t, 4> values{};
    auto const expected = withType ? 4U : 3U;
    std::size_t count = 0U;
    for (;;)
    {
        auto const sep = annotation.find(':');
        if (count == expected)
        {
            return chunked_errc::invalid_manifest;
        }
        CHUNKDIFF_TRY(values[count], parse_uint(annotation.substr(0U, sep)));
        ++count;
        if (sep == std::string_view::npos)
        {
            break;
        }
        annotation = annotation.substr(sep + 1U);
    }
    if (count != expected)
    {
        return chunked_errc::invalid_manifest;
    }
    return blob_position{
            .range = {values[0], values[1]},
            .uncompressed_length = values[2],
            .type = values[3],
    };
}

auto read_zstd_chunked_manifest(blob_source &source,
                                std::string_view tocDigest,
                                annotation_map const &annotations)
        -> result<chunked_manifest>
{
    auto const manifestIt
            = annotations.find(zstd_chunked_manifest_position_key);
    if (manifestIt == annotations.end())
    {
        SPDLOG_DEBUG("{} annotation missing",
                     zstd_chunked_manifest_position_key);
        return chunked_errc::invalid_manifest;
    }
    CHUNKDIFF_TRY(auto &&manifestPosition,
                  parse_blob_position(manifestIt->second, true));

    std::optional<blob_position> tarSplitPosition;
    if (auto const it = annotations.find(zstd_chunked_tar_split_position_key);
        it != annotations.end())
    {
        CHUNKDIFF_TRY(auto &&position, parse_blob_position(it->second, false));
        if (position.range.offset > 0U)
        {
            tarSplitPosition = position;
        }
    }

    if (manifestPosition.type != manifest_type_crfs)
    {
        return chunked_errc::invalid_manifest;
    }
    if (manifestPosition.range.length > max_toc_size
        || manifestPosition.uncompressed_length > max_toc_size)
    {
        SPDLOG_DEBUG("zstd:chunked manifest too big to process in memory");
        return chunked_errc::fallback_recommended;
    }

    std::vector<blob_range> ranges{manifestPosition.range};
    if (tarSplitPosition)
    {
        ranges.push_back(tarSplitPosition->range);
    }
    CHUNKDIFF_TRY(auto &&fanIn, start_fetch(source, ranges));

    auto readRx = [&]() -> result<chunked_manifest> {
        CHUNKDIFF_TRY(auto &&compressed,
                      read_next_blob(*fanIn, manifestPosition.range.length));
        CHUNKDIFF_TRY(validate_blob(compressed, tocDigest));
        CHUNKDIFF_TRY(auto &&decoded,
                      zstd_decompress(compressed,
                                      manifestPosition.uncompressed_length));

        chunked_manifest manifest;
        manifest.json = std::string(as_string_view(decoded));
        CHUNKDIFF_TRY(manifest.parsed, parse_toc(manifest.json));
        manifest.toc_offset = manifestPosition.range.offset;

        if (!manifest.parsed.tar_split_digest.empty())
        {
            if (!tarSplitPosition)
            {
                SPDLOG_ERROR("the TOC requires a tar-split, but the {} "
                             "annotation does not describe a position",
                             zstd_chunked_tar_split_position_key);
                return chunked_errc::invalid_manifest;
            }
            CHUNKDIFF_TRY(read_tar_split(*fanIn, *tarSplitPosition, manifest));
        }
        // an unauthenticated tar-split is ignored, drain() consumes it
        return manifest;
    }();

    auto drainRx = fanIn->drain();
    if (readRx.has_value() && drainRx.has_error())
    {
        return std::move(drainRx).as_failure();
    }
    return readRx;
}

auto read_estargz_manifest(blob_source &source,
                           std::uint64_t blobSize,
                           std::string_view tocDigest)
        -> result<chunked_manifest>
{
    if (blobSize <= estargz_footer_size)
    {
        return chunked_errc::invalid_manifest;
    }

    std::vector<std::byte> footer;
    {
        std::array<blob_range, 1> const ranges{
                {{blobSize - estargz_footer_size, estargz_footer_size}}
        };
        CHUNKDIFF_TRY(auto &&fanIn, start_fetch(source, ranges));
        auto footerRx = read_next_blob(*fanIn, estargz_footer_size);
        CHUNKDIFF_TRY(fanIn->drain());
        CHUNKDIFF_TRY(footer, std::move(footerRx));
    }

    // gzip header (10), XLEN (2), subfield id and length (4), then
    // "%016xSTARGZ"
    auto const subfield = as_string_view(footer).substr(16U, 22U);
    if (!subfield.ends_with("STARGZ"))
    {
        return chunked_errc::invalid_manifest;
    }
    std::uint64_t tocOffset = 0U;
    auto const hex = subfield.substr(0U, 16U);
    auto const [end, ec] = std::from_chars(hex.data(), hex.data() + hex.size(),
                                           tocOffset, 16);
    if (ec != std::errc{} || end != hex.data() + hex.size()
        || tocOffset > blobSize - estargz_footer_size)
    {
        return chunked_errc::invalid_manifest;
    }

    auto const size = blobSize - estargz_footer_size - tocOffset;
    if (size > max_toc_size)
    {
        SPDLOG_DEBUG("estargz manifest too big to process in memory ({} "
                     "bytes)",
                     size);
        return chunked_errc::fallback_recommended;
    }

    std::vector<std::byte> compressed;
    {
        std::array<blob_range, 1> const ranges{
                {{tocOffset, size}}
        };
        CHUNKDIFF_TRY(auto &&fanIn, start_fetch(source, ranges));
        auto compressedRx = read_next_blob(*fanIn, size);
        CHUNKDIFF_TRY(fanIn->drain());
        CHUNKDIFF_TRY(compressed, std::move(compressedRx));
    }

    CHUNKDIFF_TRY(auto &&tarData, gzip_decompress(compressed));
    memory_blob_stream tarStream(tarData);
    tar_reader reader(tarStream);
    CHUNKDIFF_TRY(auto &&member, reader.next());
    if (!member.has_value())
    {
        return chunked_errc::invalid_manifest;
    }
    if (static_cast<std::uint64_t>(member->header.size) > max_toc_size)
    {
        return chunked_errc::invalid_manifest;
    }

    chunked_manifest manifest;
    manifest.json.resize(static_cast<std::size_t>(member->header.size));
    CHUNKDIFF_TRY(auto &&n,
                  read_full(tarStream, rw_dynblob(reinterpret_cast<std::byte *>(
                                                          manifest.json.data()),
                                                  manifest.json.size())));
    if (n != manifest.json.size())
    {
        return chunked_errc::invalid_manifest;
    }
    CHUNKDIFF_TRY(validate_blob(as_bytes(manifest.json), tocDigest));
    CHUNKDIFF_TRY(manifest.parsed, parse_toc(manifest.json));
    manifest.toc_offset = tocOffset;
    return manifest;
}

} // namespace chunkdiff::detail
