#include "convert.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>

#include "blob_fan_in.hpp"
#include "compression.hpp"
#include "tar/tar_reader.hpp"
#include "tar/tar_split.hpp"

namespace chunkdiff::detail
{

namespace
{

constexpr std::size_t copy_buffer_size = 1 << 16;

auto write_at(llfio::file_handle &file, std::uint64_t offset, ro_dynblob data)
        -> result<void>
{
    llfio::file_handle::const_buffer_type buffers[] = {
            {data.data(), data.size()}};
    CHUNKDIFF_TRY(file.write({buffers, offset}));
    return oc::success();
}

auto read_range(llfio::file_handle &file, blob_range range)
        -> result<std::vector<std::byte>>
{
    std::vector<std::byte> data(static_cast<std::size_t>(range.length));
    file_range_stream stream(file, range);
    CHUNKDIFF_TRY(auto &&n, read_full(stream, data));
    if (n != data.size())
    {
        return chunked_errc::not_enough_data;
    }
    return data;
}

auto make_blob_decoder(blob_compression compression)
        -> result<std::unique_ptr<decoder>>
{
    if (compression == blob_compression::gzip)
    {
        CHUNKDIFF_TRY(auto &&gzip, gzip_decoder::create());
        return std::unique_ptr<decoder>(std::move(gzip));
    }
    CHUNKDIFF_TRY(auto &&zstd, zstd_decoder::create());
    return std::unique_ptr<decoder>(std::move(zstd));
}

auto download_blob(blob_source &source,
                   std::uint64_t blobSize,
                   std::string_view blobDigest,
                   llfio::file_handle &target) -> result<void>
{
    CHUNKDIFF_TRY(auto &&hasher, digester::create(blobDigest));

    std::array<blob_range, 1> const ranges{
            {{0U, blobSize}}
    };
    CHUNKDIFF_TRY(auto &&channels, source.fetch(ranges));
    CHUNKDIFF_TRY(auto &&fanIn, blob_fan_in::start(std::move(channels), 1U));

    auto item = fanIn->next();
    if (!item.has_value())
    {
        return chunked_errc::not_enough_data;
    }
    CHUNKDIFF_TRY(auto &&stream, std::move(*item));

    std::vector<std::byte> buffer(copy_buffer_size);
    std::uint64_t written = 0U;
    for (;;)
    {
        CHUNKDIFF_TRY(auto &&n, stream->read_some(buffer));
        if (n == 0U)
        {
            break;
        }
        auto const data = ro_dynblob(buffer).first(n);
        CHUNKDIFF_TRY(hasher.update(data));
        CHUNKDIFF_TRY(write_at(target, written, data));
        written += n;
    }
    stream.reset();
    CHUNKDIFF_TRY(fanIn->drain());

    if (written != blobSize)
    {
        return chunked_errc::not_enough_data;
    }
    CHUNKDIFF_TRY(auto &&actual, hasher.finish());
    if (actual != blobDigest)
    {
        SPDLOG_ERROR("invalid digest of the converted blob (got {} instead "
                     "of {})",
                     actual, blobDigest);
        return chunked_errc::checksum_mismatch;
    }
    return oc::success();
}

auto decompress_file(llfio::file_handle &source,
                     std::uint64_t sourceSize,
                     blob_compression compression,
                     llfio::file_handle &target) -> result<void>
{
    CHUNKDIFF_TRY(auto &&decoder, make_blob_decoder(compression));
    file_range_stream input(source, {0U, sourceSize});
    decoder->reset(input);

    std::vector<std::byte> buffer(copy_buffer_size);
    std::uint64_t written = 0U;
    for (;;)
    {
        CHUNKDIFF_TRY(auto &&n, decoder->read_some(buffer));
        if (n == 0U)
        {
            return oc::success();
        }
        CHUNKDIFF_TRY(write_at(target, written, ro_dynblob(buffer).first(n)));
        written += n;
    }
}

} // namespace

auto detect_compression(ro_dynblob head) noexcept -> blob_compression
{
    constexpr std::array<std::byte, 2> gzipMagic{std::byte{0x1f},
                                                 std::byte{0x8b}};
    constexpr std::array<std::byte, 4> zstdMagic{
            std::byte{0x28}, std::byte{0xb5}, std::byte{0x2f},
            std::byte{0xfd}};

    if (head.size() >= gzipMagic.size()
        && std::equal(gzipMagic.begin(), gzipMagic.end(), head.begin()))
    {
        return blob_compression::gzip;
    }
    if (head.size() >= zstdMagic.size()
        && std::equal(zstdMagic.begin(), zstdMagic.end(), head.begin()))
    {
        return blob_compression::zstd;
    }
    return blob_compression::none;
}

auto index_tar_file(llfio::file_handle tarFile) -> result<converted_layer>
{
    CHUNKDIFF_TRY(auto &&fileSize, tarFile.maximum_extent());

    converted_layer layer;
    layer.manifest.version = 1;
    tar_split_writer split;
    CHUNKDIFF_TRY(auto &&uncompressed,
                  digester::create(digest_algorithm::sha256));

    file_range_stream stream(tarFile, {0U, fileSize});
    tar_reader reader(stream);
    std::vector<std::byte> buffer(copy_buffer_size);
    std::uint64_t segmentStart = 0U;

    for (;;)
    {
        CHUNKDIFF_TRY(auto &&member, reader.next());
        if (!member.has_value())
        {
            break;
        }

        CHUNKDIFF_TRY(auto &&segment,
                      read_range(tarFile,
                                 {segmentStart,
                                  member->data_offset - segmentStart}));
        split.add_segment(segment);
        CHUNKDIFF_TRY(uncompressed.update(segment));

        auto entry = to_file_entry(member->header);
        std::uint64_t dataSize = 0U;
        tar_split_crc crc;
        if (entry.type == entry_type::reg)
        {
            dataSize = static_cast<std::uint64_t>(entry.size);
            CHUNKDIFF_TRY(auto &&content,
                          digester::create(digest_algorithm::sha256));
            for (;;)
            {
                CHUNKDIFF_TRY(auto &&n, reader.read(buffer));
                if (n == 0U)
                {
                    break;
                }
                auto const data = ro_dynblob(buffer).first(n);
                crc.process_bytes(data.data(), data.size());
                CHUNKDIFF_TRY(content.update(data));
                CHUNKDIFF_TRY(uncompressed.update(data));
            }
            CHUNKDIFF_TRY(entry.digest, content.finish());
            if (dataSize > 0U)
            {
                entry.offset = static_cast<std::int64_t>(member->data_offset);
                entry.end_offset
                        = static_cast<std::int64_t>(member->data_offset
                                                    + dataSize);
                entry.chunk_size = entry.size;
                entry.chunk_digest = entry.digest;
            }
        }
        split.add_file(member->header.name,
                       static_cast<std::int64_t>(dataSize), crc.checksum());
        layer.manifest.entries.push_back(std::move(entry));
        segmentStart = member->data_offset + dataSize;
    }

    CHUNKDIFF_TRY(auto &&trailer,
                  read_range(tarFile, {segmentStart, fileSize - segmentStart}));
    if (!trailer.empty())
    {
        split.add_segment(trailer);
        CHUNKDIFF_TRY(uncompressed.update(trailer));
    }

    CHUNKDIFF_TRY(layer.manifest.tar_split_digest,
                  digest_of(as_bytes(split.data())));
    layer.manifest_json = serialize_toc(layer.manifest);
    layer.tar_split = split.data();
    CHUNKDIFF_TRY(layer.uncompressed_digest, uncompressed.finish());
    layer.tar_size = static_cast<std::int64_t>(fileSize);
    layer.file = std::move(tarFile);

    SPDLOG_DEBUG("converted a tar stream of {} bytes with {} entries",
                 fileSize, layer.manifest.entries.size());
    return layer;
}

auto convert_blob(blob_source &source,
                  std::uint64_t blobSize,
                  std::string_view blobDigest,
                  llfio::path_handle const &tmpDir) -> result<converted_layer>
{
    CHUNKDIFF_TRY(auto &&blobFile, llfio::file_handle::temp_inode(tmpDir));
    CHUNKDIFF_TRY(download_blob(source, blobSize, blobDigest, blobFile));

    std::array<std::byte, 4> head{};
    file_range_stream headStream(blobFile, {0U, head.size()});
    CHUNKDIFF_TRY(auto &&headSize, read_full(headStream, head));

    auto const compression
            = detect_compression(ro_dynblob(head).first(headSize));
    if (compression == blob_compression::none)
    {
        return index_tar_file(std::move(blobFile));
    }

    CHUNKDIFF_TRY(auto &&tarFile, llfio::file_handle::temp_inode(tmpDir));
    CHUNKDIFF_TRY(decompress_file(blobFile, blobSize, compression, tarFile));
    return index_tar_file(std::move(tarFile));
}

} // namespace chunkdiff::detail
