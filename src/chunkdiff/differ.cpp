#include <chunkdiff/differ.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <set>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/llfio.hpp>
#include <chunkdiff/utils/path.hpp>

#include "blob_fan_in.hpp"
#include "compression.hpp"
#include "convert.hpp"
#include "dedup.hpp"
#include "destination_file.hpp"
#include "fs/entries.hpp"
#include "fs/file_attrs.hpp"
#include "fs/under_root.hpp"
#include "manifest.hpp"
#include "missing_parts.hpp"
#include "tar/tar_split.hpp"

namespace chunkdiff
{

namespace detail
{
namespace
{

/**
 * @brief Reads an open local file starting at a fixed offset.
 */
class fd_stream final : public blob_stream
{
public:
    fd_stream(unique_fd fd, std::uint64_t offset) noexcept
        : mFd(std::move(fd))
        , mPosition(offset)
    {
    }

    auto read_some(rw_dynblob buffer) -> result<std::size_t> override
    {
        for (;;)
        {
            auto const n = ::pread(mFd.get(), buffer.data(), buffer.size(),
                                   static_cast<off_t>(mPosition));
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return collect_system_error();
            }
            mPosition += static_cast<std::uint64_t>(n);
            return static_cast<std::size_t>(n);
        }
    }

private:
    unique_fd mFd;
    std::uint64_t mPosition;
};

auto open_origin_file(origin_file const &origin) -> result<blob_stream_ptr>
{
    unique_fd root{::open(origin.root.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!root)
    {
        return collect_system_error();
    }
    CHUNKDIFF_TRY(auto &&fd, open_file_under_root(root.get(), origin.path,
                                                  O_RDONLY | O_CLOEXEC, 0));
    return blob_stream_ptr{
            std::make_unique<fd_stream>(std::move(fd), origin.offset)};
}

// consumes the stream without requiring a minimum length
auto skip_rest(blob_stream &stream) -> result<void>
{
    std::array<std::byte, 1 << 14> buffer;
    for (;;)
    {
        CHUNKDIFF_TRY(auto &&n, stream.read_some(buffer));
        if (n == 0U)
        {
            return oc::success();
        }
    }
}

/**
 * @brief Writes the destination files from the local and remote data of
 * the missing parts.
 */
class missing_files_writer
{
public:
    missing_files_writer(entry_context const &ctx,
                         compressed_file_type fileType,
                         bool skipValidation,
                         fs_verity_recorder &recorder) noexcept
        : mCtx(ctx)
        , mFileType(fileType)
        , mSkipValidation(skipValidation)
        , mRecorder(recorder)
        , mDecoder()
        , mIdentity()
        , mDestination()
    {
    }

    auto store(std::span<missing_part const> parts, blob_fan_in *fanIn)
            -> result<void>
    {
        for (auto const &part : parts)
        {
            blob_stream_ptr stream;
            auto partCompression = mFileType;
            bool readingFromLocalFile = false;
            if (part.hole)
            {
                partCompression = compressed_file_type::hole;
            }
            else if (part.origin)
            {
                CHUNKDIFF_TRY(stream, open_origin_file(*part.origin));
                partCompression = compressed_file_type::none;
                readingFromLocalFile = true;
            }
            else
            {
                if (fanIn == nullptr)
                {
                    return errc::invalid_argument;
                }
                auto item = fanIn->next();
                if (!item)
                {
                    return chunked_errc::not_enough_data;
                }
                if (item->has_error())
                {
                    return std::move(*item).as_failure();
                }
                stream = std::move(item->assume_value());
                if (!stream)
                {
                    return chunked_errc::not_enough_data;
                }
            }

            CHUNKDIFF_TRY(store_part(part, partCompression, stream.get(),
                                     readingFromLocalFile));
        }

        if (mDestination)
        {
            auto last = std::move(*mDestination);
            mDestination.reset();
            CHUNKDIFF_TRY(last.close());
        }
        return oc::success();
    }

private:
    auto store_part(missing_part const &part,
                    compressed_file_type partCompression,
                    blob_stream *stream,
                    bool readingFromLocalFile) -> result<void>
    {
        for (auto const &chunk : part.chunks)
        {
            if (chunk.gap > 0U)
            {
                if (stream == nullptr)
                {
                    return errc::invalid_argument;
                }
                CHUNKDIFF_TRY(discard(*stream, chunk.gap));
                continue;
            }
            if (chunk.file == nullptr || chunk.file->name.empty())
            {
                return errc::invalid_argument;
            }

            std::optional<limited_stream> raw;
            if (stream != nullptr)
            {
                // a local source stores the chunk uncompressed
                raw.emplace(*stream, readingFromLocalFile
                                             ? chunk.uncompressed_size
                                             : chunk.compressed_size);
            }

            auto compression = partCompression;
            blob_stream *reader = nullptr;
            if (chunk.hole && compression != compressed_file_type::hole)
            {
                // the zeros were fetched as part of a merged range
                CHUNKDIFF_TRY(skip_rest(*raw));
                compression = compressed_file_type::hole;
            }
            else if (compression != compressed_file_type::hole)
            {
                CHUNKDIFF_TRY(auto &&dec, decoder_for(partCompression));
                dec->reset(*raw);
                reader = dec;
            }

            CHUNKDIFF_TRY(switch_file(*chunk.file));
            if (compression == compressed_file_type::hole)
            {
                CHUNKDIFF_TRY(mDestination->append_hole(chunk.uncompressed_size));
            }
            else
            {
                CHUNKDIFF_TRY(mDestination->append_from(*reader,
                                                        chunk.uncompressed_size));
            }
            if (raw)
            {
                CHUNKDIFF_TRY(skip_rest(*raw));
            }
        }
        return oc::success();
    }

    auto decoder_for(compressed_file_type compression) -> result<decoder *>
    {
        if (compression == compressed_file_type::none)
        {
            return &mIdentity;
        }
        if (!mDecoder)
        {
            CHUNKDIFF_TRY(mDecoder, make_decoder(mFileType));
        }
        return mDecoder.get();
    }

    auto switch_file(file_metadata const &file) -> result<void>
    {
        if (mDestination && mDestination->metadata().name == file.name)
        {
            return oc::success();
        }
        if (mDestination)
        {
            auto previous = std::move(*mDestination);
            mDestination.reset();
            CHUNKDIFF_TRY(previous.close());
        }
        CHUNKDIFF_TRY(auto &&opened, destination_file::open(
                                             mCtx, file, mSkipValidation,
                                             &mRecorder));
        mDestination.emplace(std::move(opened));
        return oc::success();
    }

    entry_context const &mCtx;
    compressed_file_type mFileType;
    bool mSkipValidation;
    fs_verity_recorder &mRecorder;
    std::unique_ptr<decoder> mDecoder;
    identity_decoder mIdentity;
    std::optional<destination_file> mDestination;
};

auto retrieve_missing_files(blob_source &source,
                            entry_context const &ctx,
                            std::vector<missing_part> parts,
                            differ_tuning const &tuning,
                            compressed_file_type fileType,
                            bool skipValidation,
                            fs_verity_recorder &recorder) -> result<void>
{
    parts = merge_missing_chunks(std::move(parts), tuning.max_missing_chunks,
                                 tuning.auto_merge_threshold);
    auto ranges = remote_ranges(parts);

    std::unique_ptr<blob_fan_in> fanIn;
    while (!ranges.empty())
    {
        auto fetchRx = source.fetch(ranges);
        if (fetchRx.has_value())
        {
            CHUNKDIFF_TRY(fanIn, blob_fan_in::start(
                                         std::move(fetchRx).assume_value(),
                                         ranges.size()));
            break;
        }
        if (!(fetchRx.assume_error() == chunked_errc::bad_request)
            || ranges.size() == 1U)
        {
            return std::move(fetchRx).as_failure();
        }

        auto const numRequested = ranges.size();
        SPDLOG_DEBUG("the blob source rejected {} ranges, merging them",
                     numRequested);
        parts = merge_missing_chunks(std::move(parts), numRequested / 2U,
                                     tuning.auto_merge_threshold);
        ranges = remote_ranges(parts);
        if (ranges.size() >= numRequested)
        {
            return std::move(fetchRx).as_failure();
        }
    }

    missing_files_writer writer(ctx, fileType, skipValidation, recorder);
    CHUNKDIFF_TRY(writer.store(parts, fanIn.get()));
    if (fanIn)
    {
        CHUNKDIFF_TRY(fanIn->drain());
    }
    return oc::success();
}

auto create_flat_directories(int rootFd,
                             std::span<file_metadata const> entries)
        -> result<void>
{
    std::set<std::string, std::less<>> created;
    for (auto const &entry : entries)
    {
        auto const slash = entry.name.rfind('/');
        if (slash == std::string::npos)
        {
            continue;
        }
        auto dir = entry.name.substr(0, slash);
        if (created.contains(dir))
        {
            continue;
        }
        if (::mkdirat(rootFd, dir.c_str(), 0755) != 0 && errno != EEXIST)
        {
            return collect_system_error();
        }
        created.insert(std::move(dir));
    }
    return oc::success();
}

// creating the children of a directory changes its modification time
auto restore_dir_times(int rootFd, file_metadata const &dir) -> result<void>
{
    if (dir.skip_set_attrs || (!dir.modtime && !dir.accesstime))
    {
        return oc::success();
    }
    unique_fd fd;
    if (dir.name == "/")
    {
        fd.reset(::openat(rootFd, ".", O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        if (!fd)
        {
            return collect_system_error();
        }
    }
    else
    {
        CHUNKDIFF_TRY(fd, open_file_under_root(
                                  rootFd, dir.name,
                                  O_RDONLY | O_DIRECTORY | O_CLOEXEC, 0));
    }
    timespec const times[2] = {to_timespec(dir.accesstime),
                               to_timespec(dir.modtime)};
    if (::futimens(fd.get(), times) != 0)
    {
        return collect_system_error();
    }
    return oc::success();
}

auto to_bytes(std::string_view data) -> std::vector<std::byte>
{
    auto const bytes = as_bytes(data);
    return {bytes.begin(), bytes.end()};
}

} // namespace
} // namespace detail

chunked_differ::chunked_differ(std::shared_ptr<layers_cache> cache,
                               std::shared_ptr<blob_source> source,
                               chunked_layer layer,
                               pull_options options,
                               differ_tuning tuning)
    : mCache(std::move(cache))
    , mSource(std::move(source))
    , mLayer(std::move(layer))
    , mOptions(std::move(options))
    , mTuning(std::move(tuning))
    , mBlobDigest()
{
}

chunked_differ::chunked_differ(std::shared_ptr<layers_cache> cache,
                               std::shared_ptr<blob_source> source,
                               std::string_view blobDigest,
                               std::uint64_t blobSize,
                               pull_options options,
                               differ_tuning tuning)
    : mCache(std::move(cache))
    , mSource(std::move(source))
    , mLayer()
    , mOptions(std::move(options))
    , mTuning(std::move(tuning))
    , mBlobDigest(blobDigest)
    , mBlobSize(blobSize)
    , mConvert(true)
{
    mLayer.file_type = compressed_file_type::none;
}

auto chunked_differ::converting(std::shared_ptr<layers_cache> cache,
                                std::shared_ptr<blob_source> source,
                                std::string_view blobDigest,
                                std::uint64_t blobSize,
                                pull_options options,
                                differ_tuning tuning)
        -> std::unique_ptr<chunked_differ>
{
    return std::unique_ptr<chunked_differ>(
            new chunked_differ(std::move(cache), std::move(source), blobDigest,
                               blobSize, std::move(options),
                               std::move(tuning)));
}

auto chunked_differ::apply_diff(std::filesystem::path const &target,
                                tar_options const &options,
                                differ_options const &differOptions)
        -> result<differ_output>
{
    if (mUsed)
    {
        return chunked_errc::differ_already_used;
    }
    mUsed = true;

    differ_output output;
    if (mConvert)
    {
        CHUNKDIFF_TRY(convert(target, output));
    }
    else if (!mLayer.tar_split
             && !mOptions.insecure_allow_unpredictable_image_contents)
    {
        SPDLOG_ERROR("the uncompressed digest of a layer without tar-split "
                     "can't be computed");
        return chunked_errc::fallback_can_convert;
    }

    CHUNKDIFF_TRY(reconstruct(target, options, differOptions, output));
    return output;
}

auto chunked_differ::convert(std::filesystem::path const &target,
                             differ_output &output) -> result<void>
{
    CHUNKDIFF_TRY(auto &&tmpDir, llfio::path(target));
    CHUNKDIFF_TRY(auto &&converted,
                  detail::convert_blob(*mSource, mBlobSize, mBlobDigest,
                                       tmpDir));

    CHUNKDIFF_TRY(auto &&tocDigest,
                  digest_of(as_bytes(std::string_view(converted.manifest_json))));
    mLayer.file_type = compressed_file_type::none;
    mLayer.toc_digest = std::move(tocDigest);
    mLayer.manifest = std::move(converted.manifest_json);
    mLayer.parsed = std::move(converted.manifest);
    mLayer.toc_offset = static_cast<std::uint64_t>(converted.tar_size);
    mLayer.tar_split = std::move(converted.tar_split);
    mLayer.tar_size = converted.tar_size;

    // every file has just been hashed during the conversion
    mSkipValidation = true;
    output.compressed_digest = mBlobDigest;
    output.uncompressed_digest = std::move(converted.uncompressed_digest);

    mSource = std::make_shared<file_blob_source>(std::move(converted.file));
    return oc::success();
}

auto chunked_differ::reconstruct(std::filesystem::path const &target,
                                 tar_options const &options,
                                 differ_options const &differOptions,
                                 differ_output &output) -> result<void>
{
    using namespace detail;

    output.toc_digest = mLayer.toc_digest;
    output.size = mLayer.tar_size;
    output.tar_split = mLayer.tar_split;
    output.manifest = mLayer.parsed;
    output.big_data.insert_or_assign(std::string(manifest_big_data_key),
                                     to_bytes(mLayer.manifest));
    output.big_data.insert_or_assign(
            std::string(layer_data_big_data_key),
            to_bytes(serialize_layer_data(differOptions.format)));

    CHUNKDIFF_TRY(auto &&mergedEntries,
                  merge_entries(mLayer.file_type,
                                static_cast<std::int64_t>(mLayer.toc_offset),
                                mLayer.parsed.entries));
    std::vector<file_metadata> entries = std::move(mergedEntries);

    std::tie(output.uids, output.gids) = collect_ids(entries);
    CHUNKDIFF_TRY(remap_ids(entries, options));

    unique_fd rootFd{::open(target.c_str(),
                            O_RDONLY | O_PATH | O_DIRECTORY | O_CLOEXEC)};
    if (!rootFd)
    {
        auto const error = collect_system_error();
        SPDLOG_ERROR("could not open the target directory {}",
                     target.string());
        return error;
    }

    std::optional<std::map<std::string, std::string>> flatNames;
    if (differOptions.format == output_format::flat)
    {
        flatNames.emplace();
        CHUNKDIFF_TRY(entries, make_entries_flat(std::move(entries),
                                                 &*flatNames));
        CHUNKDIFF_TRY(create_flat_directories(rootFd.get(), entries));
    }

    entry_context const ctx{rootFd.get(), options, mTuning.xattrs_to_ignore};
    fs_verity_recorder recorder(differOptions.fs_verity);

    // hard links may refer to files which are still missing
    std::vector<std::size_t> hardLinks;
    std::vector<std::size_t> directories;
    std::vector<std::size_t> copyJobs;
    std::int64_t totalChunksSize = 0;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        auto &r = entries[i];
        auto const mode = static_cast<mode_t>(r.mode);

        r.name = utils::clean_absolute_path(r.name);
        // symlink targets are kept verbatim
        if (!r.linkname.empty() && r.type != entry_type::symlink)
        {
            r.linkname = utils::clean_absolute_path(r.linkname);
        }

        switch (r.type)
        {
        case entry_type::reg:
            if (r.size == 0)
            {
                CHUNKDIFF_TRY(create_empty_file(ctx, mode, r));
                break;
            }
            totalChunksSize += r.size;
            copyJobs.push_back(i);
            break;

        case entry_type::dir:
            if (r.name == "/")
            {
                output.root_dir_mode = static_cast<std::uint32_t>(r.mode);
            }
            CHUNKDIFF_TRY(safe_mkdir(ctx, mode, r));
            directories.push_back(i);
            break;

        case entry_type::hardlink:
            hardLinks.push_back(i);
            break;

        case entry_type::symlink:
            CHUNKDIFF_TRY(safe_symlink(ctx, r));
            break;

        case entry_type::char_device:
        case entry_type::block_device:
        case entry_type::fifo:
            CHUNKDIFF_TRY(safe_mknod(ctx, mode, r));
            break;

        case entry_type::chunk:
        default:
            SPDLOG_ERROR("invalid entry type {} of {}", to_string(r.type),
                         r.name);
            return chunked_errc::unsupported_entry_type;
        }
    }

    dedup_options const dedupOptions{mOptions.use_hard_links,
                                     mOptions.ostree_repos};
    CHUNKDIFF_TRY(auto &&copyResults,
                  dedup_files(ctx, *mCache, entries, copyJobs, dedupOptions,
                              mTuning.copy_workers, recorder));

    std::vector<missing_part> missingParts;
    std::int64_t missingPartsSize = 0;
    for (auto &copyResult : copyResults)
    {
        if (copyResult.found.has_error())
        {
            return std::move(copyResult.found).as_failure();
        }
        if (copyResult.found.assume_value())
        {
            continue;
        }

        // the file is missing, look for its chunks one by one
        auto &r = entries[copyResult.index];
        missingPartsSize += r.size;
        auto remainingSize = r.size;
        for (auto const &chunk : r.chunks)
        {
            auto const compressedSize = chunk.end_offset - chunk.offset;
            auto const size
                    = chunk.chunk_size > 0 ? chunk.chunk_size : remainingSize;
            if (compressedSize < 0 || size < 0 || chunk.offset < 0)
            {
                SPDLOG_ERROR("invalid chunk at offset {} of {}",
                             chunk.chunk_offset, r.name);
                return chunked_errc::invalid_manifest;
            }
            remainingSize -= size;

            missing_part part;
            part.source = {static_cast<std::uint64_t>(chunk.offset),
                           static_cast<std::uint64_t>(compressedSize)};
            part.chunks.push_back(missing_file_chunk{
                    .file = &r,
                    .compressed_size = static_cast<std::uint64_t>(compressedSize),
                    .uncompressed_size = static_cast<std::uint64_t>(size)});

            if (chunk.chunk_type == chunk_kind::zeros)
            {
                missingPartsSize -= size;
                part.hole = true;
                for (auto &fileChunk : part.chunks)
                {
                    fileChunk.hole = true;
                }
            }
            else
            {
                CHUNKDIFF_TRY(auto &&hit,
                              mCache->find_chunk_in_other_layers(chunk));
                if (hit
                    && validate_chunk_checksum(chunk, hit->target.string(),
                                               hit->path, hit->offset))
                {
                    missingPartsSize -= size;
                    part.origin = origin_file{hit->target, hit->path,
                                              hit->offset};
                }
            }
            missingParts.push_back(std::move(part));
        }
    }

    if (!missingParts.empty())
    {
        CHUNKDIFF_TRY(retrieve_missing_files(*mSource, ctx,
                                             std::move(missingParts), mTuning,
                                             mLayer.file_type, mSkipValidation,
                                             recorder));
    }

    for (auto const i : hardLinks)
    {
        CHUNKDIFF_TRY(safe_link(ctx, static_cast<mode_t>(entries[i].mode),
                                entries[i]));
    }
    for (auto it = directories.rbegin(); it != directories.rend(); ++it)
    {
        CHUNKDIFF_TRY(restore_dir_times(rootFd.get(), entries[*it]));
    }

    if (output.uncompressed_digest.empty()
        && !mOptions.insecure_allow_unpredictable_image_contents)
    {
        // digest the staged tree as the tar stream a full pull would see
        CHUNKDIFF_TRY(auto &&splitEntries, parse_tar_split(*mLayer.tar_split));
        staged_file_getter files(rootFd.get(),
                                 flatNames ? &*flatNames : nullptr);
        CHUNKDIFF_TRY(auto &&hasher, digester::create());
        CHUNKDIFF_TRY(write_output_tar_stream(splitEntries, files, hasher));
        CHUNKDIFF_TRY(output.uncompressed_digest, hasher.finish());
    }

    if (totalChunksSize > 0)
    {
        SPDLOG_DEBUG("Missing {} bytes out of {} ({:.2f} %)", missingPartsSize,
                     totalChunksSize,
                     static_cast<double>(missingPartsSize) * 100.0
                             / static_cast<double>(totalChunksSize));
    }

    output.fs_verity_digests = recorder.take_digests();
    return oc::success();
}

namespace
{

auto make_proper_differ(std::shared_ptr<layers_cache> const &cache,
                        std::shared_ptr<blob_source> const &source,
                        std::string_view blobDigest,
                        std::uint64_t blobSize,
                        annotation_map const &annotations,
                        pull_options const &options,
                        differ_tuning const &tuning)
        -> result<std::unique_ptr<chunked_differ>>
{
    auto const zstdIt
            = annotations.find(detail::zstd_chunked_manifest_checksum_key);
    auto const estargzIt = annotations.find(detail::estargz_toc_digest_key);
    bool const hasZstdChunkedToc = zstdIt != annotations.end();
    bool const hasEstargzToc = estargzIt != annotations.end();

    if (hasZstdChunkedToc && hasEstargzToc)
    {
        SPDLOG_ERROR("both zstd:chunked and eStargz TOC found in blob {}",
                     blobDigest);
        return chunked_errc::invalid_manifest;
    }

    if (hasZstdChunkedToc)
    {
        auto const &tocDigest = zstdIt->second;
        CHUNKDIFF_TRY(parse_digest(tocDigest));
        auto manifestRx = detail::read_zstd_chunked_manifest(
                *source, tocDigest, annotations);
        if (manifestRx.has_error())
        {
            SPDLOG_DEBUG("Could not create zstd:chunked differ for blob {}: {}",
                         blobDigest,
                         manifestRx.assume_error().message().c_str());
            return std::move(manifestRx).as_failure();
        }
        auto &manifest = manifestRx.assume_value();

        chunked_layer layer;
        layer.file_type = compressed_file_type::zstd_chunked;
        layer.toc_digest = tocDigest;
        layer.manifest = std::move(manifest.json);
        layer.parsed = std::move(manifest.parsed);
        layer.toc_offset = manifest.toc_offset;
        if (manifest.tar_split)
        {
            layer.tar_size
                    = detail::tar_size_from_tar_split(manifest.tar_split_entries);
            layer.tar_split = std::move(manifest.tar_split);
        }
        else if (!options.insecure_allow_unpredictable_image_contents)
        {
            SPDLOG_DEBUG("zstd:chunked layers without tar-split data don't "
                         "support partial pulls with guaranteed consistency "
                         "with non-partial pulls");
            return chunked_errc::fallback_can_convert;
        }

        SPDLOG_DEBUG("Created zstd:chunked differ for blob {}", blobDigest);
        return std::make_unique<chunked_differ>(cache, source, std::move(layer),
                                                options, tuning);
    }

    if (hasEstargzToc)
    {
        auto const &tocDigest = estargzIt->second;
        CHUNKDIFF_TRY(parse_digest(tocDigest));
        if (!options.insecure_allow_unpredictable_image_contents)
        {
            SPDLOG_DEBUG("estargz layers don't support partial pulls with "
                         "guaranteed consistency with non-partial pulls");
            return chunked_errc::fallback_can_convert;
        }
        auto manifestRx
                = detail::read_estargz_manifest(*source, blobSize, tocDigest);
        if (manifestRx.has_error())
        {
            SPDLOG_DEBUG("Could not create estargz differ for blob {}: {}",
                         blobDigest,
                         manifestRx.assume_error().message().c_str());
            return std::move(manifestRx).as_failure();
        }
        auto &manifest = manifestRx.assume_value();

        chunked_layer layer;
        layer.file_type = compressed_file_type::estargz;
        layer.toc_digest = tocDigest;
        layer.manifest = std::move(manifest.json);
        layer.parsed = std::move(manifest.parsed);
        layer.toc_offset = manifest.toc_offset;

        SPDLOG_DEBUG("Created eStargz differ for blob {}", blobDigest);
        return std::make_unique<chunked_differ>(cache, source, std::move(layer),
                                                options, tuning);
    }

    if (options.convert_images)
    {
        SPDLOG_DEBUG("no TOC found in blob {}", blobDigest);
    }
    else
    {
        SPDLOG_DEBUG("no TOC found in blob {} and convert_images is not "
                     "configured",
                     blobDigest);
    }
    return chunked_errc::fallback_can_convert;
}

} // namespace

auto make_differ(std::shared_ptr<layers_cache> cache,
                 std::shared_ptr<blob_source> source,
                 std::string_view blobDigest,
                 std::uint64_t blobSize,
                 annotation_map const &annotations,
                 pull_options const &options,
                 differ_tuning const &tuning)
        -> result<std::unique_ptr<chunked_differ>>
{
    if (!options.enable_partial_images)
    {
        SPDLOG_DEBUG("partial images are disabled");
        return chunked_errc::fallback_recommended;
    }
    CHUNKDIFF_TRY(cache->load());

    auto differRx = make_proper_differ(cache, source, blobDigest, blobSize,
                                       annotations, options, tuning);
    if (differRx.has_value())
    {
        return differRx;
    }

    auto const &error = differRx.assume_error();
    bool const canConvert = error == chunked_errc::fallback_can_convert;
    if (!options.convert_images
        || !(canConvert || error == chunked_errc::fallback_recommended))
    {
        return std::move(differRx).as_failure();
    }
    if (!canConvert)
    {
        SPDLOG_ERROR("neither a partial pull nor convert_images is possible "
                     "for blob {}: {}",
                     blobDigest, error.message().c_str());
        return chunked_errc::unsupported_format;
    }

    SPDLOG_DEBUG("Created differ to convert blob {}", blobDigest);
    return chunked_differ::converting(std::move(cache), std::move(source),
                                      blobDigest, blobSize, options, tuning);
}

} // namespace chunkdiff
