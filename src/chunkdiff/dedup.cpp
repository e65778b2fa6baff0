#include "dedup.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>

#include "fs/file_attrs.hpp"
#include "fs/under_root.hpp"
#include "platform/thread_pool_gen.hpp"

namespace chunkdiff::detail
{

namespace
{

auto open_directory(std::string const &path, int flags) -> result<unique_fd>
{
    unique_fd fd{::open(path.c_str(), flags | O_CLOEXEC)};
    if (!fd)
    {
        return collect_system_error();
    }
    return std::move(fd);
}

auto copy_file_from_other_layer(file_metadata &file,
                                cache_hit const &hit,
                                int rootFd,
                                bool useHardLinks)
        -> result<std::optional<unique_fd>>
{
    CHUNKDIFF_TRY(auto &&srcRoot, open_directory(hit.target.string(), O_RDONLY));
    CHUNKDIFF_TRY(auto &&src, open_file_under_root(srcRoot.get(), hit.path,
                                                   O_RDONLY | O_CLOEXEC, 0));

    struct stat st;
    if (::fstat(src.get(), &st) != 0)
    {
        return collect_system_error();
    }
    if (!S_ISREG(st.st_mode) || st.st_size != file.size)
    {
        SPDLOG_DEBUG("{} in layer {} doesn't match the indexed file {}",
                     hit.path, hit.target.string(), file.name);
        return std::optional<unique_fd>{};
    }

    CHUNKDIFF_TRY(auto &&dst, copy_file_content(rootFd, src.get(), file, 0,
                                                useHardLinks));
    return std::optional<unique_fd>{std::move(dst)};
}

auto open_payload_link(std::filesystem::path const &sourceFile,
                       std::int64_t size) -> unique_fd
{
    struct stat st;
    if (::stat(sourceFile.c_str(), &st) != 0 || !S_ISREG(st.st_mode)
        || st.st_size != size)
    {
        return unique_fd{};
    }
    unique_fd fd{
            ::open(sourceFile.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC)};
    if (!fd)
    {
        SPDLOG_DEBUG("could not open {}: {}", sourceFile.string(),
                     collect_system_error().message().c_str());
    }
    return fd;
}

} // namespace

auto find_file_in_other_layers(layers_cache &cache,
                               file_metadata &file,
                               int rootFd,
                               bool useHardLinks)
        -> result<std::optional<unique_fd>>
{
    CHUNKDIFF_TRY(auto &&hit, cache.find_file_in_other_layers(file,
                                                              useHardLinks));
    if (!hit)
    {
        return std::optional<unique_fd>{};
    }
    return copy_file_from_other_layer(file, *hit, rootFd, useHardLinks);
}

auto find_file_in_ostree_repos(file_metadata &file,
                               std::span<std::string const> ostreeRepos,
                               int rootFd,
                               bool useHardLinks,
                               xattr_ignore_set const &xattrsToIgnore)
        -> result<std::optional<unique_fd>>
{
    auto parsedRx = parse_digest(file.digest);
    if (parsedRx.has_error())
    {
        SPDLOG_DEBUG("could not parse digest of {}: {}", file.name,
                     parsedRx.assume_error().message().c_str());
        return std::optional<unique_fd>{};
    }
    std::string payloadLink{parsedRx.assume_value().encoded};
    payloadLink += ".payload-link";

    for (auto const &repo : ostreeRepos)
    {
        if (repo.empty())
        {
            continue;
        }
        auto const sourceFile = std::filesystem::path(repo) / "objects"
                                / payloadLink.substr(0, 2)
                                / payloadLink.substr(2);
        auto src = open_payload_link(sourceFile, file.size);
        if (!src)
        {
            continue;
        }
        if (useHardLinks
            && !can_dedup_with_hard_link(file, src.get(), xattrsToIgnore))
        {
            continue;
        }

        auto copyRx = copy_file_content(rootFd, src.get(), file, 0,
                                        useHardLinks);
        if (copyRx.has_error())
        {
            SPDLOG_DEBUG("could not copy {} from {}: {}", file.name,
                         sourceFile.string(),
                         copyRx.assume_error().message().c_str());
            return std::optional<unique_fd>{};
        }
        return std::optional<unique_fd>{std::move(copyRx).assume_value()};
    }
    if (useHardLinks)
    {
        return find_file_in_ostree_repos(file, ostreeRepos, rootFd, false,
                                         xattrsToIgnore);
    }
    return std::optional<unique_fd>{};
}

namespace
{

auto finalize_file(entry_context const &ctx,
                   file_metadata const &file,
                   unique_fd dst,
                   mode_t mode,
                   fs_verity_recorder &recorder) -> result<void>
{
    if (!dst)
    {
        // hard linked, the existing inode keeps its attributes
        return oc::success();
    }
    CHUNKDIFF_TRY(set_file_attrs(ctx.root_fd, dst.get(), mode, file,
                                 ctx.options, ctx.xattrs_to_ignore, false));
    if (!recorder.enabled())
    {
        return oc::success();
    }
    CHUNKDIFF_TRY(auto &&readOnly, reopen_read_only(dst.get()));
    dst.reset();
    return recorder.record(file.name, readOnly.get());
}

} // namespace

auto find_and_copy_file(entry_context const &ctx,
                        layers_cache &cache,
                        file_metadata &file,
                        dedup_options const &options,
                        mode_t mode,
                        fs_verity_recorder &recorder) -> result<bool>
{
    CHUNKDIFF_TRY(auto &&fromLayer,
                  find_file_in_other_layers(cache, file, ctx.root_fd,
                                            options.use_hard_links));
    if (fromLayer)
    {
        CHUNKDIFF_TRY(finalize_file(ctx, file, std::move(*fromLayer), mode,
                                    recorder));
        return true;
    }

    CHUNKDIFF_TRY(auto &&fromRepo,
                  find_file_in_ostree_repos(file, options.ostree_repos,
                                            ctx.root_fd,
                                            options.use_hard_links,
                                            ctx.xattrs_to_ignore));
    if (fromRepo)
    {
        CHUNKDIFF_TRY(finalize_file(ctx, file, std::move(*fromRepo), mode,
                                    recorder));
        return true;
    }
    return false;
}

auto validate_chunk_checksum(file_entry const &chunk,
                             std::string const &root,
                             std::string const &path,
                             std::uint64_t offset) -> bool
{
    if (chunk.chunk_digest.empty())
    {
        return false;
    }
    auto rootRx = open_directory(root, O_PATH);
    if (rootRx.has_error())
    {
        return false;
    }
    auto fileRx = open_file_under_root(rootRx.assume_value().get(), path,
                                       O_RDONLY | O_CLOEXEC, 0);
    if (fileRx.has_error())
    {
        return false;
    }
    auto const fd = fileRx.assume_value().get();

    auto hasherRx = digester::create(chunk.chunk_digest);
    if (hasherRx.has_error())
    {
        return false;
    }
    auto &hasher = hasherRx.assume_value();

    std::array<std::byte, 1 << 16> buffer;
    auto position = static_cast<off_t>(offset);
    for (auto remaining = static_cast<std::uint64_t>(
                 std::max<std::int64_t>(chunk.chunk_size, 0));
         remaining > 0U;)
    {
        auto const want = static_cast<std::size_t>(
                std::min<std::uint64_t>(remaining, buffer.size()));
        auto const n = ::pread(fd, buffer.data(), want, position);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0)
        {
            break;
        }
        if (hasher.update(ro_dynblob(buffer).first(static_cast<std::size_t>(n)))
                    .has_error())
        {
            return false;
        }
        position += n;
        remaining -= static_cast<std::uint64_t>(n);
    }

    auto actualRx = hasher.finish();
    return actualRx.has_value() && actualRx.assume_value() == chunk.chunk_digest;
}

auto dedup_files(entry_context const &ctx,
                 layers_cache &cache,
                 std::span<file_metadata> entries,
                 std::span<std::size_t const> indices,
                 dedup_options const &options,
                 std::size_t numWorkers,
                 fs_verity_recorder &recorder)
        -> result<std::vector<dedup_job_result>>
{
    std::vector<dedup_job_result> results(indices.size());
    if (indices.empty())
    {
        return results;
    }

    numWorkers = std::clamp<std::size_t>(numWorkers, 1U, indices.size());
    std::unique_ptr<thread_pool_gen> pool;
    try
    {
        pool = std::make_unique<thread_pool_gen>(
                static_cast<unsigned>(numWorkers), "chunkdiff-copy");
    }
    catch (std::system_error const &exc)
    {
        SPDLOG_ERROR("failed to start the copy workers: {}", exc.what());
        return errc::resource_unavailable_try_again;
    }
    pooled_work_tracker tracker(pool.get());

    for (std::size_t njob = 0; njob < indices.size(); ++njob)
    {
        auto const index = indices[njob];
        results[njob].index = index;
        tracker.execute([&, njob, index] {
            auto &file = entries[index];
            results[njob].found
                    = find_and_copy_file(ctx, cache, file, options,
                                         static_cast<mode_t>(file.mode),
                                         recorder);
        });
    }
    tracker.wait();
    return results;
}

} // namespace chunkdiff::detail
