#include "destination_file.hpp"

#include <algorithm>
#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "fs/fsverity.hpp"
#include "fs/under_root.hpp"

namespace chunkdiff::detail
{

auto fs_verity_recorder::record(std::string const &path, int fd)
        -> result<void>
{
    if (mMode == fs_verity_mode::disabled)
    {
        return oc::success();
    }
    if (auto enableRx = enable_fs_verity(fd); enableRx.has_error())
    {
        if (mMode == fs_verity_mode::if_possible
            && is_fs_verity_unsupported(enableRx.assume_error()))
        {
            SPDLOG_WARN("could not enable fs-verity for {}: {}", path,
                        enableRx.assume_error().message().c_str());
            return oc::success();
        }
        return std::move(enableRx).as_failure();
    }
    CHUNKDIFF_TRY(auto &&measurement, measure_fs_verity(fd));

    std::lock_guard lock{mMutex};
    mDigests.insert_or_assign(path, std::move(measurement));
    return oc::success();
}

auto fs_verity_recorder::take_digests() -> std::map<std::string, std::string>
{
    std::lock_guard lock{mMutex};
    return std::move(mDigests);
}

destination_file::destination_file(entry_context const &ctx,
                                   file_metadata const &metadata,
                                   unique_fd fd,
                                   std::optional<digester> hasher,
                                   fs_verity_recorder *recorder) noexcept
    : mCtx(&ctx)
    , mMetadata(&metadata)
    , mFd(std::move(fd))
    , mHasher(std::move(hasher))
    , mRecorder(recorder)
{
}

auto destination_file::open(entry_context const &ctx,
                            file_metadata const &metadata,
                            bool skipValidation,
                            fs_verity_recorder *recorder)
        -> result<destination_file>
{
    std::optional<digester> hasher;
    if (!skipValidation)
    {
        CHUNKDIFF_TRY(auto &&created, digester::create(metadata.digest));
        hasher.emplace(std::move(created));
    }
    CHUNKDIFF_TRY(auto &&fd, open_file_under_root(ctx.root_fd, metadata.name,
                                                  new_file_flags, 0));
    return destination_file(ctx, metadata, std::move(fd), std::move(hasher),
                            recorder);
}

auto destination_file::write(ro_dynblob data) -> result<void>
{
    if (mHasher)
    {
        CHUNKDIFF_TRY(mHasher->update(data));
    }
    while (!data.empty())
    {
        auto const n = ::write(mFd.get(), data.data(), data.size());
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return collect_system_error();
        }
        data = data.subspan(static_cast<std::size_t>(n));
    }
    return oc::success();
}

auto destination_file::append_from(blob_stream &source, std::uint64_t size)
        -> result<void>
{
    std::array<std::byte, 1 << 16> buffer;
    while (size > 0U)
    {
        auto const chunk = static_cast<std::size_t>(
                std::min<std::uint64_t>(size, buffer.size()));
        CHUNKDIFF_TRY(auto &&n,
                      source.read_some(rw_dynblob(buffer).first(chunk)));
        if (n == 0U)
        {
            return chunked_errc::not_enough_data;
        }
        CHUNKDIFF_TRY(write(ro_dynblob(buffer).first(n)));
        size -= n;
    }
    return oc::success();
}

auto destination_file::append_hole(std::uint64_t size) -> result<void>
{
    if (mHasher)
    {
        std::array<std::byte, 1 << 14> zeros{};
        for (auto remaining = size; remaining > 0U;)
        {
            auto const chunk = static_cast<std::size_t>(
                    std::min<std::uint64_t>(remaining, zeros.size()));
            CHUNKDIFF_TRY(mHasher->update(ro_dynblob(zeros).first(chunk)));
            remaining -= chunk;
        }
    }
    return detail::append_hole(mFd.get(), size);
}

auto destination_file::close() -> result<void>
{
    unique_fd fd = std::move(mFd);
    if (mHasher)
    {
        CHUNKDIFF_TRY(auto &&actual, mHasher->finish());
        mHasher.reset();
        if (actual != mMetadata->digest)
        {
            SPDLOG_ERROR("checksum mismatch for {} (got {} instead of {})",
                         mMetadata->name, actual, mMetadata->digest);
            return chunked_errc::checksum_mismatch;
        }
    }

    auto const mode = static_cast<mode_t>(mMetadata->mode);
    CHUNKDIFF_TRY(set_file_attrs(mCtx->root_fd, fd.get(), mode, *mMetadata,
                                 mCtx->options, mCtx->xattrs_to_ignore,
                                 false));

    if (mRecorder == nullptr || !mRecorder->enabled())
    {
        return oc::success();
    }
    // fs-verity can't be enabled while a writable descriptor is open
    CHUNKDIFF_TRY(auto &&readOnly, reopen_read_only(fd.get()));
    fd.reset();
    return mRecorder->record(mMetadata->name, readOnly.get());
}

} // namespace chunkdiff::detail
