#include <chunkdiff/blob_source.hpp>

#include <algorithm>
#include <array>

namespace chunkdiff
{

auto file_range_stream::read_some(rw_dynblob buffer) -> result<std::size_t>
{
    auto const n = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), mRemaining));
    if (n == 0U)
    {
        return 0U;
    }
    llfio::io_handle::buffer_type buffers[] = {{buffer.data(), n}};
    CHUNKDIFF_TRY(auto &&filled, mFile.read({buffers, mPosition}));

    std::size_t readBytes = 0U;
    for (auto const &b : filled)
    {
        readBytes += b.size();
    }
    mPosition += readBytes;
    mRemaining -= readBytes;
    return readBytes;
}

auto make_blob_channels() -> blob_channels
{
    auto signal = std::make_shared<utils::channel_signal>();
    return {
            std::make_shared<utils::channel<blob_stream_ptr>>(signal),
            std::make_shared<utils::channel<system_error::error>>(signal),
    };
}

auto read_full(blob_stream &stream, rw_dynblob buffer) -> result<std::size_t>
{
    std::size_t filled = 0U;
    while (filled < buffer.size())
    {
        CHUNKDIFF_TRY(auto &&n, stream.read_some(buffer.subspan(filled)));
        if (n == 0U)
        {
            break;
        }
        filled += n;
    }
    return filled;
}

auto discard(blob_stream &stream, std::uint64_t size) -> result<void>
{
    std::array<std::byte, 1 << 14> scratch;
    while (size > 0U)
    {
        auto const chunk = static_cast<std::size_t>(
                std::min<std::uint64_t>(size, scratch.size()));
        CHUNKDIFF_TRY(auto &&n,
                      stream.read_some(rw_dynblob(scratch).first(chunk)));
        if (n == 0U)
        {
            return chunked_errc::not_enough_data;
        }
        size -= n;
    }
    return oc::success();
}

file_blob_source::file_blob_source(llfio::file_handle file) noexcept
    : mFile(std::move(file))
{
}

auto file_blob_source::size() const -> result<std::uint64_t>
{
    CHUNKDIFF_TRY(auto &&extent, mFile.maximum_extent());
    return static_cast<std::uint64_t>(extent);
}

auto file_blob_source::fetch(std::span<blob_range const> ranges)
        -> result<blob_channels>
{
    CHUNKDIFF_TRY(auto &&fileSize, size());
    for (auto const &range : ranges)
    {
        if (range.offset > fileSize || range.length > fileSize - range.offset)
        {
            return chunked_errc::bad_request;
        }
    }

    auto channels = make_blob_channels();
    for (auto const &range : ranges)
    {
        (void)channels.streams->send(
                std::make_unique<file_range_stream>(mFile, range));
    }
    channels.streams->close();
    channels.errors->close();
    return channels;
}

} // namespace chunkdiff
