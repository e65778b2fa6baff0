#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/llfio.hpp>
#include <chunkdiff/span.hpp>
#include <chunkdiff/utils/channel.hpp>

namespace chunkdiff
{

/**
 * @brief A byte range of a blob.
 */
struct blob_range
{
    std::uint64_t offset;
    std::uint64_t length;

    friend auto operator==(blob_range const &, blob_range const &) noexcept
            -> bool = default;
};

/**
 * @brief A sequential reader, closed on destruction.
 */
class blob_stream
{
public:
    virtual ~blob_stream() = default;

    /**
     * @brief Reads at most buffer.size() bytes.
     * @return the number of bytes read, zero at the end of the stream
     */
    virtual auto read_some(rw_dynblob buffer) -> result<std::size_t> = 0;
};

using blob_stream_ptr = std::unique_ptr<blob_stream>;

/**
 * @brief The two channels a blob_source delivers the requested ranges on.
 *
 * Both channels share one signal in order to be waited on together. The
 * source closes both channels after it delivered at most one item per
 * requested range.
 */
struct blob_channels
{
    std::shared_ptr<utils::channel<blob_stream_ptr>> streams;
    std::shared_ptr<utils::channel<system_error::error>> errors;
};

auto make_blob_channels() -> blob_channels;

/**
 * @brief A remote blob which can be read in ranges.
 */
class blob_source
{
public:
    virtual ~blob_source() = default;

    /**
     * @brief Requests the given ranges, the streams are delivered in request
     * order.
     *
     * Fails with chunked_errc::bad_request if the ranges should be merged
     * into fewer requests.
     */
    virtual auto fetch(std::span<blob_range const> ranges)
            -> result<blob_channels> = 0;
};

/**
 * @brief Fills @p buffer unless the stream ends early.
 * @return the number of bytes read
 */
auto read_full(blob_stream &stream, rw_dynblob buffer) -> result<std::size_t>;

/**
 * @brief Skips @p size bytes of the stream.
 *
 * Fails with chunked_errc::not_enough_data if the stream ends early.
 */
auto discard(blob_stream &stream, std::uint64_t size) -> result<void>;

/**
 * @brief Reads a range of a file which must outlive the stream.
 */
class file_range_stream final : public blob_stream
{
public:
    file_range_stream(llfio::file_handle &file, blob_range range) noexcept
        : mFile(file)
        , mPosition(range.offset)
        , mRemaining(range.length)
    {
    }

    auto read_some(rw_dynblob buffer) -> result<std::size_t> override;

private:
    llfio::file_handle &mFile;
    std::uint64_t mPosition;
    std::uint64_t mRemaining;
};

/**
 * @brief Serves ranges of a local file.
 */
class file_blob_source final : public blob_source
{
public:
    explicit file_blob_source(llfio::file_handle file) noexcept;

    auto fetch(std::span<blob_range const> ranges)
            -> result<blob_channels> override;

    auto size() const -> result<std::uint64_t>;

    [[nodiscard]] auto file() noexcept -> llfio::file_handle &
    {
        return mFile;
    }

private:
    llfio::file_handle mFile;
};

/**
 * @brief A stream over a memory region which must outlive the stream.
 */
class memory_blob_stream final : public blob_stream
{
public:
    explicit memory_blob_stream(ro_dynblob data) noexcept
        : mData(data)
    {
    }

    auto read_some(rw_dynblob buffer) -> result<std::size_t> override
    {
        auto const rest = copy(mData, buffer);
        auto const n = buffer.size() - rest.size();
        mData = mData.subspan(n);
        return n;
    }

private:
    ro_dynblob mData;
};

} // namespace chunkdiff
