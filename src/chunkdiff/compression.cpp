#include "compression.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include <spdlog/spdlog.h>

namespace chunkdiff::detail
{

auto limited_stream::read_some(rw_dynblob buffer) -> result<std::size_t>
{
    if (mRemaining == 0U || buffer.empty())
    {
        return 0U;
    }
    auto const limit = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), mRemaining));
    CHUNKDIFF_TRY(auto &&n, mSource.read_some(buffer.first(limit)));
    mRemaining -= n;
    return n;
}

zstd_decoder::zstd_decoder(ZSTD_DCtx *ctx)
    : mCtx(ctx)
    , mInput(ZSTD_DStreamInSize())
{
}

zstd_decoder::~zstd_decoder() noexcept
{
    ZSTD_freeDCtx(mCtx);
}

auto zstd_decoder::create() -> result<std::unique_ptr<zstd_decoder>>
{
    auto *const ctx = ZSTD_createDCtx();
    if (ctx == nullptr)
    {
        return errc::not_enough_memory;
    }
    return std::unique_ptr<zstd_decoder>(new zstd_decoder(ctx));
}

void zstd_decoder::reset(blob_stream &source)
{
    ZSTD_DCtx_reset(mCtx, ZSTD_reset_session_only);
    mSource = &source;
    mInBuffer = {mInput.data(), 0U, 0U};
    mSourceEof = false;
    mFrameHint = 0U;
}

auto zstd_decoder::read_some(rw_dynblob buffer) -> result<std::size_t>
{
    if (buffer.empty())
    {
        return 0U;
    }
    ZSTD_outBuffer output{buffer.data(), buffer.size(), 0U};
    while (output.pos == 0U)
    {
        if (mInBuffer.pos == mInBuffer.size && !mSourceEof)
        {
            CHUNKDIFF_TRY(auto &&n, mSource->read_some(mInput));
            mInBuffer = {mInput.data(), n, 0U};
            mSourceEof = n == 0U;
        }
        if (mInBuffer.pos == mInBuffer.size && mSourceEof)
        {
            if (mFrameHint != 0U)
            {
                // the last frame is incomplete
                return chunked_errc::not_enough_data;
            }
            return 0U;
        }

        auto const hint = ZSTD_decompressStream(mCtx, &output, &mInBuffer);
        if (ZSTD_isError(hint) != 0U)
        {
            SPDLOG_DEBUG("zstd decompression failed: {}",
                         ZSTD_getErrorName(hint));
            return chunked_errc::corrupt_compressed_data;
        }
        mFrameHint = hint;
    }
    return output.pos;
}

gzip_decoder::gzip_decoder()
    : mInput(1 << 16)
{
}

gzip_decoder::~gzip_decoder() noexcept
{
    if (mInitialized)
    {
        inflateEnd(&mStream);
    }
}

auto gzip_decoder::create() -> result<std::unique_ptr<gzip_decoder>>
{
    std::unique_ptr<gzip_decoder> self(new gzip_decoder());
    // 16 selects the gzip wrapper
    if (inflateInit2(&self->mStream, MAX_WBITS + 16) != Z_OK)
    {
        return errc::not_enough_memory;
    }
    self->mInitialized = true;
    return self;
}

void gzip_decoder::reset(blob_stream &source)
{
    inflateReset(&mStream);
    mStream.next_in = nullptr;
    mStream.avail_in = 0U;
    mSource = &source;
    mSourceEof = false;
    mMemberDone = false;
}

auto gzip_decoder::fill_input() -> result<bool>
{
    if (mStream.avail_in > 0U)
    {
        return true;
    }
    if (mSourceEof)
    {
        return false;
    }
    CHUNKDIFF_TRY(auto &&n, mSource->read_some(mInput));
    mSourceEof = n == 0U;
    mStream.next_in = reinterpret_cast<Bytef *>(mInput.data());
    mStream.avail_in = static_cast<uInt>(n);
    return n != 0U;
}

auto gzip_decoder::read_some(rw_dynblob buffer) -> result<std::size_t>
{
    if (buffer.empty())
    {
        return 0U;
    }
    auto const outSize = static_cast<uInt>(std::min<std::size_t>(
            buffer.size(), std::numeric_limits<uInt>::max()));
    mStream.next_out = reinterpret_cast<Bytef *>(buffer.data());
    mStream.avail_out = outSize;

    while (mStream.avail_out == outSize)
    {
        CHUNKDIFF_TRY(auto &&hasInput, fill_input());
        if (!hasInput)
        {
            if (!mMemberDone)
            {
                return chunked_errc::not_enough_data;
            }
            return 0U;
        }
        if (mMemberDone)
        {
            // another gzip member follows
            inflateReset(&mStream);
            mMemberDone = false;
        }

        auto const rc = inflate(&mStream, Z_NO_FLUSH);
        if (rc == Z_STREAM_END)
        {
            mMemberDone = true;
        }
        else if (rc != Z_OK && rc != Z_BUF_ERROR)
        {
            SPDLOG_DEBUG("gzip decompression failed: {}",
                         mStream.msg != nullptr ? mStream.msg : "unknown");
            return chunked_errc::corrupt_compressed_data;
        }
    }
    return outSize - mStream.avail_out;
}

auto make_decoder(compressed_file_type fileType)
        -> result<std::unique_ptr<decoder>>
{
    switch (fileType)
    {
    case compressed_file_type::zstd_chunked:
    {
        CHUNKDIFF_TRY(auto &&zstd, zstd_decoder::create());
        return std::unique_ptr<decoder>(std::move(zstd));
    }
    case compressed_file_type::estargz:
    {
        CHUNKDIFF_TRY(auto &&gzip, gzip_decoder::create());
        return std::unique_ptr<decoder>(std::move(gzip));
    }
    case compressed_file_type::none:
        return std::unique_ptr<decoder>(std::make_unique<identity_decoder>());
    default:
        return chunked_errc::unsupported_format;
    }
}

auto zstd_decompress(ro_dynblob compressed, std::uint64_t decompressedSize)
        -> result<std::vector<std::byte>>
{
    std::vector<std::byte> decompressed(decompressedSize);
    auto const n = ZSTD_decompress(decompressed.data(), decompressed.size(),
                                   compressed.data(), compressed.size());
    if (ZSTD_isError(n) != 0U)
    {
        SPDLOG_DEBUG("zstd decompression failed: {}", ZSTD_getErrorName(n));
        return chunked_errc::corrupt_compressed_data;
    }
    if (n != decompressedSize)
    {
        return chunked_errc::corrupt_compressed_data;
    }
    return decompressed;
}

auto decode_all(decoder &dec, ro_dynblob compressed)
        -> result<std::vector<std::byte>>
{
    memory_blob_stream source(compressed);
    dec.reset(source);

    std::vector<std::byte> decompressed;
    std::array<std::byte, 1 << 14> buffer;
    for (;;)
    {
        CHUNKDIFF_TRY(auto &&n, dec.read_some(buffer));
        if (n == 0U)
        {
            return decompressed;
        }
        decompressed.insert(decompressed.end(), buffer.begin(),
                            buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
}

auto gzip_decompress(ro_dynblob compressed) -> result<std::vector<std::byte>>
{
    CHUNKDIFF_TRY(auto &&gzip, gzip_decoder::create());
    return decode_all(*gzip, compressed);
}

} // namespace chunkdiff::detail
