#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <zlib.h>
#include <zstd.h>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/span.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff::detail
{

/**
 * @brief Reads at most a fixed number of bytes from another stream.
 */
class limited_stream final : public blob_stream
{
public:
    limited_stream(blob_stream &source, std::uint64_t limit) noexcept
        : mSource(source)
        , mRemaining(limit)
    {
    }

    auto read_some(rw_dynblob buffer) -> result<std::size_t> override;

    [[nodiscard]] auto remaining() const noexcept -> std::uint64_t
    {
        return mRemaining;
    }

private:
    blob_stream &mSource;
    std::uint64_t mRemaining;
};

/**
 * @brief Decompresses a stream of one or more concatenated frames.
 *
 * A decoder is reset onto a new source for every chunk and can be reused
 * afterwards, the source must outlive the decoding.
 */
class decoder : public blob_stream
{
public:
    virtual void reset(blob_stream &source) = 0;
};

class zstd_decoder final : public decoder
{
public:
    ~zstd_decoder() noexcept override;
    zstd_decoder(zstd_decoder const &) = delete;
    auto operator=(zstd_decoder const &) -> zstd_decoder & = delete;

    static auto create() -> result<std::unique_ptr<zstd_decoder>>;

    void reset(blob_stream &source) override;
    auto read_some(rw_dynblob buffer) -> result<std::size_t> override;

private:
    explicit zstd_decoder(ZSTD_DCtx *ctx);

    ZSTD_DCtx *mCtx;
    blob_stream *mSource{nullptr};
    std::vector<std::byte> mInput;
    ZSTD_inBuffer mInBuffer{nullptr, 0U, 0U};
    bool mSourceEof{false};
    // the return value of the last decompression call, 0 on a frame end
    std::size_t mFrameHint{0U};
};

class gzip_decoder final : public decoder
{
public:
    ~gzip_decoder() noexcept override;
    gzip_decoder(gzip_decoder const &) = delete;
    auto operator=(gzip_decoder const &) -> gzip_decoder & = delete;

    static auto create() -> result<std::unique_ptr<gzip_decoder>>;

    void reset(blob_stream &source) override;
    auto read_some(rw_dynblob buffer) -> result<std::size_t> override;

private:
    gzip_decoder();

    auto fill_input() -> result<bool>;

    z_stream mStream{};
    bool mInitialized{false};
    blob_stream *mSource{nullptr};
    std::vector<std::byte> mInput;
    bool mSourceEof{false};
    bool mMemberDone{false};
};

/**
 * @brief Passes the source through unchanged.
 */
class identity_decoder final : public decoder
{
public:
    void reset(blob_stream &source) override
    {
        mSource = &source;
    }
    auto read_some(rw_dynblob buffer) -> result<std::size_t> override
    {
        return mSource->read_some(buffer);
    }

private:
    blob_stream *mSource{nullptr};
};

/**
 * @brief Creates the decoder for the chunks of the given file type.
 */
auto make_decoder(compressed_file_type fileType)
        -> result<std::unique_ptr<decoder>>;

/**
 * @brief Decompresses a complete zstd buffer whose decompressed size is
 * known in advance.
 */
auto zstd_decompress(ro_dynblob compressed, std::uint64_t decompressedSize)
        -> result<std::vector<std::byte>>;

/**
 * @brief Decodes a complete buffer of unknown decompressed size.
 */
auto decode_all(decoder &dec, ro_dynblob compressed)
        -> result<std::vector<std::byte>>;

/**
 * @brief Decompresses a complete gzip buffer.
 */
auto gzip_decompress(ro_dynblob compressed) -> result<std::vector<std::byte>>;

} // namespace chunkdiff::detail
