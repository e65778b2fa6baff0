#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff::detail
{

inline constexpr std::size_t tar_block_size = 512U;

/**
 * @brief The decoded header of a tar member including the PAX and GNU
 * extensions which precede it.
 */
struct tar_header
{
    entry_type type = entry_type::reg;
    std::string name;
    std::string linkname;
    std::int64_t mode = 0;
    std::int64_t uid = 0;
    std::int64_t gid = 0;
    std::int64_t size = 0;
    std::optional<file_time> modtime;
    std::optional<file_time> accesstime;
    std::optional<file_time> changetime;
    std::int64_t devmajor = 0;
    std::int64_t devminor = 0;
    // SCHILY.xattr records, raw values
    std::map<std::string, std::string> xattrs;
};

struct tar_member
{
    tar_header header;
    //! the stream position of the first extension or header block
    std::uint64_t header_offset;
    //! the stream position of the member data
    std::uint64_t data_offset;
};

/**
 * @brief Sequentially decodes a tar stream.
 */
class tar_reader
{
public:
    explicit tar_reader(blob_stream &source) noexcept;

    /**
     * @brief Skips the rest of the current member and decodes the next
     * header.
     * @return an empty optional at the end of the archive
     */
    auto next() -> result<std::optional<tar_member>>;

    /**
     * @brief Reads data of the current member, returns zero at its end.
     */
    auto read(rw_dynblob buffer) -> result<std::size_t>;

    [[nodiscard]] auto position() const noexcept -> std::uint64_t
    {
        return mPosition;
    }

private:
    using block = std::array<std::byte, tar_block_size>;

    auto read_block(block &out) -> result<bool>;
    auto read_extension(std::int64_t size) -> result<std::string>;
    auto skip(std::uint64_t size) -> result<void>;

    blob_stream &mSource;
    std::uint64_t mPosition;
    std::uint64_t mRemaining;
    std::uint64_t mPadding;
    bool mDone;
};

/**
 * @brief Converts a tar header to a table of contents entry, xattr values
 * are base64 encoded.
 */
auto to_file_entry(tar_header const &header) -> file_entry;

} // namespace chunkdiff::detail
