#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/crc.hpp>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/digest.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/toc.hpp>

#include "../fs/unique_fd.hpp"

namespace chunkdiff::detail
{

//! CRC-64 with the ISO polynomial, reflected, as used for file payloads
using tar_split_crc = boost::crc_optimal<64,
                                         0x000000000000001BULL,
                                         0xFFFFFFFFFFFFFFFFULL,
                                         0xFFFFFFFFFFFFFFFFULL,
                                         true,
                                         true>;

enum class tar_split_entry_type
{
    file = 1,
    segment = 2,
};

/**
 * @brief One line of a tar-split stream.
 *
 * A segment carries raw bytes of the tar stream, i.e. headers and padding.
 * A file stands for the content of a member and carries the big endian
 * CRC-64 of that content as its payload.
 */
struct tar_split_entry
{
    tar_split_entry_type type = tar_split_entry_type::segment;
    std::string name;
    std::int64_t size = 0;
    std::vector<std::byte> payload;
    std::int64_t position = 0;
};

/**
 * @brief Decodes the JSON lines of a tar-split stream.
 */
auto parse_tar_split(std::string_view data)
        -> result<std::vector<tar_split_entry>>;

/**
 * @brief Builds a tar-split stream.
 */
class tar_split_writer
{
public:
    void add_segment(ro_dynblob data);
    void add_file(std::string_view name,
                  std::int64_t size,
                  std::uint64_t checksum);

    [[nodiscard]] auto data() const noexcept -> std::string const &
    {
        return mData;
    }

private:
    std::string mData;
    std::int64_t mPosition{0};
};

/**
 * @brief The size of the tar stream described by a tar-split.
 */
auto tar_size_from_tar_split(std::span<tar_split_entry const> entries)
        -> std::int64_t;

/**
 * @brief Provides the content of the files named by a tar-split.
 */
class file_getter
{
public:
    virtual ~file_getter() = default;

    virtual auto get(std::string_view name) -> result<unique_fd> = 0;
};

/**
 * @brief Opens files in a staged directory tree without leaving it.
 *
 * With a name map the cleaned tar names are translated first, which is
 * needed for flat trees.
 */
class staged_file_getter final : public file_getter
{
public:
    staged_file_getter(int rootFd,
                       std::map<std::string, std::string> const *nameMap)
        : mRootFd(rootFd)
        , mNameMap(nameMap)
    {
    }

    auto get(std::string_view name) -> result<unique_fd> override;

private:
    int mRootFd;
    std::map<std::string, std::string> const *mNameMap;
};

/**
 * @brief Replays the tar stream described by @p entries into @p out.
 *
 * The content of every file is checked against its size and CRC-64.
 */
auto write_output_tar_stream(std::span<tar_split_entry const> entries,
                             file_getter &files,
                             digester &out) -> result<void>;

/**
 * @brief Decodes the member headers embedded in the segments of a
 * tar-split.
 */
auto tar_split_headers(std::span<tar_split_entry const> entries)
        -> result<std::vector<file_entry>>;

/**
 * @brief Checks that the table of contents and the tar-split describe
 * exactly the same members with equal metadata.
 *
 * Fails with chunked_errc::tar_split_mismatch otherwise, duplicate paths
 * in the table of contents are rejected as well.
 */
auto ensure_toc_matches_tar_split(toc const &manifest,
                                  std::span<tar_split_entry const> entries)
        -> result<void>;

} // namespace chunkdiff::detail
