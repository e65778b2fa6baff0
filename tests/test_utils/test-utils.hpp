#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "boost-unit-test.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/digest.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/layer_store.hpp>
#include <chunkdiff/llfio.hpp>

SYSTEM_ERROR2_NAMESPACE_BEGIN

inline auto operator<<(std::ostream &s, status_code<void> const &sc)
        -> std::ostream &
{
    fmt::print(s, "[{}|{}]", sc.domain().name().c_str(), sc.message().c_str());
    return s;
}
inline auto operator<<(std::ostream &s, errc c) -> std::ostream &
{
    return operator<<(s, make_status_code(c));
}

SYSTEM_ERROR2_NAMESPACE_END

namespace chunkdiff
{

inline auto boost_test_print_type(std::ostream &s, chunked_errc c)
        -> std::ostream &
{
    return operator<<(s, make_status_code(c));
}

inline auto boost_test_print_type(std::ostream &s, blob_range const &range)
        -> std::ostream &
{
    fmt::print(s, "[{}, +{}]", range.offset, range.length);
    return s;
}

template <typename T>
inline auto check_result(result<T> const &rx)
        -> boost::test_tools::predicate_result
{
    if (!rx)
    {
        boost::test_tools::predicate_result prx{false};
        prx.message() << rx.assume_error();
        return prx;
    }
    return true;
}
} // namespace chunkdiff

#define TEST_RESULT(...) BOOST_TEST((::chunkdiff::check_result((__VA_ARGS__))))
#define TEST_RESULT_REQUIRE(...)                                               \
    BOOST_TEST_REQUIRE((::chunkdiff::check_result((__VA_ARGS__))))

namespace std
{

inline auto boost_test_print_type(std::ostream &s, std::byte b)
        -> std::ostream &
{
    fmt::print(s, FMT_STRING("{:x}"), static_cast<std::uint8_t>(b));
    return s;
}

} // namespace std

namespace chunkdiff_tests
{

extern chunkdiff::llfio::path_handle const current_path;

auto to_blob(std::string_view data) -> std::vector<std::byte>;
auto sha256_of(std::string_view data) -> std::string;

/**
 * @brief A directory below the system temp directory which is removed
 * recursively on destruction.
 */
class temp_directory
{
public:
    temp_directory();
    ~temp_directory();

    temp_directory(temp_directory const &) = delete;
    auto operator=(temp_directory const &) -> temp_directory & = delete;

    [[nodiscard]] auto path() const -> std::filesystem::path const &
    {
        return mPath;
    }

    void write_file(std::string_view name, std::string_view content) const;
    [[nodiscard]] auto read_file(std::string_view name) const -> std::string;

private:
    std::filesystem::path mPath;
};

/**
 * @brief Creates an anonymous file with the given content.
 */
auto make_temp_file(chunkdiff::ro_dynblob content)
        -> chunkdiff::llfio::file_handle;

//! a single zstd frame
auto zstd_compress(chunkdiff::ro_dynblob data) -> std::vector<std::byte>;
//! a single gzip member
auto gzip_compress(chunkdiff::ro_dynblob data) -> std::vector<std::byte>;

/**
 * @brief Serves ranges of an in memory blob and records every request.
 *
 * Requests with more than max_ranges ranges are rejected with
 * chunked_errc::bad_request.
 */
class memory_blob_source final : public chunkdiff::blob_source
{
public:
    explicit memory_blob_source(std::vector<std::byte> data)
        : mData(std::move(data))
    {
    }

    auto fetch(std::span<chunkdiff::blob_range const> ranges)
            -> chunkdiff::result<chunkdiff::blob_channels> override;

    [[nodiscard]] auto requests() const
            -> std::vector<std::vector<chunkdiff::blob_range>>
    {
        std::lock_guard lock(mMutex);
        return mRequests;
    }
    [[nodiscard]] auto data() const noexcept -> std::vector<std::byte> const &
    {
        return mData;
    }

    std::optional<std::size_t> max_ranges;

private:
    std::vector<std::byte> mData;
    mutable std::mutex mMutex;
    std::vector<std::vector<chunkdiff::blob_range>> mRequests;
};

/**
 * @brief Keeps layers and their big data in memory.
 */
class memory_layer_store final : public chunkdiff::layer_store
{
public:
    struct layer_entry
    {
        chunkdiff::layer_record record;
        std::filesystem::path target;
        std::map<std::string, std::vector<std::byte>, std::less<>> big_data;
    };

    void add_layer(chunkdiff::layer_record record,
                   std::filesystem::path target);
    void put_big_data(std::string_view layerId,
                      std::string_view key,
                      std::string_view data);
    void touch() noexcept
    {
        ++mStamp;
    }

    auto layers() -> chunkdiff::result<std::vector<chunkdiff::layer_record>>
            override;
    auto read_big_data(std::string_view layerId, std::string_view key)
            -> chunkdiff::result<std::vector<std::byte>> override;
    auto big_data_path(std::string_view layerId, std::string_view key)
            -> chunkdiff::result<std::optional<std::filesystem::path>>
            override;
    auto set_big_data(std::string_view layerId,
                      std::string_view key,
                      chunkdiff::ro_dynblob data)
            -> chunkdiff::result<void> override;
    auto differ_target(std::string_view layerId)
            -> chunkdiff::result<std::filesystem::path> override;
    auto modification_stamp() -> chunkdiff::result<std::uint64_t> override;
    auto pull_option_values()
            -> std::map<std::string, std::string, std::less<>> override;

    std::map<std::string, std::string, std::less<>> options;

private:
    auto find(std::string_view layerId) -> layer_entry *;

    std::vector<layer_entry> mLayers;
    std::uint64_t mStamp{1U};
};

/**
 * @brief Writes ustar archives.
 */
class tar_builder
{
public:
    auto add_file(std::string_view name,
                  std::string_view content,
                  unsigned mode = 0644) -> tar_builder &;
    auto add_dir(std::string_view name, unsigned mode = 0755)
            -> tar_builder &;
    auto add_symlink(std::string_view name, std::string_view target)
            -> tar_builder &;
    auto add_hardlink(std::string_view name, std::string_view target)
            -> tar_builder &;

    //! appends the two terminating zero blocks
    [[nodiscard]] auto finish() const -> std::vector<std::byte>;

    std::uint32_t uid = 0U;
    std::uint32_t gid = 0U;
    std::int64_t mtime = 1700000000;

private:
    void add_header(std::string_view name,
                    char typeflag,
                    unsigned mode,
                    std::size_t size,
                    std::string_view linkname);
    void add_data(std::string_view content);

    std::vector<std::byte> mData;
};

} // namespace chunkdiff_tests
