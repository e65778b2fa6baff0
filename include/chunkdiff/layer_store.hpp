#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/span.hpp>

namespace chunkdiff
{

//! the serialized cross layer index of a layer
inline constexpr std::string_view cache_big_data_key = "chunked-manifest-cache";
//! the table of contents of a chunked layer
inline constexpr std::string_view manifest_big_data_key
        = "zstd-chunked-manifest";
//! {"format": ...} describing the layout of a chunked layer
inline constexpr std::string_view layer_data_big_data_key
        = "zstd-chunked-layer-data";

struct layer_record
{
    std::string id;
    //! the layer lives in an additional read only store
    bool read_only = false;
};

/**
 * @brief The bookkeeping of the locally stored layers.
 *
 * Missing big data items are reported as errc::no_such_file_or_directory,
 * unknown layers as errc::no_such_file_or_directory as well.
 */
class layer_store
{
public:
    virtual ~layer_store() = default;

    virtual auto layers() -> result<std::vector<layer_record>> = 0;

    virtual auto read_big_data(std::string_view layerId, std::string_view key)
            -> result<std::vector<std::byte>> = 0;

    /**
     * @brief Returns the file backing a big data item if there is one.
     *
     * The file may be memory mapped by the caller as long as it doesn't
     * write to it.
     */
    virtual auto big_data_path(std::string_view layerId, std::string_view key)
            -> result<std::optional<std::filesystem::path>> = 0;

    virtual auto set_big_data(std::string_view layerId,
                              std::string_view key,
                              ro_dynblob data) -> result<void> = 0;

    /**
     * @brief Returns the directory containing the checked out layer.
     */
    virtual auto differ_target(std::string_view layerId)
            -> result<std::filesystem::path> = 0;

    /**
     * @brief A value which changes whenever layers are added or removed.
     */
    virtual auto modification_stamp() -> result<std::uint64_t> = 0;

    /**
     * @brief The raw "pull_options" of the store configuration.
     */
    virtual auto pull_option_values()
            -> std::map<std::string, std::string, std::less<>> = 0;
};

} // namespace chunkdiff
