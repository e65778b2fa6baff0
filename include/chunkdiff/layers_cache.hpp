#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/layer_store.hpp>
#include <chunkdiff/pull_options.hpp>
#include <chunkdiff/toc.hpp>

namespace chunkdiff
{

/**
 * @brief A file region found in another local layer.
 */
struct cache_hit
{
    //! the checkout directory of the layer
    std::filesystem::path target;
    //! the path of the file relative to target
    std::string path;
    std::uint64_t offset;
};

/**
 * @brief The index of the content of all locally stored layers.
 *
 * Lookups may run concurrently, load() and release() are exclusive. The
 * service is shared between all differs of a store.
 */
class layers_cache
{
    struct layer;

public:
    explicit layers_cache(std::shared_ptr<layer_store> store);
    ~layers_cache();

    layers_cache(layers_cache const &) = delete;
    auto operator=(layers_cache const &) -> layers_cache & = delete;

    /**
     * @brief Creates the service and loads the index of every layer.
     */
    static auto create(std::shared_ptr<layer_store> store)
            -> result<std::shared_ptr<layers_cache>>;

    /**
     * @brief Synchronizes the loaded indices with the layers of the store.
     *
     * Layers without a usable index are indexed from their stored table of
     * contents. Failures of single layers are logged and skipped.
     */
    auto load() -> result<void>;

    /**
     * @brief Unmaps and drops all loaded indices.
     */
    void release() noexcept;

    auto find_digest(std::string_view digest) -> result<std::optional<cache_hit>>;

    /**
     * @brief Looks for a whole file with the same content.
     *
     * With @p useHardLinks the hard link fingerprint must match, i.e. the
     * owner, mode and xattrs must be equal as well.
     */
    auto find_file_in_other_layers(file_entry const &file, bool useHardLinks)
            -> result<std::optional<cache_hit>>;

    auto find_chunk_in_other_layers(file_entry const &chunk)
            -> result<std::optional<cache_hit>>;

    [[nodiscard]] auto num_layers() const -> std::size_t;

    /**
     * @brief Serializes the index of a freshly committed layer and stores it
     * as big data of the layer.
     */
    static auto write_cache(layer_store &store,
                            std::string_view layerId,
                            std::string_view manifest,
                            output_format format)
            -> result<std::vector<std::byte>>;

private:
    auto load_layer_cache(std::string_view layerId)
            -> result<std::unique_ptr<layer>>;
    auto create_cache_from_toc(layer_record const &record)
            -> result<std::unique_ptr<layer>>;
    auto create_layer(std::string_view layerId)
            -> result<std::unique_ptr<layer>>;

    std::shared_ptr<layer_store> mStore;
    mutable std::shared_mutex mMutex;
    std::vector<std::unique_ptr<layer>> mLayers;
    std::optional<std::uint64_t> mStamp;
};

} // namespace chunkdiff
