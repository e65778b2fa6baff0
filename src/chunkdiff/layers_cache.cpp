#include <chunkdiff/layers_cache.hpp>

#include <map>
#include <mutex>

#include <sys/mman.h>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/llfio.hpp>

#include "cache/cache_file.hpp"

namespace chunkdiff
{

struct layers_cache::layer
{
    std::string id;
    std::filesystem::path target;
    detail::cache_file file;
    // backs file unless the cache file is mapped
    std::vector<std::byte> buffer;
    llfio::mapped_file_handle mapping;
    // the index has been generated by this process and should be mapped
    // from the store next time
    bool reload_with_mmap = false;

    layer() = default;
    layer(layer const &) = delete;
    auto operator=(layer const &) -> layer & = delete;

    ~layer()
    {
        if (mapping.is_valid())
        {
            if (auto closeRx = mapping.close(); closeRx.has_error())
            {
                SPDLOG_WARN("failed to unmap the cache file of layer {}: {}",
                            id, closeRx.assume_error().message().c_str());
            }
        }
    }
};

namespace
{

auto is_missing(system_error::error const &error) -> bool
{
    return error == errc::no_such_file_or_directory;
}

} // namespace

layers_cache::layers_cache(std::shared_ptr<layer_store> store)
    : mStore(std::move(store))
    , mMutex()
    , mLayers()
    , mStamp()
{
}

layers_cache::~layers_cache()
{
    release();
}

auto layers_cache::create(std::shared_ptr<layer_store> store)
        -> result<std::shared_ptr<layers_cache>>
{
    auto cache = std::make_shared<layers_cache>(std::move(store));
    CHUNKDIFF_TRY(cache->load());
    return cache;
}

void layers_cache::release() noexcept
{
    std::unique_lock lock(mMutex);
    mLayers.clear();
    mStamp.reset();
}

auto layers_cache::num_layers() const -> std::size_t
{
    std::shared_lock lock(mMutex);
    return mLayers.size();
}

auto layers_cache::load() -> result<void>
{
    std::unique_lock lock(mMutex);

    CHUNKDIFF_TRY(auto &&stamp, mStore->modification_stamp());
    if (mStamp == stamp
        && std::ranges::none_of(mLayers, [](auto const &l) {
               return l->reload_with_mmap;
           }))
    {
        return oc::success();
    }

    std::map<std::string, std::unique_ptr<layer>, std::less<>> loaded;
    for (auto &l : mLayers)
    {
        auto id = l->id;
        loaded.emplace(std::move(id), std::move(l));
    }
    mLayers.clear();

    CHUNKDIFF_TRY(auto &&records, mStore->layers());

    std::vector<std::unique_ptr<layer>> next;
    next.reserve(records.size());
    for (auto const &record : records)
    {
        if (auto it = loaded.find(record.id);
            it != loaded.end() && !it->second->reload_with_mmap)
        {
            next.push_back(std::move(it->second));
            loaded.erase(it);
            continue;
        }

        auto cachedRx = load_layer_cache(record.id);
        if (cachedRx.has_error())
        {
            SPDLOG_INFO("failed to load the cache file of layer {}: {}",
                        record.id,
                        cachedRx.assume_error().message().c_str());
        }
        else if (cachedRx.assume_value())
        {
            next.push_back(std::move(cachedRx).assume_value());
            continue;
        }

        // the cache file is either missing or broken
        auto createdRx = create_cache_from_toc(record);
        if (createdRx.has_error())
        {
            if (!is_missing(createdRx.assume_error()))
            {
                SPDLOG_WARN("failed to create the cache file of layer {}: {}",
                            record.id,
                            createdRx.assume_error().message().c_str());
            }
        }
        else if (createdRx.assume_value())
        {
            next.push_back(std::move(createdRx).assume_value());
        }
    }

    // the remaining layers are stale or are going to be mapped
    loaded.clear();

    mLayers = std::move(next);
    mStamp = stamp;
    SPDLOG_DEBUG("loaded the cache of {} layers", mLayers.size());
    return oc::success();
}

auto layers_cache::create_layer(std::string_view layerId)
        -> result<std::unique_ptr<layer>>
{
    auto l = std::make_unique<layer>();
    l->id = layerId;
    CHUNKDIFF_TRY(auto &&target, mStore->differ_target(layerId));
    l->target = std::move(target);
    return l;
}

auto layers_cache::load_layer_cache(std::string_view layerId)
        -> result<std::unique_ptr<layer>>
{
    auto pathRx = mStore->big_data_path(layerId, cache_big_data_key);
    if (pathRx.has_error())
    {
        if (is_missing(pathRx.assume_error()))
        {
            return std::unique_ptr<layer>{};
        }
        return std::move(pathRx).assume_error();
    }

    CHUNKDIFF_TRY(auto &&l, create_layer(layerId));

    ro_dynblob data;
    if (auto const &path = pathRx.assume_value(); path.has_value())
    {
        auto mappedRx = llfio::mapped_file(llfio::path_handle{}, *path,
                                           llfio::handle::mode::read,
                                           llfio::handle::creation::open_existing);
        if (mappedRx.has_error())
        {
            SPDLOG_WARN("failed to map the cache file of layer {}: {}",
                        layerId, mappedRx.assume_error().message().c_str());
        }
        else if (auto extentRx = mappedRx.assume_value().maximum_extent();
                 extentRx.has_error() || extentRx.assume_value() == 0U)
        {
            SPDLOG_WARN("the cache file of layer {} is empty", layerId);
        }
        else
        {
            l->mapping = std::move(mappedRx).assume_value();
            auto const size = static_cast<std::size_t>(extentRx.assume_value());
            // advisory only
            (void)::madvise(l->mapping.address(), size, MADV_RANDOM);
            data = ro_dynblob(l->mapping.address(), size);
        }
    }
    if (data.empty())
    {
        auto bufferRx = mStore->read_big_data(layerId, cache_big_data_key);
        if (bufferRx.has_error())
        {
            if (is_missing(bufferRx.assume_error()))
            {
                return std::unique_ptr<layer>{};
            }
            return std::move(bufferRx).assume_error();
        }
        l->buffer = std::move(bufferRx).assume_value();
        data = l->buffer;
    }

    CHUNKDIFF_TRY(auto &&file, detail::cache_file::read(data));
    if (!file)
    {
        // written by a different version
        return std::unique_ptr<layer>{};
    }
    l->file = std::move(*file);
    return std::move(l);
}

auto layers_cache::create_cache_from_toc(layer_record const &record)
        -> result<std::unique_ptr<layer>>
{
    auto format = output_format::dir;
    if (auto layerDataRx
        = mStore->read_big_data(record.id, layer_data_big_data_key);
        layerDataRx.has_value())
    {
        CHUNKDIFF_TRY(auto &&parsed,
                      parse_layer_data(as_string_view(layerDataRx.assume_value())));
        format = parsed;
    }
    else if (!is_missing(layerDataRx.assume_error()))
    {
        return std::move(layerDataRx).assume_error();
    }

    auto manifestRx = mStore->read_big_data(record.id, manifest_big_data_key);
    if (manifestRx.has_error())
    {
        if (is_missing(manifestRx.assume_error()))
        {
            // not a chunked layer
            return std::unique_ptr<layer>{};
        }
        return std::move(manifestRx).assume_error();
    }
    auto const manifest = as_string_view(manifestRx.assume_value());

    CHUNKDIFF_TRY(auto &&l, create_layer(record.id));
    if (record.read_only)
    {
        CHUNKDIFF_TRY(auto &&entries,
                      detail::prepare_cache_entries(manifest, format));
        CHUNKDIFF_TRY(auto &&buffer, detail::cache_file::build(entries));
        l->buffer = std::move(buffer);
    }
    else
    {
        CHUNKDIFF_TRY(auto &&buffer,
                      write_cache(*mStore, record.id, manifest, format));
        l->buffer = std::move(buffer);
        l->reload_with_mmap = true;
    }

    CHUNKDIFF_TRY(auto &&file, detail::cache_file::read(l->buffer));
    if (!file)
    {
        return std::unique_ptr<layer>{};
    }
    l->file = std::move(*file);
    SPDLOG_DEBUG("generated the cache of layer {} with {} tags", record.id,
                 l->file.num_tags());
    return std::move(l);
}

auto layers_cache::write_cache(layer_store &store,
                               std::string_view layerId,
                               std::string_view manifest,
                               output_format format)
        -> result<std::vector<std::byte>>
{
    CHUNKDIFF_TRY(auto &&entries,
                  detail::prepare_cache_entries(manifest, format));
    CHUNKDIFF_TRY(auto &&buffer, detail::cache_file::build(entries));
    CHUNKDIFF_TRY(store.set_big_data(layerId, cache_big_data_key, buffer));
    return std::move(buffer);
}

auto layers_cache::find_digest(std::string_view digest)
        -> result<std::optional<cache_hit>>
{
    if (digest.empty())
    {
        return std::optional<cache_hit>{};
    }
    CHUNKDIFF_TRY(auto &&binaryDigest, make_binary_digest(digest));

    std::shared_lock lock(mMutex);
    for (auto const &l : mLayers)
    {
        auto foundRx = l->file.find(binaryDigest);
        if (foundRx.has_error())
        {
            SPDLOG_WARN("the cache file of layer {} is corrupted: {}", l->id,
                        foundRx.assume_error().message().c_str());
            continue;
        }
        if (auto const &location = foundRx.assume_value())
        {
            return std::optional<cache_hit>{cache_hit{
                    l->target, std::string(location->path), location->offset}};
        }
    }
    return std::optional<cache_hit>{};
}

auto layers_cache::find_file_in_other_layers(file_entry const &file,
                                             bool useHardLinks)
        -> result<std::optional<cache_hit>>
{
    std::string digest = file.digest;
    if (useHardLinks)
    {
        CHUNKDIFF_TRY(auto &&fingerprint, hard_link_fingerprint(file));
        digest = std::move(fingerprint);
    }
    CHUNKDIFF_TRY(auto &&hit, find_digest(digest));
    if (hit && hit->offset != 0U)
    {
        // only whole files are usable
        return std::optional<cache_hit>{};
    }
    return std::move(hit);
}

auto layers_cache::find_chunk_in_other_layers(file_entry const &chunk)
        -> result<std::optional<cache_hit>>
{
    return find_digest(chunk.chunk_digest);
}

} // namespace chunkdiff
