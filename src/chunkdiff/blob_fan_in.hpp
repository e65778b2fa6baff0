#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <thread>

#include <chunkdiff/blob_source.hpp>
#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/utils/channel.hpp>

namespace chunkdiff::detail
{

/**
 * @brief Multiplexes the stream and error channels of a fetch into a single
 * ordered sequence.
 *
 * A dedicated thread owns both inputs and consumes them until the source
 * closes them, even if the consumer stops early. Streams beyond
 * @p maxStreams are closed and reported as chunked_errc::too_many_streams
 * after everything else.
 */
class blob_fan_in
{
public:
    using item_type = result<blob_stream_ptr>;

    ~blob_fan_in();

    blob_fan_in(blob_fan_in const &) = delete;
    auto operator=(blob_fan_in const &) -> blob_fan_in & = delete;

    static auto start(blob_channels inputs, std::size_t maxStreams)
            -> result<std::unique_ptr<blob_fan_in>>;

    /**
     * @brief Blocks until the next stream or error arrives.
     * @return an empty optional after the inputs have been drained
     */
    auto next() -> std::optional<item_type>;

    /**
     * @brief Closes all remaining streams.
     * @return the first remaining error
     */
    auto drain() -> result<void>;

private:
    blob_fan_in(blob_channels inputs, std::size_t maxStreams);

    void run();

    blob_channels mInputs;
    std::size_t mMaxStreams;
    utils::channel<item_type> mOutput;
    std::thread mWorker;
};

} // namespace chunkdiff::detail
