#include "blob_fan_in.hpp"

#include <system_error>
#include <variant>

#include <spdlog/spdlog.h>

#include <chunkdiff/platform/platform.hpp>

namespace chunkdiff::detail
{

blob_fan_in::blob_fan_in(blob_channels inputs, std::size_t maxStreams)
    : mInputs(std::move(inputs))
    , mMaxStreams(maxStreams)
    , mOutput(std::make_shared<utils::channel_signal>(), 1U)
    , mWorker()
{
}

blob_fan_in::~blob_fan_in()
{
    // unblocks the worker, it continues to consume the inputs
    mOutput.close_and_clear();
    if (mWorker.joinable())
    {
        mWorker.join();
    }
}

auto blob_fan_in::start(blob_channels inputs, std::size_t maxStreams)
        -> result<std::unique_ptr<blob_fan_in>>
{
    std::unique_ptr<blob_fan_in> fanIn(
            new blob_fan_in(std::move(inputs), maxStreams));
    try
    {
        fanIn->mWorker = std::thread([self = fanIn.get()] { self->run(); });
    }
    catch (std::system_error const &exc)
    {
        SPDLOG_ERROR("failed to start the fan in thread: {}", exc.what());
        return errc::resource_unavailable_try_again;
    }
    return fanIn;
}

void blob_fan_in::run()
{
    utils::set_current_thread_name("blob-fan-in");

    std::size_t streamsSoFar = 0U;
    bool tooManyStreams = false;
    for (;;)
    {
        auto item = utils::select_receive(*mInputs.streams, *mInputs.errors);
        if (std::holds_alternative<std::monostate>(item))
        {
            break;
        }
        // a failed send means that the consumer is gone, the items are
        // dropped which closes the streams
        if (auto *stream = std::get_if<1>(&item))
        {
            if (streamsSoFar >= mMaxStreams)
            {
                tooManyStreams = true;
                stream->reset();
                continue;
            }
            ++streamsSoFar;
            (void)mOutput.send(item_type{std::move(*stream)});
        }
        else
        {
            (void)mOutput.send(item_type{std::move(std::get<2>(item))});
        }
    }
    if (tooManyStreams)
    {
        SPDLOG_WARN("the blob source returned more than {} streams",
                    mMaxStreams);
        (void)mOutput.send(item_type{chunked_errc::too_many_streams});
    }
    mOutput.close();
}

auto blob_fan_in::next() -> std::optional<item_type>
{
    return mOutput.receive();
}

auto blob_fan_in::drain() -> result<void>
{
    result<void> first = oc::success();
    while (auto item = mOutput.receive())
    {
        if (item->has_error() && !first.has_error())
        {
            first = std::move(*item).assume_error();
        }
    }
    return first;
}

} // namespace chunkdiff::detail
