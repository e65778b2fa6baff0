#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

namespace chunkdiff::utils
{

/**
 * @brief The lock and wakeup signal shared by every channel a consumer may
 * wait on at once.
 */
struct channel_signal
{
    std::mutex mutex;
    std::condition_variable cv;
};

/**
 * @brief A closable multi producer queue.
 *
 * Items sent before close() remain receivable after it. Channels created with
 * the same signal can be waited on together with select_receive().
 */
template <typename T>
class channel
{
    template <typename A, typename B>
    friend auto select_receive(channel<A> &, channel<B> &)
            -> std::variant<std::monostate, A, B>;

public:
    static constexpr std::size_t unbounded
            = std::numeric_limits<std::size_t>::max();

    explicit channel(std::shared_ptr<channel_signal> signal
                     = std::make_shared<channel_signal>(),
                     std::size_t capacity = unbounded)
        : mSignal(std::move(signal))
        , mItems()
        , mCapacity(capacity)
        , mClosed(false)
    {
    }

    channel(channel const &) = delete;
    auto operator=(channel const &) -> channel & = delete;

    /**
     * @brief Blocks while the channel is full.
     * @return false if the channel has been closed, the value is dropped.
     */
    auto send(T value) -> bool
    {
        std::unique_lock lock(mSignal->mutex);
        mSignal->cv.wait(lock, [this] {
            return mClosed || mItems.size() < mCapacity;
        });
        if (mClosed)
        {
            return false;
        }
        mItems.push_back(std::move(value));
        lock.unlock();
        mSignal->cv.notify_all();
        return true;
    }

    /**
     * @brief Blocks until an item is available or the channel is closed and
     * drained.
     */
    auto receive() -> std::optional<T>
    {
        std::unique_lock lock(mSignal->mutex);
        mSignal->cv.wait(lock, [this] { return mClosed || !mItems.empty(); });
        return pop_locked(lock);
    }

    void close() noexcept
    {
        {
            std::lock_guard lock(mSignal->mutex);
            mClosed = true;
        }
        mSignal->cv.notify_all();
    }

    /**
     * @brief Closes the channel and destroys all pending items.
     */
    void close_and_clear()
    {
        std::deque<T> pending;
        {
            std::lock_guard lock(mSignal->mutex);
            mClosed = true;
            pending.swap(mItems);
        }
        mSignal->cv.notify_all();
    }

private:
    auto pop_locked(std::unique_lock<std::mutex> &lock) -> std::optional<T>
    {
        if (mItems.empty())
        {
            return std::nullopt;
        }
        std::optional<T> item{std::move(mItems.front())};
        mItems.pop_front();
        lock.unlock();
        mSignal->cv.notify_all();
        return item;
    }

    [[nodiscard]] auto drained_locked() const noexcept -> bool
    {
        return mClosed && mItems.empty();
    }

    std::shared_ptr<channel_signal> mSignal;
    std::deque<T> mItems;
    std::size_t mCapacity;
    bool mClosed;
};

/**
 * @brief Receives from whichever of two channels sharing a signal has an
 * item, preferring the first one.
 *
 * @return std::monostate once both channels are closed and drained.
 */
template <typename A, typename B>
auto select_receive(channel<A> &first, channel<B> &second)
        -> std::variant<std::monostate, A, B>
{
    std::unique_lock lock(first.mSignal->mutex);
    first.mSignal->cv.wait(lock, [&] {
        return !first.mItems.empty() || !second.mItems.empty()
               || (first.drained_locked() && second.drained_locked());
    });
    if (auto item = first.pop_locked(lock))
    {
        return std::variant<std::monostate, A, B>(std::in_place_index<1>,
                                                  std::move(*item));
    }
    if (auto item = second.pop_locked(lock))
    {
        return std::variant<std::monostate, A, B>(std::in_place_index<2>,
                                                  std::move(*item));
    }
    return std::monostate{};
}

} // namespace chunkdiff::utils
