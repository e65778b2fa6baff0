#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <type_traits>

namespace chunkdiff::detail
{

/**
 * @brief Executes copy and lookup jobs on worker threads.
 *
 * Exceptions escaping a job are logged and dropped.
 */
class thread_pool
{
protected:
    thread_pool() noexcept = default;
    virtual ~thread_pool() noexcept = default;

public:
    thread_pool(thread_pool const &) = delete;
    thread_pool(thread_pool &&) = delete;

    thread_pool &operator=(thread_pool const &) = delete;
    thread_pool &operator=(thread_pool &&) = delete;

    using task_t = std::function<void()>;

    template <typename F>
    void execute(F &&task);

protected:
    static void xdo(task_t &work) noexcept;

private:
    virtual void execute(std::unique_ptr<task_t> task) = 0;
};

template <typename F>
inline void thread_pool::execute(F &&task)
{
    if constexpr (std::is_convertible_v<decltype(task), task_t>)
    {
        execute(std::make_unique<task_t>(std::forward<F>(task)));
    }
    else
    {
        execute(std::make_unique<task_t>(
                [btask = std::forward<F>(task)]() mutable {
                    std::invoke(btask);
                }));
    }
}

/**
 * @brief Forwards work to another pool and allows waiting until every
 * task submitted through it has completed.
 */
class pooled_work_tracker : public thread_pool
{
public:
    pooled_work_tracker() = delete;
    explicit pooled_work_tracker(thread_pool *pool);
    ~pooled_work_tracker() = default;

    void wait();

private:
    // Inherited via thread_pool
    void execute(std::unique_ptr<task_t> task) override;

    void release_one() noexcept;

    thread_pool *const mPool;
    std::atomic_int mWorkCtr;
};

} // namespace chunkdiff::detail
