#include "thread_pool_gen.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <system_error>

#include <fmt/format.h>

#include <chunkdiff/platform/platform.hpp>

namespace chunkdiff::detail
{
namespace
{
inline auto make_anonymous_pool_name() -> std::string
{
    static std::atomic_int anonymousThreadPoolId{0};

    return fmt::format("pool-{}", anonymousThreadPoolId++);
}
} // namespace

thread_pool_gen::thread_pool_gen(unsigned numWorkers, std::string_view poolName)
    : mTaskQueue{}
    , mWorkerList{}
    , mThreadPoolName{!poolName.empty() ? std::string{poolName}
                                        : make_anonymous_pool_name()}
{
    if (numWorkers == 0)
    {
        numWorkers = 1;
    }

    mWorkerList.reserve(numWorkers);
    try
    {
        for (unsigned i = 0; i < numWorkers; ++i)
        {
            mWorkerList.emplace_back(std::mem_fn(&thread_pool_gen::worker_main),
                                     this,
                                     moodycamel::ConsumerToken(mTaskQueue), i);
        }
    }
    catch (std::system_error const &)
    {
        // the already running workers access the task queue which ceases to
        // exist after rethrowing
        shutdown();
        throw;
    }
}

thread_pool_gen::~thread_pool_gen() noexcept
{
    shutdown();
}

void thread_pool_gen::shutdown() noexcept
{
    for (std::size_t i = 0, end = mWorkerList.size(); i < end; ++i)
    {
        mTaskQueue.enqueue(work_item_t{});
    }

    for (auto &worker : mWorkerList)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    mWorkerList.clear();
}

void thread_pool_gen::worker_main(moodycamel::ConsumerToken workerToken,
                                  unsigned id)
{
    utils::set_current_thread_name(fmt::format("{}-{}", mThreadPoolName, id));

    for (;;)
    {
        work_item_t task;
        mTaskQueue.wait_dequeue(workerToken, task);

        if (!task)
        {
            break;
        }

        xdo(*task);
    }
}

void thread_pool_gen::execute(std::unique_ptr<task_t> task)
{
    mTaskQueue.enqueue(std::move(task));
}
} // namespace chunkdiff::detail
