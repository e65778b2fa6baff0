#include <chunkdiff/platform/thread_pool.hpp>

#include <exception>

#include <spdlog/spdlog.h>

#include <chunkdiff/utils/misc.hpp>

namespace chunkdiff::detail
{

void thread_pool::xdo(task_t &work) noexcept
{
    try
    {
        work();
    }
    catch (std::exception const &exc)
    {
        SPDLOG_ERROR("a pooled task terminated with an exception: {}",
                     exc.what());
    }
}

pooled_work_tracker::pooled_work_tracker(thread_pool *pool)
    : mPool{pool}
    , mWorkCtr{0}
{
}

void pooled_work_tracker::wait()
{
    auto currentValue = mWorkCtr.load(std::memory_order::acquire);
    while (currentValue > 0)
    {
        mWorkCtr.wait(currentValue, std::memory_order::acquire);
        currentValue = mWorkCtr.load(std::memory_order::acquire);
    }
}

void pooled_work_tracker::release_one() noexcept
{
    if (1 == mWorkCtr.fetch_sub(1, std::memory_order::acq_rel))
    {
        mWorkCtr.notify_all();
    }
}

void pooled_work_tracker::execute(std::unique_ptr<task_t> task)
{
    mWorkCtr.fetch_add(1, std::memory_order::release);
    try
    {
        mPool->execute([this, xtask = std::move(*task)]() mutable {
            CHUNKDIFF_SCOPE_EXIT
            {
                release_one();
            };

            xtask();
        });
    }
    catch (...)
    {
        release_one();
        throw;
    }
}

} // namespace chunkdiff::detail
