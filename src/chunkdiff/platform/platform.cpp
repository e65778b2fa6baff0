#include <chunkdiff/platform/platform.hpp>

#include <pthread.h>

namespace chunkdiff::utils
{
void set_current_thread_name(std::string const &name)
{
    constexpr std::size_t maxThreadNameSize = 15;
    std::string const truncated = name.substr(0, maxThreadNameSize);

    auto const id = pthread_self();
    pthread_setname_np(id, truncated.c_str());
}
} // namespace chunkdiff::utils
