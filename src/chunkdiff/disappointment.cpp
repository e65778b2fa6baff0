#include <chunkdiff/disappointment.hpp>

#include <cerrno>

#include <status-code/posix_code.hpp>

namespace chunkdiff
{

auto collect_system_error() -> system_error::posix_code
{
    return system_error::posix_code::current();
}

} // namespace chunkdiff
