#pragma once

#include <string>

namespace chunkdiff::utils
{
/**
 * @brief Names the calling thread, the name is truncated to the 15
 * characters the kernel accepts.
 */
void set_current_thread_name(std::string const &name);
} // namespace chunkdiff::utils
