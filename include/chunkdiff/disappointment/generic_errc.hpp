#pragma once

#include <status-code/generic_code.hpp>

namespace chunkdiff
{

using errc = SYSTEM_ERROR2_NAMESPACE::errc;

} // namespace chunkdiff
