#pragma once
#include <cstdint>

namespace strata {

// 1, 2, 3, ... per repository. 0 means "never committed".
using Revision = std::uint64_t;

} // namespace strata
