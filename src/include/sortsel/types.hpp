#pragma once
#include <cstdint>

namespace sortsel {
// signed so that high + 1 and low - 1 stay representable at the boundaries
using index_t = int64_t;
}  // namespace sortsel
