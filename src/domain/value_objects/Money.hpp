#pragma once

#include <cstdint>

namespace olp::domain {

// Amount in minor currency units (e.g. cents).
using Money = int64_t;

} // namespace olp::domain
