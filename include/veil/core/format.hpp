#pragma once

#include <fmt/core.h>

namespace veil::compat {
    using fmt::format;
}
