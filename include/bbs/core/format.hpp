#pragma once

#include <fmt/core.h>

namespace bbs::compat {
    using fmt::format;
}
