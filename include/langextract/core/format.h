#pragma once

// Formatting goes through the fmt bundled with (or linked by) spdlog

#include <spdlog/fmt/fmt.h>

namespace langextract {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace langextract
