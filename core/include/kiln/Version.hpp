#pragma once

#include <string_view>

namespace kiln {

inline constexpr std::string_view k_version_string = "0.3.0";

} // namespace kiln
