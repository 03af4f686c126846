#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kiln::emit {

// POSIX sh quoting: words made only of [A-Za-z0-9_@%+:,./-] stay bare,
// everything else is wrapped in single quotes.
std::string shell_quote(std::string_view s);
std::string shell_join(const std::vector<std::string>& argv);

// `$` -> `$$`, shared by ninja variable values and make recipes.
std::string double_dollar(std::string_view s);

bool has_newline(std::string_view s);

// ninja build line path: `$`, `:` and space get a `$` prefix.
std::string ninja_path(std::string_view s);

// make rule line: space, `:`, `#` and `%` are backslash-escaped, `$` doubled.
std::string make_target(std::string_view s);

// `include` operand: as make_target, but `%` is not a pattern there.
std::string make_include_path(std::string_view s);

} // namespace kiln::emit
