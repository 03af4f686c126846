#pragma once

#include <kiln/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::config::toml_lite {

// Flat TOML subset: `[section]` headers, `key = value` lines with string,
// integer, bool and homogeneous array values. Keys are stored as
// "section.key".
bool parse_text(std::string_view text,
                std::string_view origin,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_value(std::string_view text, Value& out, std::string& err);

bool write_file(const std::filesystem::path& path,
                const FlatMap& values,
                std::string& err);

} // namespace kiln::config::toml_lite
