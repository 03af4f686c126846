#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kiln::config {

using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>, std::vector<int64_t>>;
using FlatMap = std::map<std::string, Value>;

inline constexpr std::string_view k_project_file = "kiln.toml";
inline constexpr std::string_view k_environ_file = ".kiln_environ";

struct LoadedConfig {
    std::filesystem::path path{};
    bool present = false;
    FlatMap values{};
    std::vector<std::string> warnings{};
};

struct EffectiveSettings {
    std::vector<std::string> build_backends{"ninja"};
    std::string toolchain_family = "gcc";
    std::string toolchain_platform{};
    std::string make_dialect = "gnu";

    std::string ui_color = "auto";
    bool ui_progress = true;

    // `[options]` table, keys without the section prefix
    FlatMap option_overrides{};
};

// Arguments of the configure run that produced a build directory; stored in
// `.kiln_environ` and replayed by `kiln regenerate`.
struct RecordedEnvironment {
    std::string kiln_version{};
    std::string source_dir{};
    std::string build_dir{};
    std::vector<std::string> backends{};
    std::string toolchain{};
    std::string platform{};
    std::string make_dialect{};
    std::vector<std::string> defines{};
    std::map<std::string, std::string> env{};
};

bool is_known_key(std::string_view key);

// Loads `<source_root>/kiln.toml`. A missing file is not an error.
bool load(const std::filesystem::path& source_root, LoadedConfig& out, std::string& err);
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool write_environment(const std::filesystem::path& build_root,
                       const RecordedEnvironment& env,
                       std::string& err);
std::optional<RecordedEnvironment> read_environment(const std::filesystem::path& build_root,
                                                    std::string& err);

std::string render_toml(const FlatMap& values);
std::string render_value_toml(const Value& v);

} // namespace kiln::config
