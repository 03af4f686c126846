#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace kiln::graph {

enum class Root : uint8_t {
    kSource,
    kBuild,
};

struct Path {
    Root root = Root::kBuild;
    std::string rel{};

    std::string key() const { return (root == Root::kSource ? "src:" : "build:") + rel; }

    bool operator==(const Path& o) const { return root == o.root && rel == o.rel; }
    bool operator<(const Path& o) const { return std::tie(root, rel) < std::tie(o.root, o.rel); }
};

// Build-directory names the backends declare or write themselves: the
// `all`/`clean`/`install`/`uninstall` steps, the generated build files and
// the state files next to them.
inline constexpr std::array<std::string_view, 9> k_reserved_outputs{
    "all", "clean", "install", "uninstall", "build.ninja", "Makefile", ".kiln_environ", ".ninja_log", ".ninja_deps",
};

inline bool is_reserved_output(std::string_view rel) {
    for (const auto r : k_reserved_outputs) {
        if (r == rel) return true;
    }
    return false;
}

inline Path source_path(std::string rel) { return Path{Root::kSource, std::move(rel)}; }
inline Path build_path(std::string rel) { return Path{Root::kBuild, std::move(rel)}; }

// Spelling of `p` as seen from the build directory, where every backend runs
// its commands. `source_prefix` is the source directory relative to the
// build directory ("" when they are the same).
inline std::string render(const Path& p, std::string_view source_prefix) {
    if (p.root == Root::kBuild || source_prefix.empty()) return p.rel.empty() ? std::string(".") : p.rel;
    if (p.rel.empty()) return std::string(source_prefix);
    return std::string(source_prefix) + "/" + p.rel;
}

} // namespace kiln::graph
