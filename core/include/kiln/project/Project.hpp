#pragma once

#include <kiln/config/Config.hpp>
#include <kiln/desc/Context.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/graph/BuildGraph.hpp>
#include <kiln/opt/OptionSchema.hpp>
#include <kiln/toolchain/Toolchain.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace kiln::project {

inline constexpr std::string_view k_build_file = "build.kiln";
inline constexpr std::string_view k_options_file = "options.kiln";

struct Request {
    std::filesystem::path source_root{};
    std::filesystem::path build_root{};
    toolchain::Platform platform = toolchain::host_platform();
    toolchain::Family family = toolchain::Family::kGcc;
    toolchain::Environment env{};
    config::FlatMap project_overrides{};
    std::vector<opt::CliOverride> cli_overrides{};
};

struct Loaded {
    desc::GenerationContext gen{};
    opt::Schema schema{};
    graph::Graph graph{};
    // build.kiln plus whichever of options.kiln / kiln.toml exist
    std::vector<graph::Path> description_files{};
};

// Called once per stage with a short label ("resolving options", ...).
using ProgressFn = std::function<void(std::string_view)>;

// options.kiln -> option resolution -> build.kiln -> evaluation -> graph.
// A stage never runs once the bag holds an error.
std::optional<Loaded> load(const Request& req, diag::Bag& diags, const ProgressFn& progress = {});

} // namespace kiln::project
