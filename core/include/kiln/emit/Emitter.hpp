#pragma once

#include <kiln/diag/DiagCode.hpp>
#include <kiln/graph/BuildGraph.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::emit {

struct EmitOptions {
    // source directory as seen from the build directory
    std::string source_prefix{};
    // argv[0] used by the regeneration edge
    std::string kiln_command = "kiln";
    // description files that trigger regeneration (source-relative)
    std::vector<graph::Path> regen_inputs{};
};

// file name (relative to the build directory) -> content
using OutputFiles = std::map<std::string, std::string>;

class Emitter {
public:
    virtual ~Emitter() = default;

    virtual std::string_view name() const = 0;
    virtual bool supports(graph::EdgeKind kind) const = 0;
    virtual bool supports_multi_output() const = 0;

    // Renders the whole graph or nothing; never touches the filesystem.
    virtual std::optional<OutputFiles> emit(const graph::Graph& g,
                                            const EmitOptions& opts,
                                            diag::Bag& diags) const = 0;
};

enum class MakeDialect : uint8_t {
    kGnu,
    kPosix,
};

std::unique_ptr<Emitter> make_ninja_emitter();
std::unique_ptr<Emitter> make_make_emitter(MakeDialect dialect);

// "ninja", "make" (dialect from configuration) or "make-posix"; null for
// anything else.
std::unique_ptr<Emitter> make_emitter(std::string_view backend, MakeDialect make_dialect);
bool is_known_backend(std::string_view backend);
std::optional<MakeDialect> parse_make_dialect(std::string_view s);

// Each file goes to <path>.tmp first and is renamed over <path>; the first
// failure stops with E_WRITE_FAILED.
bool write_outputs(const std::filesystem::path& build_root, const OutputFiles& files, diag::Bag& diags);

} // namespace kiln::emit
