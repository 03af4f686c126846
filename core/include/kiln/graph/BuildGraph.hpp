#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/desc/Context.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/graph/Path.hpp>
#include <kiln/os/File.hpp>
#include <kiln/toolchain/Toolchain.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::graph {

enum class EdgeKind : uint8_t {
    kNormal,
    kPhony,
    // a command edge that carries order-only inputs
    kOrderOnly,
};

std::string_view edge_kind_name(EdgeKind k);

struct FileNode {
    Path path{};
    std::optional<std::size_t> producer{};
    std::vector<std::size_t> consumers{};

    bool is_source() const { return path.root == Root::kSource; }
};

struct Edge {
    EdgeKind kind = EdgeKind::kNormal;
    std::string target{};
    std::string rule{};

    std::vector<Path> inputs{};
    std::vector<Path> implicit_inputs{};
    std::vector<Path> order_only_inputs{};
    std::vector<Path> outputs{};

    // empty for phony edges
    toolchain::CommandTemplate command{};
    // flags / includes / libdirs / libs; paths are bound at emission time
    toolchain::Bindings bindings{};
    std::optional<Path> depfile{};
    toolchain::DepsStyle deps = toolchain::DepsStyle::kNone;

    std::string description{};
    ast::Span site{};
};

struct TargetInfo {
    std::string name{};
    desc::TargetKind kind = desc::TargetKind::kExecutable;
    std::vector<Path> outputs{};
    // what `ninja <name>` / `make <name>` builds
    Path phony_name{};
    ast::Span site{};
};

struct InstallEntry {
    std::string target{};
    desc::TargetKind kind = desc::TargetKind::kExecutable;
    Path file{};
    // relative to the install prefix: bin/ or lib/
    std::string destination{};
};

class Graph {
public:
    const std::vector<FileNode>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const std::vector<TargetInfo>& targets() const { return targets_; }
    const std::vector<Path>& defaults() const { return defaults_; }
    const std::vector<InstallEntry>& installs() const { return installs_; }
    const desc::ProjectInfo& project() const { return project_; }

    const FileNode* find(const Path& p) const;

    // Edge indices with every producer before its consumers; ties follow
    // declaration order. Fails only on a cycle.
    std::optional<std::vector<std::size_t>> topological_order() const;

private:
    friend class Builder;

    std::vector<FileNode> nodes_{};
    std::vector<Edge> edges_{};
    std::map<std::string, std::size_t> node_index_{};
    std::vector<TargetInfo> targets_{};
    std::vector<Path> defaults_{};
    std::vector<InstallEntry> installs_{};
    desc::ProjectInfo project_{};
};

// Expands the target registry into nodes and edges, then validates:
// single producer per output, no cycles, no dangling inputs.
class Builder {
public:
    Builder(const desc::TargetRegistry& registry,
            std::string source_prefix,
            const os::FileSystemView& fs,
            diag::Bag& diags)
        : registry_(registry), source_prefix_(std::move(source_prefix)), fs_(fs), diags_(diags) {}

    std::optional<Graph> build();

private:
    bool expand_target(const desc::Target& t);
    bool expand_compiled(const desc::Target& t);
    bool expand_command(const desc::Target& t);
    bool expand_alias(const desc::Target& t);
    bool add_phony_name(const desc::Target& t);

    void collect_links(const desc::Target& t,
                       std::vector<const desc::Target*>& libs,
                       std::vector<std::string>& externals) const;
    std::vector<Path> outputs_of(const std::vector<desc::TargetHandle>& hs) const;

    bool add_edge(Edge e);
    std::size_t node_for(const Path& p);

    bool check_cycles();
    bool check_inputs();
    bool check_producers();

    void error(diag::Code code, const ast::Span& site, std::string msg);

    const desc::TargetRegistry& registry_;
    std::string source_prefix_;
    const os::FileSystemView& fs_;
    diag::Bag& diags_;
    Graph g_{};
};

std::optional<Graph> build_graph(const desc::TargetRegistry& registry,
                                 const desc::GenerationContext& gen,
                                 const os::FileSystemView& fs,
                                 diag::Bag& diags);

std::string emit_graph_json(const Graph& g);
std::string emit_graph_text(const Graph& g);
std::string emit_graph_dot(const Graph& g);

} // namespace kiln::graph
