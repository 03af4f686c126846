#pragma once

#include <kiln/emit/Emitter.hpp>
#include <kiln/toolchain/Toolchain.hpp>

#include <string>
#include <utility>
#include <vector>

namespace kiln::emit::detail {

// Command templates keyed by rule name + template. A second template under a
// taken name is registered as `<name>_1`, `<name>_2`, ...
class RuleTable {
public:
    const std::string& intern(const toolchain::CommandTemplate& tmpl);

    const std::vector<std::pair<std::string, toolchain::CommandTemplate>>& rules() const { return rules_; }

private:
    std::vector<std::pair<std::string, toolchain::CommandTemplate>> rules_{};
};

// E_INVALID_TEXT for the first path or argument that holds a line break.
bool check_text(const graph::Graph& g, const EmitOptions& opts, diag::Bag& diags);

// E_UNSUPPORTED_EDGE_KIND for the first edge the emitter cannot express.
bool check_edges(const Emitter& emitter, const graph::Graph& g, diag::Bag& diags);

// Full argv of an edge with every path spelled from the build directory.
std::vector<std::string> edge_argv(const graph::Edge& e, const std::string& source_prefix);

// Shell lines (unescaped for the backend) copying or removing the install
// entries under ${DESTDIR}${PREFIX:-/usr/local}.
std::vector<std::string> install_lines(const graph::Graph& g, const std::string& source_prefix);
std::vector<std::string> uninstall_lines(const graph::Graph& g);

std::string header_comment();

} // namespace kiln::emit::detail
