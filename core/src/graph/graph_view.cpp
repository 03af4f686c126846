#include <kiln/graph/BuildGraph.hpp>

#include <sstream>

namespace kiln::graph {

namespace {

void append_json_escaped(std::ostringstream& oss, const std::string& s) {
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
}

void append_paths_json(std::ostringstream& oss, const std::vector<Path>& paths) {
    oss << "[";
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i) oss << ", ";
        oss << "\"";
        append_json_escaped(oss, paths[i].key());
        oss << "\"";
    }
    oss << "]";
}

std::string dot_id(const Path& p) {
    std::string out{};
    for (char c : p.key()) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string emit_graph_json(const Graph& g) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"project\": {\"name\": \"";
    append_json_escaped(oss, g.project().name);
    oss << "\", \"version\": \"";
    append_json_escaped(oss, g.project().version);
    oss << "\"},\n";

    oss << "  \"targets\": [\n";
    for (size_t i = 0; i < g.targets().size(); ++i) {
        const auto& t = g.targets()[i];
        oss << "    {\"name\": \""; append_json_escaped(oss, t.name);
        oss << "\", \"kind\": \"" << desc::target_kind_name(t.kind);
        oss << "\", \"outputs\": "; append_paths_json(oss, t.outputs);
        oss << "}";
        if (i + 1 != g.targets().size()) oss << ",";
        oss << "\n";
    }
    oss << "  ],\n";

    oss << "  \"nodes\": [\n";
    for (size_t i = 0; i < g.nodes().size(); ++i) {
        const auto& n = g.nodes()[i];
        oss << "    {\"path\": \""; append_json_escaped(oss, n.path.key());
        oss << "\", \"producer\": ";
        if (n.producer) {
            oss << *n.producer;
        } else {
            oss << "null";
        }
        oss << "}";
        if (i + 1 != g.nodes().size()) oss << ",";
        oss << "\n";
    }
    oss << "  ],\n";

    oss << "  \"edges\": [\n";
    for (size_t i = 0; i < g.edges().size(); ++i) {
        const auto& e = g.edges()[i];
        oss << "    {\"kind\": \"" << edge_kind_name(e.kind);
        oss << "\", \"target\": \""; append_json_escaped(oss, e.target);
        oss << "\", \"rule\": \""; append_json_escaped(oss, e.rule);
        oss << "\", \"inputs\": "; append_paths_json(oss, e.inputs);
        oss << ", \"implicit\": "; append_paths_json(oss, e.implicit_inputs);
        oss << ", \"order_only\": "; append_paths_json(oss, e.order_only_inputs);
        oss << ", \"outputs\": "; append_paths_json(oss, e.outputs);
        oss << "}";
        if (i + 1 != g.edges().size()) oss << ",";
        oss << "\n";
    }
    oss << "  ],\n";

    oss << "  \"defaults\": ";
    append_paths_json(oss, g.defaults());
    oss << "\n}\n";
    return oss.str();
}

std::string emit_graph_text(const Graph& g) {
    std::ostringstream oss;
    oss << "project.name=" << g.project().name << "\n";
    oss << "project.version=" << g.project().version << "\n";
    oss << "targets=" << g.targets().size() << "\n";
    for (const auto& t : g.targets()) {
        oss << "  target " << t.name << " kind=" << desc::target_kind_name(t.kind)
            << " outputs=" << t.outputs.size() << "\n";
    }
    oss << "nodes=" << g.nodes().size() << "\n";
    oss << "edges=" << g.edges().size() << "\n";
    for (const auto& e : g.edges()) {
        oss << "  edge " << e.rule << " kind=" << edge_kind_name(e.kind) << " target=" << e.target;
        for (const auto& o : e.outputs) oss << " " << o.rel;
        oss << " in=" << e.inputs.size() << " implicit=" << e.implicit_inputs.size()
            << " order_only=" << e.order_only_inputs.size() << "\n";
    }
    oss << "defaults=" << g.defaults().size() << "\n";
    oss << "installs=" << g.installs().size() << "\n";
    return oss.str();
}

std::string emit_graph_dot(const Graph& g) {
    std::ostringstream oss;
    oss << "digraph kiln_build {\n";
    oss << "  rankdir=LR;\n";

    for (const auto& n : g.nodes()) {
        oss << "  \"" << dot_id(n.path) << "\"";
        if (n.is_source()) oss << " [shape=box]";
        oss << ";\n";
    }

    for (const auto& e : g.edges()) {
        for (const auto& out : e.outputs) {
            for (const auto& in : e.inputs) {
                oss << "  \"" << dot_id(in) << "\" -> \"" << dot_id(out) << "\";\n";
            }
            for (const auto& in : e.implicit_inputs) {
                oss << "  \"" << dot_id(in) << "\" -> \"" << dot_id(out) << "\" [style=dashed];\n";
            }
            for (const auto& in : e.order_only_inputs) {
                oss << "  \"" << dot_id(in) << "\" -> \"" << dot_id(out) << "\" [style=dotted];\n";
            }
        }
    }

    oss << "}\n";
    return oss.str();
}

} // namespace kiln::graph
