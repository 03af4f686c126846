#include "EmitSupport.hpp"

#include <kiln/emit/Escape.hpp>

#include <map>
#include <sstream>

namespace kiln::emit {

namespace {

using toolchain::Slot;

std::string rule_command(const toolchain::CommandTemplate& tmpl) {
    std::string out{};
    for (const auto& a : tmpl.args) {
        if (!out.empty()) out += " ";
        if (a.slot == Slot::kLiteral) {
            out += double_dollar(shell_quote(a.text));
            continue;
        }
        if (!a.text.empty()) out += double_dollar(shell_quote(a.text));
        // the depfile is always `<object>.d`
        out += a.slot == Slot::kDepfile ? std::string("$out.d") : "$" + std::string(toolchain::slot_name(a.slot));
    }
    return out;
}

bool uses_slot(const toolchain::CommandTemplate& tmpl, Slot s) {
    for (const auto& a : tmpl.args) {
        if (a.slot == s) return true;
    }
    return false;
}

class NinjaEmitter final : public Emitter {
public:
    std::string_view name() const override { return "ninja"; }
    bool supports(graph::EdgeKind) const override { return true; }
    bool supports_multi_output() const override { return true; }

    std::optional<OutputFiles> emit(const graph::Graph& g,
                                    const EmitOptions& opts,
                                    diag::Bag& diags) const override;
};

std::optional<OutputFiles> NinjaEmitter::emit(const graph::Graph& g,
                                              const EmitOptions& opts,
                                              diag::Bag& diags) const {
    if (!detail::check_text(g, opts, diags)) return std::nullopt;
    if (!detail::check_edges(*this, g, diags)) return std::nullopt;

    const auto& prefix = opts.source_prefix;
    auto out_path = [&](const graph::Path& p) { return ninja_path(graph::render(p, prefix)); };
    auto in_path = out_path;

    detail::RuleTable rules{};
    std::map<std::string, toolchain::DepsStyle> deps_of{};
    std::vector<std::string> edge_rule(g.edges().size());
    bool uses_command = !g.installs().empty();
    for (size_t i = 0; i < g.edges().size(); ++i) {
        const auto& e = g.edges()[i];
        if (e.kind == graph::EdgeKind::kPhony) {
            edge_rule[i] = "phony";
        } else if (e.command.per_edge) {
            edge_rule[i] = "command";
            uses_command = true;
        } else {
            edge_rule[i] = rules.intern(e.command);
            deps_of[edge_rule[i]] = e.deps;
        }
    }

    std::ostringstream oss;
    oss << detail::header_comment();
    oss << "ninja_required_version = 1.3\n\n";

    for (const auto& [rule, tmpl] : rules.rules()) {
        oss << "rule " << rule << "\n";
        oss << "  command = " << rule_command(tmpl) << "\n";
        switch (deps_of[rule]) {
            case toolchain::DepsStyle::kGcc:
                oss << "  depfile = $out.d\n";
                oss << "  deps = gcc\n";
                break;
            case toolchain::DepsStyle::kMsvc:
                oss << "  deps = msvc\n";
                break;
            case toolchain::DepsStyle::kNone:
                break;
        }
        oss << "  description = $desc\n\n";
    }
    if (uses_command) {
        oss << "rule command\n";
        oss << "  command = $cmd\n";
        oss << "  description = $desc\n\n";
    }

    for (size_t i = 0; i < g.edges().size(); ++i) {
        const auto& e = g.edges()[i];
        oss << "build";
        for (const auto& o : e.outputs) oss << " " << out_path(o);
        oss << ": " << edge_rule[i];
        for (const auto& in : e.inputs) oss << " " << in_path(in);
        if (!e.implicit_inputs.empty()) {
            oss << " |";
            for (const auto& in : e.implicit_inputs) oss << " " << in_path(in);
        }
        if (!e.order_only_inputs.empty()) {
            oss << " ||";
            for (const auto& in : e.order_only_inputs) oss << " " << in_path(in);
        }
        oss << "\n";

        if (e.kind == graph::EdgeKind::kPhony) {
            oss << "\n";
            continue;
        }

        if (e.command.per_edge) {
            oss << "  cmd = " << double_dollar(shell_join(detail::edge_argv(e, prefix))) << "\n";
        } else {
            for (const Slot s : {Slot::kFlags, Slot::kIncludes, Slot::kLibDirs, Slot::kLibs}) {
                const auto& values = toolchain::slot_values(e.bindings, s);
                if (values.empty() || !uses_slot(e.command, s)) continue;
                oss << "  " << toolchain::slot_name(s) << " = " << double_dollar(shell_join(values)) << "\n";
            }
        }
        oss << "  desc = " << double_dollar(e.description) << "\n\n";
    }

    if (!g.installs().empty()) {
        const std::vector<std::pair<std::string, std::vector<std::string>>> steps{
            {"install", detail::install_lines(g, prefix)},
            {"uninstall", detail::uninstall_lines(g)},
        };
        for (const auto& [step, lines] : steps) {
            std::string cmd{};
            for (const auto& line : lines) {
                if (!cmd.empty()) cmd += " && ";
                cmd += line;
            }
            oss << "build " << step << ": command";
            if (step == "install") {
                for (const auto& entry : g.installs()) oss << " " << in_path(entry.file);
            }
            oss << "\n";
            oss << "  cmd = " << double_dollar(cmd) << "\n";
            oss << "  desc = " << step << "\n";
            oss << "  pool = console\n\n";
        }
    }

    oss << "rule regenerate\n";
    oss << "  command = " << double_dollar(shell_join({opts.kiln_command, "regenerate", "."})) << "\n";
    oss << "  description = Regenerating build files\n";
    oss << "  generator = 1\n\n";
    oss << "build build.ninja: regenerate";
    for (const auto& in : opts.regen_inputs) oss << " " << in_path(in);
    oss << "\n";
    oss << "  pool = console\n\n";

    oss << "build all: phony";
    for (const auto& d : g.defaults()) oss << " " << in_path(d);
    oss << "\n\n";
    oss << "default all\n";

    return OutputFiles{{"build.ninja", oss.str()}};
}

} // namespace

std::unique_ptr<Emitter> make_ninja_emitter() {
    return std::make_unique<NinjaEmitter>();
}

} // namespace kiln::emit
