#include "EmitSupport.hpp"

#include <kiln/emit/Escape.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>

namespace kiln::emit {

namespace {

std::string variable_name(const std::string& rule) {
    std::string out{};
    for (char c : rule) {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_');
    }
    return out;
}

size_t leading_literals(const toolchain::CommandTemplate& tmpl) {
    size_t n = 0;
    while (n < tmpl.args.size() && tmpl.args[n].slot == toolchain::Slot::kLiteral) ++n;
    return n;
}

std::string parent_dir(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return {};
    return path.substr(0, slash);
}

class MakeEmitter final : public Emitter {
public:
    explicit MakeEmitter(MakeDialect dialect) : dialect_(dialect) {}

    std::string_view name() const override { return dialect_ == MakeDialect::kGnu ? "make" : "make-posix"; }

    bool supports(graph::EdgeKind kind) const override {
        return kind != graph::EdgeKind::kOrderOnly || dialect_ == MakeDialect::kGnu;
    }

    // grouped targets (`&:`) need GNU make 4.3
    bool supports_multi_output() const override { return dialect_ == MakeDialect::kGnu; }

    std::optional<OutputFiles> emit(const graph::Graph& g,
                                    const EmitOptions& opts,
                                    diag::Bag& diags) const override;

private:
    MakeDialect dialect_;
};

std::optional<OutputFiles> MakeEmitter::emit(const graph::Graph& g,
                                             const EmitOptions& opts,
                                             diag::Bag& diags) const {
    if (!detail::check_text(g, opts, diags)) return std::nullopt;
    if (!detail::check_edges(*this, g, diags)) return std::nullopt;

    const auto& prefix = opts.source_prefix;
    const bool gnu = dialect_ == MakeDialect::kGnu;
    auto target = [&](const graph::Path& p) { return make_target(graph::render(p, prefix)); };

    detail::RuleTable rules{};
    std::vector<std::string> edge_var(g.edges().size());
    for (size_t i = 0; i < g.edges().size(); ++i) {
        const auto& e = g.edges()[i];
        if (e.kind == graph::EdgeKind::kPhony || e.command.per_edge) continue;
        edge_var[i] = variable_name(rules.intern(e.command));
    }

    std::vector<std::string> phony{"all", "clean"};
    if (!g.installs().empty()) {
        phony.push_back("install");
        phony.push_back("uninstall");
    }
    for (const auto& e : g.edges()) {
        if (e.kind != graph::EdgeKind::kPhony) continue;
        for (const auto& o : e.outputs) phony.push_back(target(o));
    }

    std::ostringstream oss;
    oss << detail::header_comment();
    if (!gnu) oss << ".POSIX:\n";
    oss << "\n";

    for (const auto& [rule, tmpl] : rules.rules()) {
        const size_t n = leading_literals(tmpl);
        std::vector<std::string> tool{};
        for (size_t i = 0; i < n; ++i) tool.push_back(tmpl.args[i].text);
        oss << variable_name(rule) << " = " << double_dollar(shell_join(tool)) << "\n";
    }
    if (!rules.rules().empty()) oss << "\n";

    oss << "all:";
    for (const auto& d : g.defaults()) oss << " " << target(d);
    oss << "\n\n";

    oss << ".PHONY:";
    for (const auto& p : phony) oss << " " << p;
    oss << "\n\n";

    std::vector<std::string> cleaned{};
    std::vector<std::string> depfiles{};

    for (size_t i = 0; i < g.edges().size(); ++i) {
        const auto& e = g.edges()[i];

        for (size_t k = 0; k < e.outputs.size(); ++k) {
            if (k) oss << " ";
            oss << target(e.outputs[k]);
        }
        oss << (e.outputs.size() > 1 && e.kind != graph::EdgeKind::kPhony ? " &:" : ":");
        for (const auto& in : e.inputs) oss << " " << target(in);
        for (const auto& in : e.implicit_inputs) oss << " " << target(in);
        if (!e.order_only_inputs.empty()) {
            oss << " |";
            for (const auto& in : e.order_only_inputs) oss << " " << target(in);
        }
        oss << "\n";

        if (e.kind == graph::EdgeKind::kPhony) {
            oss << "\n";
            continue;
        }

        std::vector<std::string> dirs{};
        for (const auto& o : e.outputs) {
            const std::string rendered = graph::render(o, prefix);
            cleaned.push_back(rendered);
            const std::string dir = parent_dir(rendered);
            if (!dir.empty() && std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) dirs.push_back(dir);
        }
        if (!dirs.empty()) oss << "\t@mkdir -p " << double_dollar(shell_join(dirs)) << "\n";

        if (e.command.per_edge) {
            oss << "\t" << double_dollar(shell_join(detail::edge_argv(e, prefix))) << "\n";
        } else {
            graph::Edge rest = e;
            rest.command.args.erase(rest.command.args.begin(),
                                    rest.command.args.begin() +
                                        static_cast<std::ptrdiff_t>(leading_literals(e.command)));
            oss << "\t$(" << edge_var[i] << ") " << double_dollar(shell_join(detail::edge_argv(rest, prefix)))
                << "\n";
        }
        oss << "\n";

        if (e.depfile) {
            const std::string dep = graph::render(*e.depfile, prefix);
            cleaned.push_back(dep);
            depfiles.push_back(dep);
        }
    }

    if (!g.installs().empty()) {
        oss << "install:";
        for (const auto& entry : g.installs()) oss << " " << target(entry.file);
        oss << "\n";
        for (const auto& line : detail::install_lines(g, prefix)) oss << "\t" << double_dollar(line) << "\n";
        oss << "\n";

        oss << "uninstall:\n";
        for (const auto& line : detail::uninstall_lines(g)) oss << "\t" << double_dollar(line) << "\n";
        oss << "\n";
    }

    oss << "clean:\n";
    if (!cleaned.empty()) {
        std::vector<std::string> argv{"rm", "-f"};
        argv.insert(argv.end(), cleaned.begin(), cleaned.end());
        oss << "\t" << double_dollar(shell_join(argv)) << "\n";
    }
    oss << "\n";

    oss << "Makefile:";
    for (const auto& in : opts.regen_inputs) oss << " " << target(in);
    oss << "\n";
    oss << "\t" << double_dollar(shell_join({opts.kiln_command, "regenerate", "."})) << "\n";

    if (gnu && !depfiles.empty()) {
        oss << "\n-include";
        for (const auto& d : depfiles) oss << " " << make_include_path(d);
        oss << "\n";
    }

    return OutputFiles{{"Makefile", oss.str()}};
}

} // namespace

std::unique_ptr<Emitter> make_make_emitter(MakeDialect dialect) {
    return std::make_unique<MakeEmitter>(dialect);
}

} // namespace kiln::emit
