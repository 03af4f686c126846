#include "EmitSupport.hpp"

#include <kiln/Version.hpp>
#include <kiln/emit/Escape.hpp>
#include <kiln/os/File.hpp>

namespace kiln::emit {

namespace detail {

namespace {

const std::string k_install_root = "\"${DESTDIR}${PREFIX:-/usr/local}\"";

} // namespace

const std::string& RuleTable::intern(const toolchain::CommandTemplate& tmpl) {
    size_t same_name = 0;
    for (const auto& [name, known] : rules_) {
        if (known == tmpl) return name;
        if (known.rule == tmpl.rule) ++same_name;
    }
    std::string name = tmpl.rule;
    if (same_name > 0) name += "_" + std::to_string(same_name);
    rules_.emplace_back(std::move(name), tmpl);
    return rules_.back().first;
}

bool check_text(const graph::Graph& g, const EmitOptions& opts, diag::Bag& diags) {
    auto bad = [&](const graph::Edge& e, const std::string& what) {
        diags.add(diag::Code::E_INVALID_TEXT,
                  e.site.file,
                  e.site.line,
                  e.site.column,
                  "target '" + e.target + "' has a line break in " + what);
        return false;
    };

    for (const auto& e : g.edges()) {
        for (const auto* paths : {&e.inputs, &e.implicit_inputs, &e.order_only_inputs, &e.outputs}) {
            for (const auto& p : *paths) {
                if (has_newline(p.rel)) return bad(e, "path '" + p.rel + "'");
            }
        }
        for (const auto& a : e.command.args) {
            if (has_newline(a.text)) return bad(e, "command argument '" + a.text + "'");
        }
        for (const auto* values : {&e.bindings.flags, &e.bindings.includes, &e.bindings.libdirs, &e.bindings.libs}) {
            for (const auto& v : *values) {
                if (has_newline(v)) return bad(e, "argument '" + v + "'");
            }
        }
    }

    if (has_newline(opts.source_prefix) || has_newline(opts.kiln_command)) {
        diags.add(diag::Code::E_INVALID_TEXT, "<command-line>", 1, 1, "line break in the source or kiln path");
        return false;
    }
    return true;
}

bool check_edges(const Emitter& emitter, const graph::Graph& g, diag::Bag& diags) {
    for (const auto& e : g.edges()) {
        std::string why{};
        if (!emitter.supports(e.kind)) {
            why = "edge kind '" + std::string(graph::edge_kind_name(e.kind)) + "'";
        } else if (e.kind != graph::EdgeKind::kPhony && e.outputs.size() > 1 && !emitter.supports_multi_output()) {
            why = "an edge with multiple outputs";
        }
        if (why.empty()) continue;

        std::string outs{};
        for (const auto& o : e.outputs) {
            if (!outs.empty()) outs += " ";
            outs += o.rel;
        }
        diags.add(diag::Code::E_UNSUPPORTED_EDGE_KIND,
                  e.site.file,
                  e.site.line,
                  e.site.column,
                  "backend '" + std::string(emitter.name()) + "' cannot express " + why + " of target '" +
                      e.target + "' (" + outs + ")");
        return false;
    }
    return true;
}

std::vector<std::string> edge_argv(const graph::Edge& e, const std::string& source_prefix) {
    toolchain::Bindings b = e.bindings;
    for (const auto& p : e.inputs) b.in.push_back(graph::render(p, source_prefix));
    for (const auto& p : e.outputs) b.out.push_back(graph::render(p, source_prefix));
    if (e.depfile) b.depfile = graph::render(*e.depfile, source_prefix);
    return toolchain::expand(e.command, b);
}

std::vector<std::string> install_lines(const graph::Graph& g, const std::string& source_prefix) {
    std::vector<std::string> out{};
    for (const auto& entry : g.installs()) {
        const auto slash = entry.destination.find_last_of('/');
        const std::string dir = entry.destination.substr(0, slash);
        out.push_back("mkdir -p " + k_install_root + shell_quote("/" + dir) + " && cp " +
                      shell_quote(graph::render(entry.file, source_prefix)) + " " + k_install_root +
                      shell_quote("/" + entry.destination));
    }
    return out;
}

std::vector<std::string> uninstall_lines(const graph::Graph& g) {
    std::vector<std::string> out{};
    for (const auto& entry : g.installs()) {
        out.push_back("rm -f " + k_install_root + shell_quote("/" + entry.destination));
    }
    return out;
}

std::string header_comment() {
    return "# Generated by kiln " + std::string(k_version_string) + ". Do not edit this file!\n";
}

} // namespace detail

std::optional<MakeDialect> parse_make_dialect(std::string_view s) {
    if (s == "gnu") return MakeDialect::kGnu;
    if (s == "posix") return MakeDialect::kPosix;
    return std::nullopt;
}

bool is_known_backend(std::string_view backend) {
    return backend == "ninja" || backend == "make" || backend == "make-posix";
}

std::unique_ptr<Emitter> make_emitter(std::string_view backend, MakeDialect make_dialect) {
    if (backend == "ninja") return make_ninja_emitter();
    if (backend == "make") return make_make_emitter(make_dialect);
    if (backend == "make-posix") return make_make_emitter(MakeDialect::kPosix);
    return nullptr;
}

bool write_outputs(const std::filesystem::path& build_root, const OutputFiles& files, diag::Bag& diags) {
    std::error_code ec{};
    std::filesystem::create_directories(build_root, ec);
    if (ec) {
        diags.add(diag::Code::E_WRITE_FAILED,
                  build_root.string(),
                  1,
                  1,
                  "cannot create build directory: " + ec.message());
        return false;
    }

    for (const auto& [name, content] : files) {
        const auto path = build_root / name;
        std::string err{};
        if (!os::write_file_atomic(path, content, err)) {
            diags.add(diag::Code::E_WRITE_FAILED, path.string(), 1, 1, "cannot write file: " + err);
            return false;
        }
    }
    return true;
}

} // namespace kiln::emit
