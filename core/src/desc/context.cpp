#include <kiln/desc/Context.hpp>

#include <kiln/os/File.hpp>

#include <algorithm>
#include <cctype>

namespace kiln::desc {

namespace {

bool valid_target_name(std::string_view s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s.front())) && s.front() != '_') return false;
    for (const char c : s) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::string site_text(const ast::Span& sp) {
    return sp.file + ":" + std::to_string(sp.line) + ":" + std::to_string(sp.column);
}

bool is_library(TargetKind k) {
    return k == TargetKind::kStaticLibrary || k == TargetKind::kSharedLibrary;
}

} // namespace

std::string source_prefix(const GenerationContext& gen) {
    const auto src = gen.source_root.lexically_normal();
    const auto bld = gen.build_root.lexically_normal();
    if (src == bld) return {};
    const auto rel = src.lexically_relative(bld);
    std::string out = rel.empty() ? src.generic_string() : rel.generic_string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out == ".") return {};
    return out;
}

std::string_view target_kind_name(TargetKind k) {
    switch (k) {
        case TargetKind::kExecutable: return "executable";
        case TargetKind::kStaticLibrary: return "static_library";
        case TargetKind::kSharedLibrary: return "shared_library";
        case TargetKind::kCustomCommand: return "command";
        case TargetKind::kAlias: return "alias";
    }
    return "unknown";
}

void Context::error(diag::Code code, const ast::Span& site, std::string msg) {
    diags_.add(code, site.file, site.line, site.column, std::move(msg));
}

bool Context::check_new_name(const std::string& name, const ast::Span& site) {
    if (!valid_target_name(name)) {
        error(diag::Code::D_INVALID_DECLARATION, site, "invalid target name '" + name + "'");
        return false;
    }
    if (graph::is_reserved_output(name)) {
        error(diag::Code::D_INVALID_DECLARATION, site, "target name '" + name + "' is reserved by the build files");
        return false;
    }
    if (const auto it = by_name_.find(name); it != by_name_.end()) {
        error(diag::Code::D_DUPLICATE_TARGET_NAME,
              site,
              "target '" + name + "' is already declared at " + site_text(registry_.get(it->second).site));
        return false;
    }
    return true;
}

bool Context::check_handle(TargetHandle h, const ast::Span& site, std::string_view what) {
    if (h.valid() && h.index() < registry_.targets.size()) return true;
    error(diag::Code::D_UNDECLARED_TARGET, site, std::string(what) + " refers to a target that is not declared");
    return false;
}

bool Context::normalize_source(const std::string& raw, const ast::Span& site, std::string& out) {
    if (raw.find('\n') != std::string::npos || !os::normalize_relative(raw, out)) {
        error(diag::Code::D_INVALID_DECLARATION,
              site,
              "invalid path '" + raw + "' (must be relative and stay inside its root)");
        return false;
    }
    return true;
}

TargetHandle Context::push(Target t) {
    const TargetHandle h(static_cast<uint32_t>(registry_.targets.size()));
    by_name_[t.name] = h;
    registry_.targets.push_back(std::move(t));
    return h;
}

std::optional<TargetHandle> Context::find(std::string_view name) const {
    const auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) return std::nullopt;
    return it->second;
}

bool Context::set_project(std::string name, std::string version, const ast::Span& site) {
    if (project_set_) {
        error(diag::Code::D_INVALID_DECLARATION, site, "project is declared more than once");
        return false;
    }
    project_set_ = true;
    registry_.project.name = std::move(name);
    registry_.project.version = std::move(version);
    return true;
}

std::optional<TargetHandle> Context::declare_compiled(TargetKind kind,
                                                      const std::string& name,
                                                      const std::vector<Ref>& sources,
                                                      const std::vector<std::string>& flags,
                                                      const std::vector<Ref>& links,
                                                      const std::vector<TargetHandle>& deps,
                                                      const std::vector<std::string>& includes,
                                                      std::optional<toolchain::Language> language,
                                                      const ast::Span& site) {
    using toolchain::Language;

    if (!check_new_name(name, site)) return std::nullopt;

    Target t{};
    t.name = name;
    t.kind = kind;
    t.site = site;
    t.flags = flags;
    t.deps = deps;

    const std::string who = std::string(target_kind_name(kind)) + " '" + name + "'";
    if (sources.empty()) {
        error(diag::Code::D_INVALID_DECLARATION, site, who + " has no sources");
        return std::nullopt;
    }

    for (const auto& src : sources) {
        if (src.is_target()) {
            if (!check_handle(src.target, site, who + " source")) return std::nullopt;
            const auto& gen = registry_.get(src.target);
            if (gen.kind != TargetKind::kCustomCommand) {
                error(diag::Code::D_INVALID_DECLARATION,
                      site,
                      who + " lists " + std::string(target_kind_name(gen.kind)) + " '" + gen.name +
                          "' as a source; only command outputs can be compiled");
                return std::nullopt;
            }
            for (const auto& out : gen.outputs) {
                const auto inferred = toolchain::language_for_source(out.rel);
                if (!inferred) {
                    t.generated_headers.push_back(out);
                    continue;
                }
                t.sources.push_back(SourceFile{out, language.value_or(*inferred)});
            }
            continue;
        }

        std::string rel{};
        if (!normalize_source(src.text, site, rel)) return std::nullopt;
        auto lang = language;
        if (!lang) lang = toolchain::language_for_source(rel);
        if (!lang) {
            error(diag::Code::D_INVALID_DECLARATION, site, "cannot infer the language of source '" + rel + "'");
            return std::nullopt;
        }
        t.sources.push_back(SourceFile{graph::source_path(rel), *lang});
    }

    if (t.sources.empty()) {
        error(diag::Code::D_INVALID_DECLARATION, site, who + " has no compilable sources");
        return std::nullopt;
    }

    for (const auto& inc : includes) {
        if (inc == ".") {
            t.includes.push_back("");
            continue;
        }
        std::string rel{};
        if (!normalize_source(inc, site, rel)) return std::nullopt;
        t.includes.push_back(rel);
    }

    bool any_cxx = std::any_of(t.sources.begin(), t.sources.end(), [](const SourceFile& s) {
        return s.language == Language::kCxx;
    });

    for (const auto& l : links) {
        if (!l.is_target()) {
            if (l.text.empty() || l.text.find_first_of(" \t\n") != std::string::npos) {
                error(diag::Code::D_INVALID_DECLARATION, site, who + " links invalid library name '" + l.text + "'");
                return std::nullopt;
            }
            t.links.push_back(l);
            continue;
        }
        if (!check_handle(l.target, site, who + " link")) return std::nullopt;
        const auto& lib = registry_.get(l.target);
        if (!is_library(lib.kind)) {
            error(diag::Code::D_INVALID_DECLARATION,
                  site,
                  who + " cannot link " + std::string(target_kind_name(lib.kind)) + " '" + lib.name + "'");
            return std::nullopt;
        }
        if (lib.link_language == Language::kCxx) any_cxx = true;
        t.links.push_back(l);
    }

    for (const auto& d : deps) {
        if (!check_handle(d, site, who + " dependency")) return std::nullopt;
    }

    t.link_language = any_cxx ? Language::kCxx : Language::kC;

    std::vector<Language> langs{t.link_language};
    for (const auto& s : t.sources) {
        if (std::find(langs.begin(), langs.end(), s.language) == langs.end()) langs.push_back(s.language);
    }
    for (const auto lang : langs) {
        auto tc = toolchains_.lookup(toolchain::Key{lang, gen_.platform, gen_.family}, site, diags_);
        if (!tc) return std::nullopt;
        t.toolchains[lang] = std::move(tc);
    }

    const auto* tc = t.link_toolchain();
    switch (kind) {
        case TargetKind::kExecutable:
            t.outputs.push_back(graph::build_path(tc->executable_name(name)));
            break;
        case TargetKind::kStaticLibrary:
            t.outputs.push_back(graph::build_path(tc->static_library_name(name)));
            break;
        case TargetKind::kSharedLibrary:
            t.outputs.push_back(graph::build_path(tc->shared_library_name(name)));
            break;
        case TargetKind::kCustomCommand:
        case TargetKind::kAlias:
            break;
    }

    return push(std::move(t));
}

std::optional<TargetHandle> Context::declare_executable(const ExecutableDecl& d) {
    return declare_compiled(TargetKind::kExecutable,
                            d.name,
                            d.sources,
                            d.flags,
                            d.links,
                            d.deps,
                            d.includes,
                            d.language,
                            d.site);
}

std::optional<TargetHandle> Context::declare_library(const LibraryDecl& d) {
    return declare_compiled(d.kind == LibraryKind::kShared ? TargetKind::kSharedLibrary : TargetKind::kStaticLibrary,
                            d.name,
                            d.sources,
                            d.flags,
                            d.links,
                            d.deps,
                            d.includes,
                            d.language,
                            d.site);
}

std::optional<TargetHandle> Context::declare_custom_command(const CommandDecl& d) {
    if (!check_new_name(d.name, d.site)) return std::nullopt;

    Target t{};
    t.name = d.name;
    t.kind = TargetKind::kCustomCommand;
    t.site = d.site;

    const std::string who = "command '" + d.name + "'";
    if (d.outputs.empty()) {
        error(diag::Code::D_INVALID_DECLARATION, d.site, who + " has no outputs");
        return std::nullopt;
    }
    if (d.command.empty()) {
        error(diag::Code::D_INVALID_DECLARATION, d.site, who + " has an empty run list");
        return std::nullopt;
    }

    for (const auto& raw : d.outputs) {
        std::string rel{};
        if (!normalize_source(raw, d.site, rel)) return std::nullopt;
        if (graph::is_reserved_output(rel)) {
            error(diag::Code::D_INVALID_DECLARATION,
                  d.site,
                  who + " output '" + rel + "' is reserved by the build files");
            return std::nullopt;
        }
        const auto p = graph::build_path(rel);
        if (std::find(t.outputs.begin(), t.outputs.end(), p) != t.outputs.end()) {
            error(diag::Code::D_INVALID_DECLARATION, d.site, who + " lists output '" + rel + "' twice");
            return std::nullopt;
        }
        t.outputs.push_back(p);
    }

    for (const auto& in : d.inputs) {
        if (in.is_target()) {
            if (!check_handle(in.target, d.site, who + " input")) return std::nullopt;
            const auto& src = registry_.get(in.target);
            t.inputs.insert(t.inputs.end(), src.outputs.begin(), src.outputs.end());
            continue;
        }
        std::string rel{};
        if (!normalize_source(in.text, d.site, rel)) return std::nullopt;
        t.inputs.push_back(graph::source_path(rel));
    }

    for (const auto& arg : d.command) {
        if (!arg.is_target()) {
            if (arg.text == "$in") {
                t.run.push_back(toolchain::TemplateArg{toolchain::Slot::kIn, {}});
            } else if (arg.text == "$out") {
                t.run.push_back(toolchain::TemplateArg{toolchain::Slot::kOut, {}});
            } else {
                t.run.push_back(toolchain::TemplateArg{toolchain::Slot::kLiteral, arg.text});
            }
            continue;
        }
        if (!check_handle(arg.target, d.site, who + " run argument")) return std::nullopt;
        const auto& tool = registry_.get(arg.target);
        if (tool.kind == TargetKind::kAlias) {
            error(diag::Code::D_INVALID_DECLARATION,
                  d.site,
                  who + " cannot use alias '" + tool.name + "' as a command argument");
            return std::nullopt;
        }
        t.run.push_back(toolchain::TemplateArg{toolchain::Slot::kLiteral, tool.outputs.front().rel});
        if (std::find(t.input_targets.begin(), t.input_targets.end(), arg.target) == t.input_targets.end()) {
            t.input_targets.push_back(arg.target);
        }
    }

    for (const auto& h : d.order_only) {
        if (!check_handle(h, d.site, who + " order-only dependency")) return std::nullopt;
        t.order_only.push_back(h);
    }

    return push(std::move(t));
}

std::optional<TargetHandle> Context::declare_alias(const std::string& name,
                                                   const std::vector<TargetHandle>& members,
                                                   const ast::Span& site) {
    if (!check_new_name(name, site)) return std::nullopt;
    if (members.empty()) {
        error(diag::Code::D_INVALID_DECLARATION, site, "alias '" + name + "' has no members");
        return std::nullopt;
    }
    for (const auto& m : members) {
        if (!check_handle(m, site, "alias '" + name + "' member")) return std::nullopt;
    }

    Target t{};
    t.name = name;
    t.kind = TargetKind::kAlias;
    t.site = site;
    t.members = members;
    t.outputs.push_back(graph::build_path(name));
    return push(std::move(t));
}

bool Context::declare_global_flags(const std::vector<std::string>& flags,
                                   toolchain::Language language,
                                   const ast::Span& site) {
    for (const auto& f : flags) {
        if (f.find('\n') != std::string::npos) {
            error(diag::Code::D_INVALID_DECLARATION, site, "global flag '" + f + "' has a line break");
            return false;
        }
    }
    auto& dst = registry_.global_flags[language];
    dst.insert(dst.end(), flags.begin(), flags.end());
    return true;
}

const opt::OptionValue* Context::reference_option(std::string_view name, const ast::Span& site) {
    const auto* v = gen_.options.find(name);
    if (v == nullptr) {
        error(diag::Code::O_UNKNOWN_OPTION, site, "option '" + std::string(name) + "' is not declared");
    }
    return v;
}

bool Context::set_default(const std::vector<TargetHandle>& targets, const ast::Span& site) {
    for (const auto& h : targets) {
        if (!check_handle(h, site, "default")) return false;
    }
    registry_.has_default_statement = true;
    for (const auto& h : targets) {
        if (std::find(registry_.defaults.begin(), registry_.defaults.end(), h) == registry_.defaults.end()) {
            registry_.defaults.push_back(h);
        }
    }
    return true;
}

bool Context::install(const std::vector<TargetHandle>& targets, const ast::Span& site) {
    for (const auto& h : targets) {
        if (!check_handle(h, site, "install")) return false;
        const auto& t = registry_.get(h);
        if (t.kind != TargetKind::kExecutable && !is_library(t.kind)) {
            error(diag::Code::D_INVALID_DECLARATION,
                  site,
                  "cannot install " + std::string(target_kind_name(t.kind)) + " '" + t.name + "'");
            return false;
        }
    }
    for (const auto& h : targets) {
        if (std::find(registry_.installs.begin(), registry_.installs.end(), h) == registry_.installs.end()) {
            registry_.installs.push_back(h);
        }
        // installed targets are always built by `all`
        if (std::find(registry_.defaults.begin(), registry_.defaults.end(), h) == registry_.defaults.end()) {
            registry_.defaults.push_back(h);
        }
    }
    return true;
}

} // namespace kiln::desc
