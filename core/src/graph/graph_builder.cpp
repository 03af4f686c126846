#include <kiln/graph/BuildGraph.hpp>

#include <algorithm>
#include <functional>
#include <set>

namespace kiln::graph {

namespace {

std::string description_for(const toolchain::CommandTemplate& tmpl, const std::string& what) {
    if (tmpl.rule == "cc") return "CC " + what;
    if (tmpl.rule == "cxx") return "CXX " + what;
    if (tmpl.rule == "ar") return "AR " + what;
    return "LINK " + what;
}

void push_unique(std::vector<std::string>& xs, std::string s) {
    if (std::find(xs.begin(), xs.end(), s) == xs.end()) xs.push_back(std::move(s));
}

void push_unique(std::vector<Path>& xs, const Path& p) {
    if (std::find(xs.begin(), xs.end(), p) == xs.end()) xs.push_back(p);
}

template <typename F>
void for_each_input(const Edge& e, F&& fn) {
    for (const auto& p : e.inputs) fn(p);
    for (const auto& p : e.implicit_inputs) fn(p);
    for (const auto& p : e.order_only_inputs) fn(p);
}

} // namespace

std::string_view edge_kind_name(EdgeKind k) {
    switch (k) {
        case EdgeKind::kNormal: return "normal";
        case EdgeKind::kPhony: return "phony";
        case EdgeKind::kOrderOnly: return "order-only";
    }
    return "unknown";
}

const FileNode* Graph::find(const Path& p) const {
    const auto it = node_index_.find(p.key());
    if (it == node_index_.end()) return nullptr;
    return &nodes_[it->second];
}

std::optional<std::vector<std::size_t>> Graph::topological_order() const {
    const std::size_t n = edges_.size();
    std::vector<std::size_t> indeg(n, 0);
    std::vector<std::vector<std::size_t>> dependents(n);

    for (std::size_t i = 0; i < n; ++i) {
        std::set<std::size_t> deps{};
        bool self_loop = false;
        for_each_input(edges_[i], [&](const Path& p) {
            const auto* node = find(p);
            if (node == nullptr || !node->producer) return;
            if (*node->producer == i) {
                self_loop = true;
                return;
            }
            deps.insert(*node->producer);
        });
        if (self_loop) return std::nullopt;
        indeg[i] = deps.size();
        for (const auto d : deps) dependents[d].push_back(i);
    }

    std::set<std::size_t> ready{};
    for (std::size_t i = 0; i < n; ++i) {
        if (indeg[i] == 0) ready.insert(i);
    }

    std::vector<std::size_t> order{};
    order.reserve(n);
    while (!ready.empty()) {
        const std::size_t cur = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(cur);
        for (const auto d : dependents[cur]) {
            if (--indeg[d] == 0) ready.insert(d);
        }
    }

    if (order.size() != n) return std::nullopt;
    return order;
}

void Builder::error(diag::Code code, const ast::Span& site, std::string msg) {
    diags_.add(code, site.file, site.line, site.column, std::move(msg));
}

std::size_t Builder::node_for(const Path& p) {
    const std::string key = p.key();
    if (const auto it = g_.node_index_.find(key); it != g_.node_index_.end()) return it->second;
    const std::size_t idx = g_.nodes_.size();
    g_.nodes_.push_back(FileNode{p, std::nullopt, {}});
    g_.node_index_[key] = idx;
    return idx;
}

bool Builder::add_edge(Edge e) {
    const std::size_t idx = g_.edges_.size();

    std::vector<std::size_t> outs{};
    for (const auto& out : e.outputs) {
        const std::size_t n = node_for(out);
        if (const auto prev = g_.nodes_[n].producer) {
            error(diag::Code::G_CONFLICTING_OUTPUT,
                  e.site,
                  "output '" + out.rel + "' is produced by both target '" + g_.edges_[*prev].target +
                      "' and target '" + e.target + "'");
            return false;
        }
        if (std::find(outs.begin(), outs.end(), n) != outs.end()) {
            error(diag::Code::G_CONFLICTING_OUTPUT,
                  e.site,
                  "output '" + out.rel + "' is listed twice by target '" + e.target + "'");
            return false;
        }
        outs.push_back(n);
    }
    for (const auto n : outs) g_.nodes_[n].producer = idx;

    for_each_input(e, [&](const Path& p) {
        auto& consumers = g_.nodes_[node_for(p)].consumers;
        if (consumers.empty() || consumers.back() != idx) consumers.push_back(idx);
    });

    g_.edges_.push_back(std::move(e));
    return true;
}

std::vector<Path> Builder::outputs_of(const std::vector<desc::TargetHandle>& hs) const {
    std::vector<Path> out{};
    for (const auto& h : hs) {
        for (const auto& p : registry_.get(h).outputs) push_unique(out, p);
    }
    return out;
}

void Builder::collect_links(const desc::Target& t,
                            std::vector<const desc::Target*>& libs,
                            std::vector<std::string>& externals) const {
    std::function<void(const desc::Target&)> walk = [&](const desc::Target& cur) {
        for (const auto& l : cur.links) {
            if (!l.is_target()) {
                push_unique(externals, l.text);
                continue;
            }
            const auto* lib = &registry_.get(l.target);
            if (std::find(libs.begin(), libs.end(), lib) != libs.end()) continue;
            libs.push_back(lib);
            // a static archive does not carry its own dependencies
            if (lib->kind == desc::TargetKind::kStaticLibrary) walk(*lib);
        }
    };
    walk(t);
}

bool Builder::expand_compiled(const desc::Target& t) {
    std::vector<const desc::Target*> libs{};
    std::vector<std::string> externals{};
    collect_links(t, libs, externals);

    std::vector<std::string> include_dirs{};
    for (const auto& inc : t.includes) push_unique(include_dirs, render(source_path(inc), source_prefix_));
    for (const auto* lib : libs) {
        for (const auto& inc : lib->includes) push_unique(include_dirs, render(source_path(inc), source_prefix_));
    }

    std::vector<Path> order_only = t.generated_headers;
    for (const auto& p : outputs_of(t.deps)) push_unique(order_only, p);
    if (!order_only.empty()) push_unique(include_dirs, render(build_path(""), source_prefix_));

    std::vector<Path> objects{};
    for (const auto& src : t.sources) {
        const auto& tc = *t.toolchains.at(src.language);

        std::vector<std::string> flags{};
        if (const auto it = registry_.global_flags.find(src.language); it != registry_.global_flags.end()) {
            flags = it->second;
        }
        flags.insert(flags.end(), t.flags.begin(), t.flags.end());
        if (t.kind == desc::TargetKind::kSharedLibrary && !tc.pic_flag.empty()) flags.push_back(tc.pic_flag);

        Edge e{};
        e.kind = order_only.empty() ? EdgeKind::kNormal : EdgeKind::kOrderOnly;
        e.target = t.name;
        e.rule = tc.compile.rule;
        e.inputs = {src.path};
        e.order_only_inputs = order_only;
        const Path obj = build_path(t.name + ".dir/" + tc.object_name(src.path.rel));
        e.outputs = {obj};
        e.command = tc.compile;
        e.bindings.flags = std::move(flags);
        for (const auto& dir : include_dirs) e.bindings.includes.push_back(tc.include_flag(dir));
        if (tc.deps == toolchain::DepsStyle::kGcc) e.depfile = build_path(obj.rel + ".d");
        e.deps = tc.deps;
        e.description = description_for(tc.compile, obj.rel);
        e.site = t.site;
        if (!add_edge(std::move(e))) return false;
        objects.push_back(obj);
    }

    const auto* tc = t.link_toolchain();
    Edge link{};
    link.kind = EdgeKind::kNormal;
    link.target = t.name;
    link.inputs = objects;
    link.outputs = t.outputs;
    link.site = t.site;

    if (t.kind == desc::TargetKind::kStaticLibrary) {
        link.command = tc->archive;
    } else {
        link.command = t.kind == desc::TargetKind::kExecutable ? tc->link_executable : tc->link_shared;

        bool any_shared = false;
        for (const auto* lib : libs) {
            push_unique(link.implicit_inputs, lib->outputs.front());
            push_unique(link.bindings.libdirs, tc->libdir_flag(render(build_path(""), source_prefix_)));
            link.bindings.libs.push_back(tc->link_flag(lib->name));
            if (lib->kind == desc::TargetKind::kSharedLibrary) any_shared = true;
        }
        for (const auto& ext : externals) link.bindings.libs.push_back(tc->link_flag(ext));
        if (any_shared && !tc->rpath_flag.empty()) link.bindings.flags.push_back(tc->rpath_flag);
    }
    link.rule = link.command.rule;
    link.description = description_for(link.command, t.outputs.front().rel);
    return add_edge(std::move(link));
}

bool Builder::expand_command(const desc::Target& t) {
    Edge e{};
    e.target = t.name;
    e.rule = "command";
    e.inputs = t.inputs;
    e.implicit_inputs = outputs_of(t.input_targets);
    e.order_only_inputs = outputs_of(t.order_only);
    e.kind = e.order_only_inputs.empty() ? EdgeKind::kNormal : EdgeKind::kOrderOnly;
    e.outputs = t.outputs;
    e.command = toolchain::CommandTemplate{"command", t.run, true};
    e.description = "GEN";
    for (const auto& o : t.outputs) e.description += " " + o.rel;
    e.site = t.site;
    return add_edge(std::move(e));
}

bool Builder::expand_alias(const desc::Target& t) {
    Edge e{};
    e.kind = EdgeKind::kPhony;
    e.target = t.name;
    e.rule = "phony";
    e.inputs = outputs_of(t.members);
    e.outputs = t.outputs;
    e.description = t.name;
    e.site = t.site;
    return add_edge(std::move(e));
}

bool Builder::add_phony_name(const desc::Target& t) {
    TargetInfo info{};
    info.name = t.name;
    info.kind = t.kind;
    info.outputs = t.outputs;
    info.site = t.site;

    const Path named = build_path(t.name);
    if (t.kind == desc::TargetKind::kAlias || (t.outputs.size() == 1 && t.outputs.front() == named)) {
        info.phony_name = t.outputs.front();
        g_.targets_.push_back(std::move(info));
        return true;
    }

    info.phony_name = named;
    g_.targets_.push_back(std::move(info));

    Edge e{};
    e.kind = EdgeKind::kPhony;
    e.target = t.name;
    e.rule = "phony";
    e.inputs = t.outputs;
    e.outputs = {named};
    e.description = t.name;
    e.site = t.site;
    return add_edge(std::move(e));
}

bool Builder::expand_target(const desc::Target& t) {
    bool ok = false;
    switch (t.kind) {
        case desc::TargetKind::kExecutable:
        case desc::TargetKind::kStaticLibrary:
        case desc::TargetKind::kSharedLibrary:
            ok = expand_compiled(t);
            break;
        case desc::TargetKind::kCustomCommand:
            ok = expand_command(t);
            break;
        case desc::TargetKind::kAlias:
            ok = expand_alias(t);
            break;
    }
    return ok && add_phony_name(t);
}

bool Builder::check_cycles() {
    enum class Mark : uint8_t { kNone, kVisiting, kDone };
    std::vector<Mark> mark(g_.nodes_.size(), Mark::kNone);
    std::vector<std::size_t> stack{};

    std::function<bool(std::size_t)> dfs = [&](std::size_t n) -> bool {
        if (mark[n] == Mark::kVisiting) {
            const auto start = std::find(stack.begin(), stack.end(), n);
            std::string chain{};
            for (auto it = start; it != stack.end(); ++it) {
                chain += g_.nodes_[*it].path.rel + " -> ";
            }
            chain += g_.nodes_[n].path.rel;
            const auto& producer = g_.edges_[*g_.nodes_[n].producer];
            error(diag::Code::G_CYCLIC_DEPENDENCY, producer.site, "dependency cycle detected: " + chain);
            return false;
        }
        if (mark[n] == Mark::kDone) return true;

        mark[n] = Mark::kVisiting;
        stack.push_back(n);
        if (const auto p = g_.nodes_[n].producer) {
            bool ok = true;
            for_each_input(g_.edges_[*p], [&](const Path& in) {
                if (!ok) return;
                ok = dfs(g_.node_index_.at(in.key()));
            });
            if (!ok) return false;
        }
        stack.pop_back();
        mark[n] = Mark::kDone;
        return true;
    };

    for (std::size_t n = 0; n < g_.nodes_.size(); ++n) {
        if (!dfs(n)) return false;
    }
    return true;
}

bool Builder::check_inputs() {
    bool ok = true;
    for (const auto& node : g_.nodes_) {
        if (node.producer) continue;
        if (node.is_source() && fs_.exists(node.path.rel)) continue;

        const auto& consumer = g_.edges_[node.consumers.front()];
        const std::string where = node.is_source() ? "source file '" + node.path.rel + "' does not exist"
                                                   : "build file '" + node.path.rel + "' has no producing edge";
        error(diag::Code::G_DANGLING_INPUT,
              consumer.site,
              where + " (needed by target '" + consumer.target + "' for '" + consumer.outputs.front().rel + "')");
        ok = false;
    }
    return ok;
}

bool Builder::check_producers() {
    for (std::size_t i = 0; i < g_.nodes_.size(); ++i) {
        const auto& node = g_.nodes_[i];
        if (node.is_source() == !node.producer) continue;
        const auto& site = node.producer ? g_.edges_[*node.producer].site : g_.edges_[node.consumers.front()].site;
        error(node.producer ? diag::Code::G_CONFLICTING_OUTPUT : diag::Code::G_DANGLING_INPUT,
              site,
              "node '" + node.path.key() + "' violates the single-producer rule");
        return false;
    }
    return true;
}

std::optional<Graph> Builder::build() {
    g_ = Graph{};
    g_.project_ = registry_.project;

    for (const auto& t : registry_.targets) {
        if (!expand_target(t)) return std::nullopt;
    }
    if (!check_cycles()) return std::nullopt;
    if (!check_inputs()) return std::nullopt;
    if (!check_producers()) return std::nullopt;

    if (registry_.has_default_statement) {
        for (const auto& h : registry_.defaults) g_.defaults_.push_back(g_.targets_[h.index()].phony_name);
    } else {
        for (const auto& t : g_.targets_) g_.defaults_.push_back(t.phony_name);
    }

    std::vector<const desc::Target*> installed{};
    for (const auto& h : registry_.installs) installed.push_back(&registry_.get(h));
    // shared libraries an installed target loads at run time go with it
    for (size_t i = 0; i < installed.size(); ++i) {
        std::vector<const desc::Target*> libs{};
        std::vector<std::string> externals{};
        collect_links(*installed[i], libs, externals);
        for (const auto* lib : libs) {
            if (lib->kind != desc::TargetKind::kSharedLibrary) continue;
            if (std::find(installed.begin(), installed.end(), lib) == installed.end()) installed.push_back(lib);
        }
    }

    for (const auto* tp : installed) {
        const auto& t = *tp;
        const bool windows_dll = t.kind == desc::TargetKind::kSharedLibrary &&
                                 t.link_toolchain() != nullptr &&
                                 t.link_toolchain()->key.platform == toolchain::Platform::kWindows;
        const std::string dir = (t.kind == desc::TargetKind::kExecutable || windows_dll) ? "bin" : "lib";
        for (const auto& out : t.outputs) {
            const auto slash = out.rel.find_last_of('/');
            const std::string base = slash == std::string::npos ? out.rel : out.rel.substr(slash + 1);
            g_.installs_.push_back(InstallEntry{t.name, t.kind, out, dir + "/" + base});
        }
    }

    return std::move(g_);
}

std::optional<Graph> build_graph(const desc::TargetRegistry& registry,
                                 const desc::GenerationContext& gen,
                                 const os::FileSystemView& fs,
                                 diag::Bag& diags) {
    Builder b(registry, desc::source_prefix(gen), fs, diags);
    return b.build();
}

} // namespace kiln::graph
