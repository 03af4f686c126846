#include <kiln_tool/driver/Driver.hpp>

#include <kiln/Version.hpp>
#include <kiln/config/Config.hpp>
#include <kiln/emit/Emitter.hpp>
#include <kiln/project/Project.hpp>
#include <kiln_tool/proc/Process.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace kiln_tool::driver {

namespace {

namespace fs = std::filesystem;

// Status lines on stderr: `[ 40%]` progress and `[WARN]`/`[FAIL]`/`[DONE]`
// tags, coloured when `ui.color` and the terminal allow it.
class Console {
public:
    Console() : Console("auto", true) {}
    Console(std::string_view color_mode, bool progress)
        : color_(wants_color(color_mode)), progress_(progress) {}

    Console quiet() const {
        Console c = *this;
        c.progress_ = false;
        return c;
    }

    void progress(int pct, std::string_view message) const {
        if (!progress_) return;
        char head[8];
        std::snprintf(head, sizeof(head), "[%3d%%]", pct);
        std::cerr << paint(head, k_green) << " " << message << "\n";
    }
    void warn(std::string_view message) const { line("WARN", k_orange, message); }
    void fail(std::string_view message) const { line("FAIL", k_red, message); }
    void done(std::string_view message) const {
        if (progress_) line("DONE", k_green, message);
    }

private:
    static constexpr std::string_view k_reset = "\033[0m";
    static constexpr std::string_view k_green = "\033[32m";
    static constexpr std::string_view k_red = "\033[31m";
    static constexpr std::string_view k_orange = "\033[38;5;208m";

    static bool wants_color(std::string_view mode) {
        if (mode == "never" || mode == "always") return mode == "always";
        if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(fileno(stderr)) != 0;
#endif
    }

    std::string paint(std::string_view text, std::string_view ansi) const {
        if (!color_) return std::string(text);
        return std::string(ansi) + std::string(text) + std::string(k_reset);
    }

    void line(std::string_view word, std::string_view ansi, std::string_view message) const {
        std::cerr << "[" << paint(word, ansi) << "] " << message << "\n";
    }

    bool color_ = false;
    bool progress_ = true;
};

struct RuntimeConfig {
    kiln::config::LoadedConfig loaded{};
    kiln::config::EffectiveSettings settings{};
    Console out{};
};

bool load_runtime_config(const fs::path& source_root, RuntimeConfig& out) {
    std::string err{};
    if (!kiln::config::load(source_root, out.loaded, err)) {
        Console{}.fail(err);
        return false;
    }
    out.settings = kiln::config::materialize(out.loaded, &out.loaded.warnings);
    out.out = Console(out.settings.ui_color, out.settings.ui_progress);
    for (const auto& w : out.loaded.warnings) out.out.warn(w);
    return true;
}

fs::path absolute_dir(std::string_view raw) {
    std::error_code ec{};
    fs::path p = fs::absolute(fs::path(raw), ec);
    if (ec) p = fs::path(raw);
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
    return p;
}

std::string kiln_command(const char* argv0) {
    const std::string s = argv0 != nullptr ? argv0 : "kiln";
    if (s.find('/') == std::string::npos) return s;
    return absolute_dir(s).string();
}

std::string join(const std::vector<std::string>& xs, std::string_view sep) {
    std::string out{};
    for (const auto& x : xs) {
        if (!out.empty()) out += sep;
        out += x;
    }
    return out;
}

int report(const kiln::diag::Bag& bag, const Console& out) {
    std::cerr << bag.render_text();
    out.fail("generation failed");
    return kiln::diag::exit_code_for(bag);
}

// Configure inputs after merging the command line, kiln.toml and (for
// regenerate) the recorded environment.
struct GenerateRequest {
    fs::path source_root{};
    fs::path build_root{};
    std::vector<std::string> backends{};
    std::string toolchain{};
    std::string platform{};
    std::string make_dialect{};
    std::vector<std::string> defines{};
    kiln::toolchain::Environment env{};
    bool verbose = false;
};

GenerateRequest request_from(const fs::path& source_root,
                             const fs::path& build_root,
                             const cli::SelectOptions& sel,
                             const RuntimeConfig& rt) {
    GenerateRequest g{};
    g.source_root = source_root;
    g.build_root = build_root;
    g.backends = sel.backends.empty() ? rt.settings.build_backends : sel.backends;
    g.toolchain = sel.toolchain.value_or(rt.settings.toolchain_family);
    g.platform = sel.platform.value_or(rt.settings.toolchain_platform);
    g.make_dialect = rt.settings.make_dialect;
    g.defines = sel.defines;
    g.env = kiln::toolchain::capture_environment();
    return g;
}

bool to_project_request(const GenerateRequest& g,
                        const RuntimeConfig& rt,
                        kiln::project::Request& out,
                        kiln::diag::Bag& bag) {
    using kiln::diag::Code;

    out.source_root = g.source_root;
    out.build_root = g.build_root;
    out.env = g.env;
    out.project_overrides = rt.settings.option_overrides;

    const auto family = kiln::toolchain::parse_family(g.toolchain);
    if (!family) {
        bag.add(Code::T_UNSUPPORTED_TOOLCHAIN, "<command-line>", 1, 1, "unknown toolchain family '" + g.toolchain + "'");
        return false;
    }
    out.family = *family;

    if (g.platform.empty()) {
        out.platform = kiln::toolchain::host_platform();
    } else if (const auto p = kiln::toolchain::parse_platform(g.platform)) {
        out.platform = *p;
    } else {
        bag.add(Code::T_UNSUPPORTED_TOOLCHAIN, "<command-line>", 1, 1, "unknown platform '" + g.platform + "'");
        return false;
    }

    for (const auto& d : g.defines) {
        kiln::opt::CliOverride ov{};
        std::string err{};
        if (!kiln::opt::parse_cli_override(d, ov, err)) {
            bag.add(Code::O_INVALID_OPTION, "<command-line>", 1, 1, "-D " + err);
            return false;
        }
        out.cli_overrides.push_back(std::move(ov));
    }
    return true;
}

std::optional<kiln::project::Loaded> load_description(const GenerateRequest& g,
                                                      const RuntimeConfig& rt,
                                                      kiln::project::Request& req,
                                                      kiln::diag::Bag& bag,
                                                      const Console& out) {
    if (!to_project_request(g, rt, req, bag)) return std::nullopt;

    static constexpr int k_stage_pct[] = {10, 25, 40, 60};
    size_t stage = 0;
    return kiln::project::load(req, bag, [&](std::string_view label) {
        out.progress(k_stage_pct[std::min<size_t>(stage, 3)], label);
        ++stage;
    });
}

// Renders every requested backend in memory; nothing is written unless all
// of them succeed.
std::optional<kiln::emit::OutputFiles> emit_all(const GenerateRequest& g,
                                                const kiln::project::Loaded& loaded,
                                                const char* argv0,
                                                kiln::diag::Bag& bag,
                                                const Console& out) {
    const auto dialect = kiln::emit::parse_make_dialect(g.make_dialect);
    if (!dialect) {
        out.fail("unknown make dialect '" + g.make_dialect + "' (expected gnu or posix)");
        return std::nullopt;
    }

    kiln::emit::EmitOptions eo{};
    eo.source_prefix = kiln::desc::source_prefix(loaded.gen);
    eo.kiln_command = kiln_command(argv0);
    eo.regen_inputs = loaded.description_files;

    kiln::emit::OutputFiles files{};
    for (const auto& b : g.backends) {
        const auto emitter = kiln::emit::make_emitter(b, *dialect);
        if (!emitter) {
            out.fail("unknown backend '" + b + "'");
            return std::nullopt;
        }
        auto out = emitter->emit(loaded.graph, eo, bag);
        if (!out) return std::nullopt;
        files.insert(out->begin(), out->end());
    }
    return files;
}

int generate(const GenerateRequest& g, const RuntimeConfig& rt, const char* argv0) {
    const auto& out = rt.out;

    kiln::diag::Bag bag{};
    kiln::project::Request req{};
    auto loaded = load_description(g, rt, req, bag, out);
    if (!loaded) return report(bag, out);

    out.progress(80, "emitting " + join(g.backends, ", "));
    auto files = emit_all(g, *loaded, argv0, bag, out);
    if (!files) return bag.has_error() ? report(bag, out) : 1;

    out.progress(95, "writing build files");
    if (!kiln::emit::write_outputs(g.build_root, *files, bag)) return report(bag, out);

    kiln::config::RecordedEnvironment rec{};
    rec.kiln_version = std::string(kiln::k_version_string);
    rec.source_dir = g.source_root.string();
    rec.build_dir = g.build_root.string();
    rec.backends = g.backends;
    rec.toolchain = std::string(kiln::toolchain::family_name(req.family));
    rec.platform = std::string(kiln::toolchain::platform_name(req.platform));
    rec.make_dialect = g.make_dialect;
    rec.defines = g.defines;
    rec.env = g.env;

    std::string err{};
    if (!kiln::config::write_environment(g.build_root, rec, err)) {
        out.fail(err);
        return 1;
    }

    std::vector<std::string> names{};
    for (const auto& [name, content] : *files) {
        names.push_back(name);
        if (g.verbose) std::cerr << "  wrote " << (g.build_root / name).string() << "\n";
    }
    out.progress(100, "generated " + join(names, ", "));
    out.done("build files written to " + g.build_root.string());
    return 0;
}

int run_configure(const cli::Options& opt, const char* argv0) {
    const auto source_root = absolute_dir(opt.configure.source_dir);
    const auto build_root = absolute_dir(opt.configure.build_dir);

    RuntimeConfig rt{};
    if (!load_runtime_config(source_root, rt)) return 1;

    auto g = request_from(source_root, build_root, opt.configure.select, rt);
    g.verbose = opt.configure.verbose;
    return generate(g, rt, argv0);
}

int run_regenerate(std::string_view build_dir, bool verbose, const char* argv0) {
    const auto build_root = absolute_dir(build_dir);

    std::string err{};
    const auto rec = kiln::config::read_environment(build_root, err);
    if (!rec) {
        Console{}.fail(err);
        return 1;
    }

    RuntimeConfig rt{};
    if (!load_runtime_config(rec->source_dir, rt)) return 1;

    GenerateRequest g{};
    g.source_root = rec->source_dir;
    g.build_root = build_root;
    g.backends = rec->backends;
    g.toolchain = rec->toolchain;
    g.platform = rec->platform;
    g.make_dialect = rec->make_dialect;
    g.defines = rec->defines;
    g.env = rec->env;
    g.verbose = verbose;
    return generate(g, rt, argv0);
}

std::string_view backend_file(std::string_view backend) {
    return backend == "ninja" ? "build.ninja" : "Makefile";
}

// True when a backend file is missing or older than any description file.
bool is_stale(const kiln::config::RecordedEnvironment& rec, const fs::path& build_root) {
    const fs::path source_root = rec.source_dir;
    for (const auto& b : rec.backends) {
        std::error_code ec{};
        const auto built = fs::last_write_time(build_root / std::string(backend_file(b)), ec);
        if (ec) return true;

        for (const auto name : {kiln::project::k_build_file, kiln::project::k_options_file, kiln::config::k_project_file}) {
            std::error_code dec{};
            const auto t = fs::last_write_time(source_root / std::string(name), dec);
            if (!dec && t > built) return true;
        }
    }
    return false;
}

int run_build(const cli::Options& opt, const char* argv0) {
    const auto build_root = absolute_dir(opt.build.build_dir);

    std::string err{};
    const auto rec = kiln::config::read_environment(build_root, err);
    if (!rec) {
        Console{}.fail(err);
        return 1;
    }
    if (rec->backends.empty()) {
        Console{}.fail("no backend recorded in " + (build_root / std::string(kiln::config::k_environ_file)).string());
        return 1;
    }

    RuntimeConfig rt{};
    if (!load_runtime_config(rec->source_dir, rt)) return 1;
    const auto& out = rt.out;

    if (is_stale(*rec, build_root)) {
        out.progress(5, "build description changed, regenerating");
        const int rc = run_regenerate(build_root.string(), opt.build.verbose, argv0);
        if (rc != 0) return rc;
    }

    const bool ninja = rec->backends.front() == "ninja";
    std::vector<std::string> argv{ninja ? "ninja" : "make", "-C", build_root.string()};
    if (opt.build.jobs.has_value()) {
        argv.push_back("-j");
        argv.push_back(std::to_string(*opt.build.jobs));
    }
    if (opt.build.verbose && ninja) argv.push_back("-v");

    out.progress(35, "running " + argv.front());
    const auto ran = proc::run_executor(argv);
    if (!ran.error.empty()) {
        out.fail(ran.error);
        return ran.status;
    }
    if (ran.status != 0) {
        out.fail(argv.front() + " failed (exit=" + std::to_string(ran.status) + ")");
        return ran.status;
    }
    out.progress(100, "build completed");
    out.done("build completed successfully");
    return 0;
}

int run_check(const cli::Options& opt, const char* argv0) {
    const auto source_root = absolute_dir(opt.check.source_dir);

    RuntimeConfig rt{};
    if (!load_runtime_config(source_root, rt)) return 1;
    const auto& out = rt.out;

    const auto g = request_from(source_root, source_root, opt.check.select, rt);
    kiln::diag::Bag bag{};
    kiln::project::Request req{};
    auto loaded = load_description(g, rt, req, bag, out);
    if (!loaded) return report(bag, out);

    out.progress(80, "checking " + join(g.backends, ", "));
    const auto files = emit_all(g, *loaded, argv0, bag, out);
    if (!files) return bag.has_error() ? report(bag, out) : 1;

    out.done(std::to_string(loaded->graph.targets().size()) + " targets, " +
             std::to_string(loaded->graph.edges().size()) + " edges, no errors");
    return 0;
}

int run_graph(const cli::Options& opt) {
    const auto source_root = absolute_dir(opt.graph.source_dir);

    RuntimeConfig rt{};
    if (!load_runtime_config(source_root, rt)) return 1;

    const auto g = request_from(source_root, source_root, opt.graph.select, rt);
    kiln::diag::Bag bag{};
    kiln::project::Request req{};
    auto loaded = load_description(g, rt, req, bag, rt.out.quiet());
    if (!loaded) return report(bag, rt.out);

    if (opt.graph.format == "text") {
        std::cout << kiln::graph::emit_graph_text(loaded->graph);
    } else if (opt.graph.format == "dot") {
        std::cout << kiln::graph::emit_graph_dot(loaded->graph);
    } else {
        std::cout << kiln::graph::emit_graph_json(loaded->graph);
    }
    return 0;
}

} // namespace

int run(const cli::Options& opt, const char* argv0) {
    switch (opt.command) {
        case cli::Command::kConfigure:
            return run_configure(opt, argv0);
        case cli::Command::kRegenerate:
            return run_regenerate(opt.regenerate.build_dir, opt.regenerate.verbose, argv0);
        case cli::Command::kBuild:
            return run_build(opt, argv0);
        case cli::Command::kCheck:
            return run_check(opt, argv0);
        case cli::Command::kGraph:
            return run_graph(opt);
        default:
            return 1;
    }
}

int usage_error(std::string_view message) {
    Console{}.fail(message);
    cli::print_usage(std::cerr);
    return 1;
}

} // namespace kiln_tool::driver
