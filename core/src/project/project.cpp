#include <kiln/project/Project.hpp>

#include <kiln/desc/Evaluator.hpp>
#include <kiln/os/File.hpp>
#include <kiln/parse/Parser.hpp>

#include <system_error>

namespace kiln::project {

namespace {

std::optional<ast::Program> parse_file(const std::filesystem::path& path, diag::Bag& diags) {
    const auto r = os::read_text_file(path.string());
    if (!r.ok) {
        diags.add(diag::Code::F_IO_ERROR, path.string(), 1, 1, "cannot read file: " + r.err);
        return std::nullopt;
    }
    auto program = parse::parse_source(r.text, path.string(), diags);
    if (diags.has_error()) return std::nullopt;
    return program;
}

bool is_present(const std::filesystem::path& p) {
    std::error_code ec{};
    return std::filesystem::is_regular_file(p, ec);
}

} // namespace

std::optional<Loaded> load(const Request& req, diag::Bag& diags, const ProgressFn& progress) {
    auto step = [&](std::string_view label) {
        if (progress) progress(label);
    };

    Loaded out{};
    const auto options_path = req.source_root / k_options_file;
    const auto build_path = req.source_root / k_build_file;

    step("reading options.kiln");
    if (is_present(options_path)) {
        auto program = parse_file(options_path, diags);
        if (!program) return std::nullopt;
        if (!opt::load_schema(*program, out.schema, diags)) return std::nullopt;
    }

    step("resolving options");
    auto options = opt::resolve(out.schema, req.project_overrides, req.cli_overrides, diags);
    if (!options) return std::nullopt;

    out.gen.source_root = req.source_root;
    out.gen.build_root = req.build_root;
    out.gen.platform = req.platform;
    out.gen.family = req.family;
    out.gen.env = req.env;
    out.gen.options = std::move(*options);

    step("evaluating build.kiln");
    auto program = parse_file(build_path, diags);
    if (!program) return std::nullopt;

    toolchain::Registry toolchains(out.gen.env);
    desc::Context ctx(out.gen, toolchains, diags);
    desc::Evaluator evaluator(ctx, diags);
    if (!evaluator.run(*program)) return std::nullopt;

    step("building graph");
    os::RealFileSystem fs(req.source_root);
    auto g = graph::build_graph(ctx.registry(), out.gen, fs, diags);
    if (!g) return std::nullopt;
    out.graph = std::move(*g);

    out.description_files.push_back(graph::source_path(std::string(k_build_file)));
    if (is_present(options_path)) out.description_files.push_back(graph::source_path(std::string(k_options_file)));
    if (is_present(req.source_root / config::k_project_file)) {
        out.description_files.push_back(graph::source_path(std::string(config::k_project_file)));
    }
    return out;
}

} // namespace kiln::project
