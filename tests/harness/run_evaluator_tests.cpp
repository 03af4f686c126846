#include <kiln/desc/Context.hpp>
#include <kiln/desc/Evaluator.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/opt/OptionSchema.hpp>
#include <kiln/parse/Parser.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using kiln::desc::TargetKind;
    using kiln::toolchain::Language;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    constexpr std::string_view k_options_ =
        "option name: string = \"app\";\n"
        "option extra_flags: list = [];\n"
        "option fast: bool = true;\n";

    struct Setup {
        kiln::toolchain::Platform platform = kiln::toolchain::Platform::kLinux;
        kiln::toolchain::Family family = kiln::toolchain::Family::kGcc;
    };

    // Evaluates `src` against the options above; the registry is copied out
    // because the context only lives for the call.
    static bool evaluate_(std::string_view src,
                          kiln::diag::Bag& bag,
                          kiln::desc::TargetRegistry& out,
                          Setup setup = {}) {
        const auto opts = kiln::parse::parse_source(k_options_, "options.kiln", bag);
        kiln::opt::Schema schema;
        if (!kiln::opt::load_schema(opts, schema, bag)) return false;
        auto resolved = kiln::opt::resolve(schema, {}, {}, bag);
        if (!resolved) return false;

        kiln::desc::GenerationContext gen{};
        gen.source_root = "/src";
        gen.build_root = "/src/build";
        gen.platform = setup.platform;
        gen.family = setup.family;
        gen.options = std::move(*resolved);

        const auto prog = kiln::parse::parse_source(src, "build.kiln", bag);
        if (bag.has_error()) return false;

        kiln::toolchain::Registry toolchains;
        kiln::desc::Context ctx(gen, toolchains, bag);
        kiln::desc::Evaluator ev(ctx, bag);
        const bool ok = ev.run(prog);
        out = ctx.registry();
        return ok;
    }

    static const kiln::desc::Target* find_(const kiln::desc::TargetRegistry& r, std::string_view name) {
        for (const auto& t : r.targets) {
            if (t.name == name) return &t;
        }
        return nullptr;
    }

    static bool fails_with_(std::string_view src, kiln::diag::Code code, uint32_t line, Setup setup = {}) {
        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        if (evaluate_(src, bag, reg, setup)) {
            std::cerr << "  - evaluation unexpectedly succeeded\n";
            return false;
        }
        if (!bag.has_code(code)) {
            std::cerr << "  - expected " << kiln::diag::code_name(code) << ", got:\n" << bag.render_text();
            return false;
        }
        if (line != 0 && bag.all().front().line != line) {
            std::cerr << "  - expected line " << line << ", got " << bag.all().front().line << "\n";
            return false;
        }
        return true;
    }

    static bool test_full_example_() {
        const char* src =
            "project \"simple\" version \"1.0\";\n"
            "global_flags \"c++\" [\"-DPROJECT_NAME=\\\"simple\\\"\"];\n"
            "let common = [\"-Wall\"] + option(\"extra_flags\");\n"
            "library util { kind = \"static\"; sources = [\"src/util.cpp\"]; flags = common; includes = [\"include\"]; }\n"
            "command gen_version { inputs = [\"tools/version.txt\"]; outputs = [\"version.h\"]; run = [\"cp\", \"$in\", \"$out\"]; }\n"
            "executable simple {\n"
            "    sources = [\"simple.cpp\"];\n"
            "    flags = common + [\"-O2\", \"-DAPP_NAME=\" + option(\"name\")];\n"
            "    link = [util];\n"
            "    deps = [gen_version];\n"
            "}\n"
            "alias tools = [simple];\n"
            "default [simple];\n"
            "install [simple, util];\n";

        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        if (!require_(evaluate_(src, bag, reg), "example must evaluate")) {
            std::cerr << bag.render_text();
            return false;
        }

        bool good = true;
        good &= require_(reg.project.name == "simple" && reg.project.version == "1.0", "project info");
        good &= require_(reg.targets.size() == 4, "four targets");

        const auto* util = find_(reg, "util");
        const auto* gen = find_(reg, "gen_version");
        const auto* exe = find_(reg, "simple");
        const auto* tools = find_(reg, "tools");
        if (!require_(util && gen && exe && tools, "all targets registered")) return false;

        good &= require_(util->kind == TargetKind::kStaticLibrary, "util is a static library");
        good &= require_(util->outputs.size() == 1 && util->outputs[0] == kiln::graph::build_path("libutil.a"),
                         "util output name");
        good &= require_(util->includes.size() == 1 && util->includes[0] == "include", "util includes");

        good &= require_(gen->kind == TargetKind::kCustomCommand && gen->run.size() == 3, "command argv");
        good &= require_(gen->run[1].slot == kiln::toolchain::Slot::kIn && gen->run[2].slot == kiln::toolchain::Slot::kOut,
                         "$in and $out become placeholders");
        good &= require_(gen->inputs.size() == 1 && gen->inputs[0] == kiln::graph::source_path("tools/version.txt"),
                         "command input is a source path");

        const std::vector<std::string> want_flags{"-Wall", "-O2", "-DAPP_NAME=app"};
        good &= require_(exe->flags == want_flags, "option values flow into flags");
        good &= require_(exe->links.size() == 1 && exe->links[0].is_target(), "executable links util");
        good &= require_(exe->deps.size() == 1, "executable depends on gen_version");
        good &= require_(exe->link_language == Language::kCxx, "c++ link language");

        good &= require_(tools->kind == TargetKind::kAlias && tools->members.size() == 1, "alias members");
        good &= require_(reg.has_default_statement && reg.defaults.size() == 2, "installed targets join the default list");
        good &= require_(reg.installs.size() == 2, "install list");

        const auto it = reg.global_flags.find(Language::kCxx);
        good &= require_(it != reg.global_flags.end() && it->second.size() == 1 &&
                             it->second[0] == "-DPROJECT_NAME=\"simple\"",
                         "global flags for c++");
        return good;
    }

    static bool test_forward_reference_is_rejected_() {
        const char* src =
            "executable app { sources = [\"main.cpp\"]; link = [util]; }\n"
            "library util { sources = [\"util.cpp\"]; }\n";
        return fails_with_(src, kiln::diag::Code::D_UNDECLARED_TARGET, 1);
    }

    static bool test_duplicate_target_name_() {
        const char* src =
            "library core { sources = [\"a.cpp\"]; }\n"
            "executable core { sources = [\"b.cpp\"]; }\n";
        return fails_with_(src, kiln::diag::Code::D_DUPLICATE_TARGET_NAME, 2);
    }

    static bool test_unknown_option_reference_() {
        const char* src = "executable app { sources = [\"a.cpp\"]; flags = [option(\"nope\")]; }\n";
        return fails_with_(src, kiln::diag::Code::O_UNKNOWN_OPTION, 1);
    }

    static bool test_link_language_follows_libraries_() {
        const char* src =
            "library fmt { sources = [\"fmt.cpp\"]; }\n"
            "executable plain { sources = [\"main.c\"]; }\n"
            "executable mixed { sources = [\"main.c\"]; link = [fmt, \"m\"]; }\n";

        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        if (!require_(evaluate_(src, bag, reg), "description must evaluate")) {
            std::cerr << bag.render_text();
            return false;
        }

        const auto* plain = find_(reg, "plain");
        const auto* mixed = find_(reg, "mixed");
        if (!require_(plain && mixed, "targets registered")) return false;

        bool good = true;
        good &= require_(plain->link_language == Language::kC, "c only executable links as c");
        good &= require_(plain->link_toolchain() && plain->link_toolchain()->link_executable.rule == "link_cc",
                         "c link rule");
        good &= require_(mixed->link_language == Language::kCxx, "linking a c++ library links as c++");
        good &= require_(mixed->toolchains.size() == 2, "both languages resolved");
        good &= require_(mixed->links.size() == 2 && !mixed->links[1].is_target() && mixed->links[1].text == "m",
                         "external library kept by name");
        return good;
    }

    static bool test_generated_sources_and_headers_() {
        const char* src =
            "command gen { inputs = [\"gen.py\"]; outputs = [\"gen/table.cpp\", \"gen/table.h\"]; run = [\"python3\", \"$in\", \"$out\"]; }\n"
            "executable app { sources = [gen, \"main.cpp\"]; }\n";

        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        if (!require_(evaluate_(src, bag, reg), "description must evaluate")) {
            std::cerr << bag.render_text();
            return false;
        }
        const auto* app = find_(reg, "app");
        if (!require_(app != nullptr, "app registered")) return false;

        bool good = true;
        good &= require_(app->sources.size() == 2 && app->sources[0].path == kiln::graph::build_path("gen/table.cpp"),
                         "generated source compiled from the build directory");
        good &= require_(app->sources[1].path == kiln::graph::source_path("main.cpp"), "plain source");
        good &= require_(app->generated_headers.size() == 1 &&
                             app->generated_headers[0] == kiln::graph::build_path("gen/table.h"),
                         "non-compilable output becomes a generated header");
        return good;
    }

    static bool test_command_runs_a_built_tool_() {
        const char* src =
            "executable mkdata { sources = [\"mkdata.c\"]; }\n"
            "command data { outputs = [\"data.bin\"]; run = [mkdata, \"-o\", \"$out\"]; }\n";

        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        if (!require_(evaluate_(src, bag, reg), "description must evaluate")) {
            std::cerr << bag.render_text();
            return false;
        }
        const auto* data = find_(reg, "data");
        if (!require_(data != nullptr, "command registered")) return false;

        bool good = true;
        good &= require_(data->run.size() == 3 && data->run[0].slot == kiln::toolchain::Slot::kLiteral &&
                             data->run[0].text == "mkdata",
                         "tool argument is the tool's output path");
        good &= require_(data->input_targets.size() == 1, "tool becomes an input target");
        return good;
    }

    static bool test_invalid_declarations_() {
        bool good = true;
        good &= require_(fails_with_("executable app { sources = [\"a.cpp\"]; colour = \"red\"; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "unknown field");
        good &= require_(fails_with_("library l { kind = \"dynamic\"; sources = [\"a.cpp\"]; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "unknown library kind");
        good &= require_(fails_with_("executable app { sources = [\"/etc/a.cpp\"]; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "absolute source path");
        good &= require_(fails_with_("executable app { sources = [\"../a.cpp\"]; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "source escaping the root");
        good &= require_(fails_with_("executable app { sources = [\"notes.txt\"]; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "source with no known language");
        good &= require_(fails_with_("executable app { sources = []; }\n", kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "no sources");
        good &= require_(fails_with_("let x = \"a\" + true;\n", kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "string plus bool");
        good &= require_(fails_with_("option o: bool = true;\n", kiln::diag::Code::D_INVALID_DECLARATION, 1),
                         "option in build.kiln");
        good &= require_(fails_with_("executable a { sources = [\"a.c\"]; }\nexecutable b { sources = [\"b.c\"]; link = [a]; }\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 2),
                         "linking an executable");
        good &= require_(fails_with_("executable a { sources = [\"a.c\"]; }\ninstall [\"tools\"];\n",
                                     kiln::diag::Code::D_UNDECLARED_TARGET, 2),
                         "install of an undeclared name");
        good &= require_(fails_with_("project \"a\";\nproject \"b\";\n", kiln::diag::Code::D_INVALID_DECLARATION, 2),
                         "second project statement");
        return good;
    }

    static bool test_reserved_build_names_() {
        bool good = true;
        for (const char* name : {"all", "clean", "install", "uninstall", "Makefile"}) {
            const std::string src = "executable " + std::string(name) + " { sources = [\"a.cpp\"]; }\n";
            good &= require_(fails_with_(src, kiln::diag::Code::D_INVALID_DECLARATION, 1), name);
        }
        good &= require_(fails_with_("library lib { sources = [\"a.cpp\"]; }\nalias all = [lib];\n",
                                     kiln::diag::Code::D_INVALID_DECLARATION, 2),
                         "alias named all");
        for (const char* out : {"build.ninja", "Makefile", "install", ".ninja_log"}) {
            const std::string src = "command gen { outputs = [\"" + std::string(out) + "\"]; run = [\"touch\", \"$out\"]; }\n";
            good &= require_(fails_with_(src, kiln::diag::Code::D_INVALID_DECLARATION, 1), out);
        }
        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        const char* ok_src =
            "command gen { outputs = [\"sub/Makefile\"]; run = [\"touch\", \"$out\"]; }\n"
            "executable all_tools { sources = [\"a.cpp\"]; }\n";
        good &= require_(evaluate_(ok_src, bag, reg), "nested Makefile and all_tools are ordinary names");
        return good;
    }

    static bool test_global_flag_with_line_break_() {
        return fails_with_("project \"p\";\nglobal_flags \"c\" [\"-DA=1\", \"-DB=x\\ny\"];\n",
                           kiln::diag::Code::D_INVALID_DECLARATION, 2);
    }

    static bool test_unsupported_toolchain_() {
        Setup setup{};
        setup.family = kiln::toolchain::Family::kMsvc;
        return fails_with_("executable app { sources = [\"a.cpp\"]; }\n",
                           kiln::diag::Code::T_UNSUPPORTED_TOOLCHAIN, 1, setup);
    }

    static bool test_windows_naming_() {
        Setup setup{};
        setup.platform = kiln::toolchain::Platform::kWindows;
        setup.family = kiln::toolchain::Family::kMsvc;

        kiln::diag::Bag bag;
        kiln::desc::TargetRegistry reg;
        const char* src =
            "library core { kind = \"shared\"; sources = [\"core.cpp\"]; }\n"
            "executable app { sources = [\"main.cpp\"]; link = [core]; }\n";
        if (!require_(evaluate_(src, bag, reg, setup), "description must evaluate")) {
            std::cerr << bag.render_text();
            return false;
        }
        const auto* core = find_(reg, "core");
        const auto* app = find_(reg, "app");
        if (!require_(core && app, "targets registered")) return false;

        bool good = true;
        good &= require_(core->outputs[0] == kiln::graph::build_path("core.dll"), "dll name");
        good &= require_(app->outputs[0] == kiln::graph::build_path("app.exe"), "exe name");
        return good;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"full_example", test_full_example_},
        {"forward_reference_is_rejected", test_forward_reference_is_rejected_},
        {"duplicate_target_name", test_duplicate_target_name_},
        {"unknown_option_reference", test_unknown_option_reference_},
        {"link_language_follows_libraries", test_link_language_follows_libraries_},
        {"generated_sources_and_headers", test_generated_sources_and_headers_},
        {"command_runs_a_built_tool", test_command_runs_a_built_tool_},
        {"invalid_declarations", test_invalid_declarations_},
        {"reserved_build_names", test_reserved_build_names_},
        {"global_flag_with_line_break", test_global_flag_with_line_break_},
        {"unsupported_toolchain", test_unsupported_toolchain_},
        {"windows_naming", test_windows_naming_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
