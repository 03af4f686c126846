#include "EmitSupport.hpp"

#include <kiln/desc/Context.hpp>
#include <kiln/desc/Evaluator.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/emit/Emitter.hpp>
#include <kiln/emit/Escape.hpp>
#include <kiln/graph/BuildGraph.hpp>
#include <kiln/opt/OptionSchema.hpp>
#include <kiln/os/File.hpp>
#include <kiln/parse/Parser.hpp>

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool has_(const std::string& text, std::string_view needle) {
        if (text.find(needle) != std::string::npos) return true;
        std::cerr << "  - missing: " << needle << "\n";
        return false;
    }

    constexpr std::string_view k_simple_ =
        "project \"simple\" version \"1.0\";\n"
        "global_flags \"c++\" [\"-DPROJECT_NAME=simple\"];\n"
        "library util { sources = [\"src/util.cpp\"]; includes = [\"include\"]; }\n"
        "command gen_version { inputs = [\"tools/version.txt\"]; outputs = [\"version.h\"]; run = [\"cp\", \"$in\", \"$out\"]; }\n"
        "executable simple { sources = [\"simple.cpp\"]; flags = [\"-O2\"]; link = [util]; deps = [gen_version]; }\n"
        "alias tools = [simple];\n"
        "default [simple];\n"
        "install [simple, util];\n";

    // Evaluates and validates `src` with the source directory one level above
    // the build directory; every file named in `files` exists.
    static std::optional<kiln::graph::Graph> graph_of_(std::string_view src,
                                                       std::initializer_list<const char*> files,
                                                       kiln::diag::Bag& bag) {
        auto resolved = kiln::opt::resolve(kiln::opt::Schema{}, {}, {}, bag);
        if (!resolved) return std::nullopt;

        kiln::desc::GenerationContext gen{};
        gen.source_root = "/work/p";
        gen.build_root = "/work/p/build";
        gen.options = std::move(*resolved);

        const auto prog = kiln::parse::parse_source(src, "build.kiln", bag);
        if (bag.has_error()) return std::nullopt;

        kiln::toolchain::Registry toolchains;
        kiln::desc::Context ctx(gen, toolchains, bag);
        kiln::desc::Evaluator ev(ctx, bag);
        if (!ev.run(prog)) return std::nullopt;

        kiln::os::MemoryFileSystem fs;
        for (const char* f : files) fs.add(f);
        return kiln::graph::build_graph(ctx.registry(), gen, fs, bag);
    }

    static kiln::emit::EmitOptions options_() {
        kiln::emit::EmitOptions opts{};
        opts.source_prefix = "..";
        opts.kiln_command = "/opt/kiln/bin/kiln";
        opts.regen_inputs = {kiln::graph::source_path("build.kiln")};
        return opts;
    }

    static std::optional<std::string> render_(const kiln::graph::Graph& g,
                                              std::string_view backend,
                                              kiln::diag::Bag& bag) {
        const auto emitter = kiln::emit::make_emitter(backend, kiln::emit::MakeDialect::kGnu);
        if (!emitter) return std::nullopt;
        auto files = emitter->emit(g, options_(), bag);
        if (!files || files->size() != 1) return std::nullopt;
        return files->begin()->second;
    }

    static bool test_ninja_simple_() {
        kiln::diag::Bag bag;
        const auto g = graph_of_(k_simple_, {"src/util.cpp", "tools/version.txt", "simple.cpp"}, bag);
        if (!require_(g.has_value(), "graph must validate")) {
            std::cerr << bag.render_text();
            return false;
        }
        const auto text = render_(*g, "ninja", bag);
        if (!require_(text.has_value(), "ninja emission must succeed")) {
            std::cerr << bag.render_text();
            return false;
        }

        bool good = true;
        good &= require_(text->rfind("# Generated by kiln ", 0) == 0, "generated header");
        good &= has_(*text, "ninja_required_version = 1.3\n");
        good &= has_(*text,
                     "rule cxx\n"
                     "  command = g++ $flags $includes -MMD -MF $out.d -c $in -o $out\n"
                     "  depfile = $out.d\n"
                     "  deps = gcc\n"
                     "  description = $desc\n");
        good &= has_(*text, "rule ar\n  command = ar cr $out $in\n");
        good &= has_(*text, "rule link_cxx\n  command = g++ $flags $in $libdirs $libs -o $out\n");
        good &= has_(*text, "rule command\n  command = $cmd\n");
        good &= has_(*text, "build simple.dir/simple.cpp.o: cxx ../simple.cpp || version.h\n");
        good &= has_(*text, "  flags = '-DPROJECT_NAME=simple' -O2\n  includes = -I../include -I.\n");
        good &= has_(*text, "  includes = -I../include -I.\n  desc = CXX simple.dir/simple.cpp.o\n");
        good &= has_(*text, "build libutil.a: ar util.dir/src/util.cpp.o\n");
        good &= has_(*text, "build util: phony libutil.a\n");
        good &= has_(*text, "build simple: link_cxx simple.dir/simple.cpp.o | libutil.a\n  libdirs = -L.\n  libs = -lutil\n");
        good &= has_(*text, "build version.h: command ../tools/version.txt\n  cmd = cp ../tools/version.txt version.h\n  desc = GEN version.h\n");
        good &= has_(*text, "build tools: phony simple\n");
        good &= has_(*text,
                     "build install: command simple libutil.a\n"
                     "  cmd = mkdir -p \"$${DESTDIR}$${PREFIX:-/usr/local}\"/bin && cp simple "
                     "\"$${DESTDIR}$${PREFIX:-/usr/local}\"/bin/simple && ");
        good &= has_(*text, "build uninstall: command\n");
        good &= has_(*text, "  pool = console\n");
        good &= has_(*text, "rule regenerate\n  command = /opt/kiln/bin/kiln regenerate .\n");
        good &= has_(*text, "  generator = 1\n");
        good &= has_(*text, "build build.ninja: regenerate ../build.kiln\n");
        good &= require_(text->ends_with("build all: phony simple util\n\ndefault all\n"), "ends with the all alias");
        return good;
    }

    static bool test_make_simple_() {
        kiln::diag::Bag bag;
        const auto g = graph_of_(k_simple_, {"src/util.cpp", "tools/version.txt", "simple.cpp"}, bag);
        if (!require_(g.has_value(), "graph must validate")) return false;
        const auto text = render_(*g, "make", bag);
        if (!require_(text.has_value(), "make emission must succeed")) {
            std::cerr << bag.render_text();
            return false;
        }

        bool good = true;
        good &= require_(text->find(".POSIX:") == std::string::npos, "gnu dialect has no .POSIX");
        good &= has_(*text, "CXX = g++\n");
        good &= has_(*text, "AR = ar cr\n");
        good &= has_(*text, "libutil.a: util.dir/src/util.cpp.o\n\t$(AR) libutil.a util.dir/src/util.cpp.o\n");
        good &= has_(*text, "LINK_CXX = g++\n");
        good &= has_(*text, "all: simple util\n");
        good &= has_(*text, ".PHONY: all clean install uninstall util gen_version tools\n");
        good &= has_(*text,
                     "simple.dir/simple.cpp.o: ../simple.cpp | version.h\n"
                     "\t@mkdir -p simple.dir\n"
                     "\t$(CXX) '-DPROJECT_NAME=simple' -O2 -I../include -I. -MMD -MF simple.dir/simple.cpp.o.d "
                     "-c ../simple.cpp -o simple.dir/simple.cpp.o\n");
        good &= has_(*text, "simple: simple.dir/simple.cpp.o libutil.a\n\t$(LINK_CXX) simple.dir/simple.cpp.o -L. -lutil -o simple\n");
        good &= has_(*text, "version.h: ../tools/version.txt\n\tcp ../tools/version.txt version.h\n");
        good &= has_(*text, "util: libutil.a\n");
        good &= has_(*text, "install: simple libutil.a\n\tmkdir -p \"$${DESTDIR}$${PREFIX:-/usr/local}\"/bin");
        good &= has_(*text, "uninstall:\n\trm -f \"$${DESTDIR}$${PREFIX:-/usr/local}\"/bin/simple\n");
        good &= has_(*text, "clean:\n\trm -f util.dir/src/util.cpp.o");
        good &= has_(*text, "Makefile: ../build.kiln\n\t/opt/kiln/bin/kiln regenerate .\n");
        good &= has_(*text, "-include util.dir/src/util.cpp.o.d simple.dir/simple.cpp.o.d\n");
        return good;
    }

    static bool test_posix_make_refuses_order_only_() {
        kiln::diag::Bag bag;
        const auto g = graph_of_(k_simple_, {"src/util.cpp", "tools/version.txt", "simple.cpp"}, bag);
        if (!require_(g.has_value(), "graph must validate")) return false;

        const auto text = render_(*g, "make-posix", bag);
        bool good = true;
        good &= require_(!text.has_value(), "posix make must refuse");
        good &= require_(bag.has_code(kiln::diag::Code::E_UNSUPPORTED_EDGE_KIND), "E_UNSUPPORTED_EDGE_KIND expected");
        const std::string msg = bag.all().empty() ? std::string{} : bag.all().front().message;
        good &= require_(msg.find("make-posix") != std::string::npos && msg.find("'simple'") != std::string::npos,
                         "message names the backend and the target");
        good &= require_(kiln::diag::exit_code_for(bag) == 4, "emission errors exit with 4");
        return good;
    }

    static bool test_posix_make_plain_graph_() {
        kiln::diag::Bag bag;
        const auto g = graph_of_("executable hello { sources = [\"hello.c\"]; }\n", {"hello.c"}, bag);
        if (!require_(g.has_value(), "graph must validate")) return false;
        const auto emitter = kiln::emit::make_emitter("make-posix", kiln::emit::MakeDialect::kGnu);
        const auto files = emitter->emit(*g, options_(), bag);
        if (!require_(files && files->count("Makefile") == 1, "Makefile rendered")) return false;

        const auto& text = files->at("Makefile");
        bool good = true;
        good &= has_(text, ".POSIX:\n");
        good &= has_(text, "hello: hello.dir/hello.c.o\n\t$(LINK_CC) hello.dir/hello.c.o -o hello\n");
        good &= require_(text.find("-include") == std::string::npos, "no depfile includes in posix make");
        return good;
    }

    static bool test_multi_output_commands_() {
        const char* src = "command gen { inputs = [\"t.def\"]; outputs = [\"t.c\", \"t.h\"]; run = [\"mkt\", \"$in\", \"$out\"]; }\n";
        kiln::diag::Bag bag;
        const auto g = graph_of_(src, {"t.def"}, bag);
        if (!require_(g.has_value(), "graph must validate")) return false;

        bool good = true;
        const auto ninja = render_(*g, "ninja", bag);
        good &= require_(ninja && ninja->find("build t.c t.h: command ../t.def\n  cmd = mkt ../t.def t.c t.h\n") !=
                                      std::string::npos,
                         "ninja lists both outputs");
        const auto make = render_(*g, "make", bag);
        good &= require_(make && make->find("t.c t.h &: ../t.def\n\tmkt ../t.def t.c t.h\n") != std::string::npos,
                         "gnu make groups the outputs");

        kiln::diag::Bag posix_bag;
        const auto posix = render_(*g, "make-posix", posix_bag);
        good &= require_(!posix && posix_bag.has_code(kiln::diag::Code::E_UNSUPPORTED_EDGE_KIND),
                         "posix make refuses grouped outputs");
        return good;
    }

    static bool test_escaping_() {
        const char* src = "executable app { sources = [\"my dir/a.c\"]; flags = [\"-DHOME=$HOME\", \"-DQ='x'\"]; }\n";
        kiln::diag::Bag bag;
        const auto g = graph_of_(src, {"my dir/a.c"}, bag);
        if (!require_(g.has_value(), "graph must validate")) {
            std::cerr << bag.render_text();
            return false;
        }

        bool good = true;
        const auto ninja = render_(*g, "ninja", bag);
        if (!require_(ninja.has_value(), "ninja emission")) return false;
        good &= has_(*ninja, "build app.dir/my$ dir/a.c.o: cc ../my$ dir/a.c\n");
        good &= has_(*ninja, "  flags = '-DHOME=$$HOME' '-DQ='\"'\"'x'\"'\"''\n");
        good &= has_(*ninja, "-MMD -MF $out.d -c $in -o $out\n  depfile = $out.d\n");
        good &= require_(ninja->find("depfile = app.dir/my") == std::string::npos, "no unquoted per-edge depfile");

        const auto make = render_(*g, "make", bag);
        if (!require_(make.has_value(), "make emission")) return false;
        good &= has_(*make, "app.dir/my\\ dir/a.c.o: ../my\\ dir/a.c\n");
        good &= has_(*make, "\t@mkdir -p 'app.dir/my dir'\n");
        good &= has_(*make, "$(CC) '-DHOME=$$HOME'");
        good &= has_(*make, "-c '../my dir/a.c' -o 'app.dir/my dir/a.c.o'\n");

        using kiln::emit::make_target;
        using kiln::emit::ninja_path;
        using kiln::emit::shell_quote;
        good &= require_(ninja_path("c:/x y$") == "c$:/x$ y$$", "ninja path escaping");
        good &= require_(make_target("a#b:c $d") == "a\\#b\\:c\\ $$d", "make target escaping");
        good &= require_(make_target("50%/x.o") == "50\\%/x.o", "percent is not a pattern");
        good &= require_(kiln::emit::make_include_path("50%/x o.d") == "50%/x\\ o.d", "include operand keeps percent");
        good &= require_(shell_quote("") == "''", "empty argument");
        good &= require_(shell_quote("a-b_c/d.e:f,g@h%i+j") == "a-b_c/d.e:f,g@h%i+j", "safe characters stay bare");
        return good;
    }

    static bool test_line_breaks_are_rejected_() {
        const char* src = "executable app { sources = [\"a.c\"]; flags = [\"-DX=a\\nb\"]; }\n";
        kiln::diag::Bag bag;
        const auto g = graph_of_(src, {"a.c"}, bag);
        if (!require_(g.has_value(), "graph must validate")) return false;

        bool good = true;
        for (const char* backend : {"ninja", "make"}) {
            kiln::diag::Bag eb;
            const auto text = render_(*g, backend, eb);
            good &= require_(!text && eb.has_code(kiln::diag::Code::E_INVALID_TEXT), "E_INVALID_TEXT expected");
        }
        return good;
    }

    static bool test_repeat_emission_is_identical_() {
        kiln::diag::Bag bag;
        const auto a = graph_of_(k_simple_, {"src/util.cpp", "tools/version.txt", "simple.cpp"}, bag);
        const auto b = graph_of_(k_simple_, {"src/util.cpp", "tools/version.txt", "simple.cpp"}, bag);
        if (!require_(a && b, "graphs must validate")) return false;

        bool good = true;
        for (const char* backend : {"ninja", "make"}) {
            const auto first = render_(*a, backend, bag);
            const auto second = render_(*b, backend, bag);
            good &= require_(first && second && *first == *second, "byte-identical output");
        }
        return good;
    }

    static bool test_rule_dedup_() {
        kiln::toolchain::CommandTemplate a{"cxx", {{kiln::toolchain::Slot::kLiteral, "g++"}}, false};
        kiln::toolchain::CommandTemplate b{"cxx", {{kiln::toolchain::Slot::kLiteral, "clang++"}}, false};
        kiln::toolchain::CommandTemplate c{"cxx", {{kiln::toolchain::Slot::kLiteral, "icpx"}}, false};

        kiln::emit::detail::RuleTable rules;
        bool good = true;
        good &= require_(rules.intern(a) == "cxx", "first template keeps its name");
        good &= require_(rules.intern(b) == "cxx_1", "second template is suffixed");
        good &= require_(rules.intern(a) == "cxx", "identical template is shared");
        good &= require_(rules.intern(c) == "cxx_2", "third template");
        good &= require_(rules.rules().size() == 3, "three rules");
        return good;
    }

    static bool test_failed_write_keeps_previous_file_() {
        std::error_code ec{};
        const auto root = std::filesystem::temp_directory_path(ec) / "kiln-emit-write";
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root, ec);

        bool good = true;
        {
            kiln::diag::Bag bag;
            good &= require_(kiln::emit::write_outputs(root, {{"build.ninja", "old\n"}}, bag), "first write");
        }

        // a directory where the temporary file should go makes the write fail
        std::filesystem::create_directories(root / "build.ninja.tmp", ec);
        {
            kiln::diag::Bag bag;
            const bool ok = kiln::emit::write_outputs(root, {{"build.ninja", "new\n"}}, bag);
            good &= require_(!ok && bag.has_code(kiln::diag::Code::E_WRITE_FAILED), "E_WRITE_FAILED expected");
        }

        const auto prev = kiln::os::read_text_file((root / "build.ninja").string());
        good &= require_(prev.ok && prev.text == "old\n", "previous content survives");

        std::filesystem::remove_all(root, ec);
        return good;
    }

    static bool test_backend_names_() {
        bool good = true;
        good &= require_(kiln::emit::is_known_backend("ninja") && kiln::emit::is_known_backend("make-posix"),
                         "known backends");
        good &= require_(!kiln::emit::is_known_backend("msbuild"), "unknown backend");
        good &= require_(kiln::emit::make_emitter("xcode", kiln::emit::MakeDialect::kGnu) == nullptr, "no emitter");
        const auto posix = kiln::emit::make_emitter("make", kiln::emit::MakeDialect::kPosix);
        good &= require_(posix && posix->name() == "make-posix", "configured make dialect");
        good &= require_(kiln::emit::parse_make_dialect("posix") == kiln::emit::MakeDialect::kPosix, "dialect names");
        return good;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"ninja_simple", test_ninja_simple_},
        {"make_simple", test_make_simple_},
        {"posix_make_refuses_order_only", test_posix_make_refuses_order_only_},
        {"posix_make_plain_graph", test_posix_make_plain_graph_},
        {"multi_output_commands", test_multi_output_commands_},
        {"escaping", test_escaping_},
        {"line_breaks_are_rejected", test_line_breaks_are_rejected_},
        {"repeat_emission_is_identical", test_repeat_emission_is_identical_},
        {"rule_dedup", test_rule_dedup_},
        {"failed_write_keeps_previous_file", test_failed_write_keeps_previous_file_},
        {"backend_names", test_backend_names_},
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
