#include <kiln_tool/cli/Options.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <sys/wait.h>

namespace {

std::pair<int, std::string> run_capture(const std::string& command) {
    const std::string tmp = "/tmp/kiln_cli_capture.txt";
    const std::string full = command + " > " + tmp + " 2>&1";
    const int status = std::system(full.c_str());
    const int rc = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::remove(tmp.c_str());
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return {};
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::filesystem::path fresh_dir(const char* name) {
    std::error_code ec{};
    const auto root = std::filesystem::temp_directory_path(ec) / name;
    std::filesystem::remove_all(root, ec);
    return root;
}

kiln_tool::cli::Options parse(std::vector<std::string> words) {
    words.insert(words.begin(), "kiln");
    std::vector<char*> argv{};
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);
    return kiln_tool::cli::parse_options(static_cast<int>(words.size()), argv.data());
}

bool test_option_parsing() {
    using kiln_tool::cli::Command;
    using kiln_tool::cli::Mode;

    const auto cfg = parse({"configure", "src", "out", "-Dname=demo", "-D", "mode=debug", "--backend", "make",
                            "--backend=ninja", "--toolchain=clang", "--platform", "darwin", "-v"});
    if (!cfg.ok || cfg.mode != Mode::kCommand || cfg.command != Command::kConfigure) {
        std::cerr << "configure parse failed: " << cfg.error << "\n";
        return false;
    }
    if (cfg.configure.source_dir != "src" || cfg.configure.build_dir != "out" || !cfg.configure.verbose) {
        std::cerr << "configure positionals\n";
        return false;
    }
    const auto& sel = cfg.configure.select;
    if (sel.defines != std::vector<std::string>{"name=demo", "mode=debug"} ||
        sel.backends != std::vector<std::string>{"make", "ninja"} || sel.toolchain != "clang" ||
        sel.platform != "darwin") {
        std::cerr << "configure selection\n";
        return false;
    }

    const auto build = parse({"build", "out", "-j", "8"});
    if (!build.ok || build.build.build_dir != "out" || build.build.jobs != 8u) {
        std::cerr << "build parse failed\n";
        return false;
    }

    const auto graph = parse({"graph", "--format=dot"});
    if (!graph.ok || graph.graph.source_dir != "." || graph.graph.format != "dot") {
        std::cerr << "graph parse failed\n";
        return false;
    }

    if (parse({}).mode != Mode::kUsage || parse({"--version"}).mode != Mode::kVersion) {
        std::cerr << "global modes\n";
        return false;
    }

    struct Bad {
        std::vector<std::string> words;
        const char* needle;
    };
    const Bad bad[] = {
        {{"configure", "src"}, "configure requires <srcdir> <builddir>"},
        {{"configure", "a", "b", "-Dnoequals"}, "-D requires name=value"},
        {{"configure", "a", "b", "--backend", "scons"}, "unknown backend: scons"},
        {{"check", "--toolchain", "icc"}, "unknown toolchain: icc"},
        {{"build", "--jobs", "0"}, "--jobs requires a positive integer"},
        {{"graph", "--format", "svg"}, "unknown graph format: svg"},
        {{"regenerate", "--backend", "ninja"}, "unknown regenerate option: --backend"},
        {{"install"}, "unknown command: install"},
        {{"--quiet"}, "unknown global option: --quiet"},
    };
    for (const auto& b : bad) {
        const auto o = parse(b.words);
        if (o.ok || !contains(o.error, b.needle)) {
            std::cerr << "expected rejection: " << b.needle << " (got '" << o.error << "')\n";
            return false;
        }
    }
    return true;
}

bool test_help_and_version() {
    const std::string bin = KILN_BUILD_BIN;

    auto [rc_help, out_help] = run_capture("\"" + bin + "\" --help");
    if (rc_help != 0 || !contains(out_help, "Commands:")) {
        std::cerr << "help failed\n" << out_help;
        return false;
    }

    auto [rc_ver, out_ver] = run_capture("\"" + bin + "\" --version");
    if (rc_ver != 0 || !contains(out_ver, "kiln 0.3.0")) {
        std::cerr << "version failed\n" << out_ver;
        return false;
    }

    auto [rc_bad, out_bad] = run_capture("\"" + bin + "\" frobnicate");
    if (rc_bad != 1 || !contains(out_bad, "unknown command: frobnicate") || !contains(out_bad, "Commands:")) {
        std::cerr << "usage error failed\n" << out_bad;
        return false;
    }
    return true;
}

bool test_configure_and_regenerate() {
    const std::string bin = KILN_BUILD_BIN;
    const std::string src = std::string(KILN_TEST_CASE_DIR) + "/simple";
    const auto build = fresh_dir("kiln-cli-configure");

    auto [rc, out] = run_capture("\"" + bin + "\" configure \"" + src + "\" \"" + build.string() +
                                 "\" --backend ninja --backend make -Dname=cli");
    if (rc != 0 || !std::filesystem::exists(build / "build.ninja") || !std::filesystem::exists(build / "Makefile")) {
        std::cerr << "configure failed\n" << out;
        return false;
    }
    if (!std::filesystem::exists(build / ".kiln_environ")) {
        std::cerr << "environment not recorded\n";
        return false;
    }

    const std::string ninja = read_text(build / "build.ninja");
    if (!contains(ninja, "-DAPP_NAME=cli") || !contains(ninja, "build all: phony simple")) {
        std::cerr << "unexpected build.ninja\n" << ninja;
        return false;
    }

    std::error_code ec{};
    std::filesystem::remove(build / "build.ninja", ec);
    auto [rc_re, out_re] = run_capture("\"" + bin + "\" regenerate \"" + build.string() + "\"");
    if (rc_re != 0 || read_text(build / "build.ninja") != ninja) {
        std::cerr << "regenerate did not reproduce build.ninja\n" << out_re;
        return false;
    }
    return true;
}

bool test_error_exit_codes() {
    const std::string bin = KILN_BUILD_BIN;
    struct Case {
        const char* dir;
        int code;
        const char* needle;
    };
    const Case cases[] = {
        {"err_forward_ref", 2, "util"},
        {"err_conflict", 3, "app"},
        {"err_missing_source", 3, "absent.cpp"},
        {"err_bad_option", 2, "name"},
    };

    for (const auto& c : cases) {
        const auto build = fresh_dir("kiln-cli-error");
        const std::string src = std::string(KILN_TEST_CASE_DIR) + "/" + c.dir;
        auto [rc, out] = run_capture("\"" + bin + "\" configure \"" + src + "\" \"" + build.string() + "\"");
        if (rc != c.code || !contains(out, c.needle)) {
            std::cerr << c.dir << ": expected exit " << c.code << ", got " << rc << "\n" << out;
            return false;
        }
        if (std::filesystem::exists(build / "build.ninja")) {
            std::cerr << c.dir << ": failed generation left a build file\n";
            return false;
        }
    }
    return true;
}

bool test_check_and_graph() {
    const std::string bin = KILN_BUILD_BIN;
    const std::string src = std::string(KILN_TEST_CASE_DIR) + "/simple";

    auto [rc_check, out_check] = run_capture("\"" + bin + "\" check \"" + src + "\"");
    if (rc_check != 0 || !contains(out_check, "no errors")) {
        std::cerr << "check failed\n" << out_check;
        return false;
    }

    auto [rc_dot, out_dot] = run_capture("\"" + bin + "\" graph \"" + src + "\" --format dot");
    if (rc_dot != 0 || !contains(out_dot, "digraph kiln_build")) {
        std::cerr << "graph dot failed\n" << out_dot;
        return false;
    }

    auto [rc_json, out_json] = run_capture("\"" + bin + "\" graph \"" + src + "\"");
    if (rc_json != 0 || !contains(out_json, "\"simple\"")) {
        std::cerr << "graph json failed\n" << out_json;
        return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok1 = test_option_parsing();
    const bool ok2 = test_help_and_version();
    const bool ok3 = test_configure_and_regenerate();
    const bool ok4 = test_error_exit_codes();
    const bool ok5 = test_check_and_graph();

    if (!ok1 || !ok2 || !ok3 || !ok4 || !ok5) {
        return 1;
    }

    std::cout << "kiln cli tests passed\n";
    return 0;
}
