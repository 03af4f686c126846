#include <kiln_tool/cli/Options.hpp>

#include <array>
#include <charconv>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kiln_tool::cli {

namespace {

constexpr std::array<std::pair<std::string_view, Command>, 5> k_commands{{
    {"configure", Command::kConfigure},
    {"regenerate", Command::kRegenerate},
    {"build", Command::kBuild},
    {"check", Command::kCheck},
    {"graph", Command::kGraph},
}};

Command find_command(std::string_view word) {
    for (const auto& [name, cmd] : k_commands) {
        if (name == word) return cmd;
    }
    return Command::kNone;
}

std::string_view command_name(Command c) {
    for (const auto& [name, cmd] : k_commands) {
        if (cmd == c) return name;
    }
    return "kiln";
}

bool one_of(std::string_view v, std::initializer_list<std::string_view> allowed) {
    for (const auto a : allowed) {
        if (v == a) return true;
    }
    return false;
}

// Walks argv after the program name. Flags take their value either as
// `--flag=value` or as the next word.
class ArgStream {
public:
    ArgStream(int argc, char** argv) {
        for (int i = 1; i < argc; ++i) args_.emplace_back(argv[i]);
    }

    bool done() const { return pos_ >= args_.size(); }
    std::string_view peek() const { return args_[pos_]; }
    std::string_view next() { return args_[pos_++]; }

    // Consumes `flag` (or `alias`) and its value. False when the current word
    // is a different flag; a missing or empty value sets `err`.
    bool take_value(std::string_view flag, std::string& out, std::string& err, std::string_view alias = {}) {
        const auto w = peek();
        const bool glued = w.size() > flag.size() && w.starts_with(flag) && w[flag.size()] == '=';
        if (!glued && w != flag && (alias.empty() || w != alias)) return false;
        ++pos_;
        if (glued) {
            out = std::string(w.substr(flag.size() + 1));
        } else if (!done()) {
            out = std::string(next());
        } else {
            out.clear();
        }
        if (out.empty()) err = std::string(flag) + " requires a value";
        return true;
    }

    // `-Dname=value`, or `-D name=value`.
    bool take_define(std::string& out, std::string& err) {
        const auto w = peek();
        if (!w.starts_with("-D")) return false;
        ++pos_;
        if (w.size() > 2) {
            out = std::string(w.substr(2));
        } else if (!done()) {
            out = std::string(next());
        } else {
            err = "-D requires name=value";
            return true;
        }
        if (out.find('=') == std::string::npos) err = "-D requires name=value, got '" + out + "'";
        return true;
    }

private:
    std::vector<std::string_view> args_{};
    size_t pos_ = 0;
};

bool positive_u32(std::string_view text, uint32_t& out) {
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && end == text.data() + text.size() && out != 0;
}

// Selection flags shared by configure, check and graph. Returns false when
// the current word is none of them.
bool take_select(ArgStream& args, SelectOptions& sel, std::string& err) {
    std::string v{};
    if (args.take_define(v, err)) {
        if (err.empty()) sel.defines.push_back(std::move(v));
        return true;
    }
    if (args.take_value("--backend", v, err)) {
        if (!err.empty()) return true;
        if (!one_of(v, {"ninja", "make", "make-posix"})) err = "unknown backend: " + v;
        else sel.backends.push_back(std::move(v));
        return true;
    }
    if (args.take_value("--toolchain", v, err)) {
        if (!err.empty()) return true;
        if (!one_of(v, {"gcc", "clang", "msvc"})) err = "unknown toolchain: " + v;
        else sel.toolchain = std::move(v);
        return true;
    }
    if (args.take_value("--platform", v, err)) {
        if (!err.empty()) return true;
        if (!one_of(v, {"linux", "darwin", "windows"})) err = "unknown platform: " + v;
        else sel.platform = std::move(v);
        return true;
    }
    return false;
}

SelectOptions* select_of(Options& o) {
    switch (o.command) {
        case Command::kConfigure: return &o.configure.select;
        case Command::kCheck: return &o.check.select;
        case Command::kGraph: return &o.graph.select;
        default: return nullptr;
    }
}

bool* verbose_of(Options& o) {
    switch (o.command) {
        case Command::kConfigure: return &o.configure.verbose;
        case Command::kRegenerate: return &o.regenerate.verbose;
        case Command::kBuild: return &o.build.verbose;
        default: return nullptr;
    }
}

// Places positional words; returns an error message or an empty string.
std::string bind_positionals(Options& o, const std::vector<std::string>& pos) {
    const auto at_most_one = [&](std::string& dst, const char* what) -> std::string {
        if (pos.size() > 1) return std::string(command_name(o.command)) + " takes at most one " + what;
        if (!pos.empty()) dst = pos.front();
        return {};
    };

    switch (o.command) {
        case Command::kConfigure:
            if (pos.size() != 2) return "configure requires <srcdir> <builddir>";
            o.configure.source_dir = pos[0];
            o.configure.build_dir = pos[1];
            return {};
        case Command::kRegenerate: return at_most_one(o.regenerate.build_dir, "build directory");
        case Command::kBuild: return at_most_one(o.build.build_dir, "build directory");
        case Command::kCheck: return at_most_one(o.check.source_dir, "source directory");
        case Command::kGraph: return at_most_one(o.graph.source_dir, "source directory");
        case Command::kNone: break;
    }
    return {};
}

} // namespace

void print_usage(std::ostream& os) {
    os << "kiln [--help | --version] <command> [args]\n"
          "\n"
          "Commands:\n"
          "  configure <srcdir> <builddir> [--backend ninja|make|make-posix]...\n"
          "            [--toolchain gcc|clang|msvc] [--platform linux|darwin|windows]\n"
          "            [-D name=value]... [--verbose]\n"
          "  regenerate [builddir] [--verbose]\n"
          "  build [builddir] [--jobs <N>] [--verbose]\n"
          "  check [srcdir] [--backend ...] [--toolchain ...] [--platform ...] [-D name=value]...\n"
          "  graph [srcdir] [--format json|text|dot] [--toolchain ...] [--platform ...] [-D name=value]...\n";
}

Options parse_options(int argc, char** argv) {
    Options out{};
    ArgStream args(argc, argv);

    auto fail = [&](std::string msg) {
        out.ok = false;
        out.error = std::move(msg);
        return out;
    };

    if (args.done()) return out;

    const auto head = args.next();
    if (head == "-h" || head == "--help") return out;
    if (head == "--version") {
        out.mode = Mode::kVersion;
        return out;
    }
    out.command = find_command(head);
    if (out.command == Command::kNone) {
        if (head.starts_with("-")) return fail("unknown global option: " + std::string(head));
        return fail("unknown command: " + std::string(head));
    }
    out.mode = Mode::kCommand;

    std::vector<std::string> positional{};
    while (!args.done()) {
        const auto w = args.peek();
        if (w.empty() || w.front() != '-') {
            positional.emplace_back(args.next());
            continue;
        }

        std::string err{};
        std::string v{};
        if (w == "--verbose" || w == "-v") {
            bool* verbose = verbose_of(out);
            if (verbose == nullptr) break;
            *verbose = true;
            args.next();
        } else if (SelectOptions* sel = select_of(out); sel != nullptr && take_select(args, *sel, err)) {
            if (!err.empty()) return fail(err);
        } else if (out.command == Command::kBuild && args.take_value("--jobs", v, err, "-j")) {
            if (!err.empty()) return fail(err);
            uint32_t jobs = 0;
            if (!positive_u32(v, jobs)) return fail("--jobs requires a positive integer");
            out.build.jobs = jobs;
        } else if (out.command == Command::kGraph && args.take_value("--format", v, err)) {
            if (!err.empty()) return fail(err);
            if (!one_of(v, {"json", "text", "dot"})) return fail("unknown graph format: " + v);
            out.graph.format = std::move(v);
        } else {
            break;
        }
    }
    if (!args.done()) {
        return fail("unknown " + std::string(command_name(out.command)) + " option: " + std::string(args.peek()));
    }

    if (auto err = bind_positionals(out, positional); !err.empty()) return fail(std::move(err));
    return out;
}

} // namespace kiln_tool::cli
