#include <kiln/toolchain/Toolchain.hpp>

#include <cctype>
#include <cstdlib>

namespace kiln::toolchain {

namespace {

TemplateArg lit(std::string s) { return TemplateArg{Slot::kLiteral, std::move(s)}; }
TemplateArg slot(Slot s, std::string prefix = {}) { return TemplateArg{s, std::move(prefix)}; }

void append_literals(std::vector<TemplateArg>& args, const std::vector<std::string>& words) {
    for (const auto& w : words) args.push_back(lit(w));
}

const std::vector<std::string> k_empty{};

} // namespace

std::optional<Language> parse_language(std::string_view s) {
    if (s == "c") return Language::kC;
    if (s == "c++" || s == "cxx" || s == "cpp") return Language::kCxx;
    return std::nullopt;
}

std::optional<Platform> parse_platform(std::string_view s) {
    if (s == "linux") return Platform::kLinux;
    if (s == "darwin" || s == "macos") return Platform::kDarwin;
    if (s == "windows") return Platform::kWindows;
    return std::nullopt;
}

std::optional<Family> parse_family(std::string_view s) {
    if (s == "gcc") return Family::kGcc;
    if (s == "clang") return Family::kClang;
    if (s == "msvc") return Family::kMsvc;
    return std::nullopt;
}

std::string_view language_name(Language l) {
    switch (l) {
        case Language::kC: return "c";
        case Language::kCxx: return "c++";
    }
    return "unknown";
}

std::string_view platform_name(Platform p) {
    switch (p) {
        case Platform::kLinux: return "linux";
        case Platform::kDarwin: return "darwin";
        case Platform::kWindows: return "windows";
    }
    return "unknown";
}

std::string_view family_name(Family f) {
    switch (f) {
        case Family::kGcc: return "gcc";
        case Family::kClang: return "clang";
        case Family::kMsvc: return "msvc";
    }
    return "unknown";
}

Platform host_platform() {
#if defined(_WIN32)
    return Platform::kWindows;
#elif defined(__APPLE__)
    return Platform::kDarwin;
#else
    return Platform::kLinux;
#endif
}

std::optional<Language> language_for_source(std::string_view path) {
    const auto dot = path.rfind('.');
    if (dot == std::string_view::npos) return std::nullopt;
    const auto slash = path.find_last_of('/');
    if (slash != std::string_view::npos && slash > dot) return std::nullopt;

    const std::string_view ext = path.substr(dot);
    if (ext == ".c") return Language::kC;
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".C" || ext == ".c++") return Language::kCxx;
    return std::nullopt;
}

std::string_view slot_name(Slot s) {
    switch (s) {
        case Slot::kLiteral: return "";
        case Slot::kFlags: return "flags";
        case Slot::kIncludes: return "includes";
        case Slot::kLibDirs: return "libdirs";
        case Slot::kLibs: return "libs";
        case Slot::kIn: return "in";
        case Slot::kOut: return "out";
        case Slot::kDepfile: return "depfile";
    }
    return "";
}

const std::vector<std::string>& slot_values(const Bindings& b, Slot s) {
    switch (s) {
        case Slot::kFlags: return b.flags;
        case Slot::kIncludes: return b.includes;
        case Slot::kLibDirs: return b.libdirs;
        case Slot::kLibs: return b.libs;
        case Slot::kIn: return b.in;
        case Slot::kOut: return b.out;
        case Slot::kLiteral:
        case Slot::kDepfile:
            break;
    }
    return k_empty;
}

std::vector<std::string> expand(const CommandTemplate& tmpl, const Bindings& b) {
    std::vector<std::string> argv{};
    for (const auto& a : tmpl.args) {
        if (a.slot == Slot::kLiteral) {
            argv.push_back(a.text);
            continue;
        }
        if (a.slot == Slot::kDepfile) {
            if (!b.depfile.empty()) argv.push_back(a.text + b.depfile);
            continue;
        }
        for (const auto& v : slot_values(b, a.slot)) {
            argv.push_back(a.text + v);
        }
    }
    return argv;
}

const std::vector<std::string>& environment_keys() {
    static const std::vector<std::string> k{
        "CC", "CXX", "AR", "CFLAGS", "CXXFLAGS", "CPPFLAGS", "LDFLAGS", "LDLIBS",
    };
    return k;
}

Environment capture_environment() {
    Environment env{};
    for (const auto& k : environment_keys()) {
        const char* v = std::getenv(k.c_str());
        if (v != nullptr && *v != '\0') env[k] = v;
    }
    return env;
}

std::vector<std::string> split_flags(std::string_view text) {
    std::vector<std::string> out{};
    std::string cur{};
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

bool Registry::supported(const Key& key) {
    if (key.family == Family::kMsvc) return key.platform == Platform::kWindows;
    return true;
}

std::string Registry::env_or(const char* name, std::string_view fallback) const {
    const auto it = env_.find(name);
    if (it == env_.end() || it->second.empty()) return std::string(fallback);
    return it->second;
}

std::shared_ptr<const ToolchainDescriptor> Registry::lookup(const Key& key, const ast::Span& site, diag::Bag& diags) {
    if (!supported(key)) {
        diags.add(diag::Code::T_UNSUPPORTED_TOOLCHAIN,
                  site.file,
                  site.line,
                  site.column,
                  "no toolchain for language '" + std::string(language_name(key.language)) + "' with family '" +
                      std::string(family_name(key.family)) + "' on platform '" +
                      std::string(platform_name(key.platform)) + "'");
        return nullptr;
    }

    if (auto it = cache_.find(key); it != cache_.end()) return it->second;
    auto d = make_descriptor(key);
    cache_[key] = d;
    return d;
}

std::shared_ptr<const ToolchainDescriptor> Registry::make_descriptor(const Key& key) const {
    auto d = std::make_shared<ToolchainDescriptor>();
    d->key = key;

    const bool is_c = key.language == Language::kC;
    const std::string lang_suffix = is_c ? "cc" : "cxx";
    d->compile.rule = lang_suffix;
    d->link_executable.rule = "link_" + lang_suffix;
    d->link_shared.rule = "link_shared_" + lang_suffix;
    d->archive.rule = "ar";

    const auto cppflags = split_flags(env_or("CPPFLAGS", ""));
    const auto langflags = split_flags(env_or(is_c ? "CFLAGS" : "CXXFLAGS", ""));
    const auto ldflags = split_flags(env_or("LDFLAGS", ""));
    const auto ldlibs = split_flags(env_or("LDLIBS", ""));

    if (key.family == Family::kMsvc) {
        const auto cl = split_flags(env_or(is_c ? "CC" : "CXX", "cl"));
        const auto lib = split_flags(env_or("AR", "lib"));

        d->object_suffix = ".obj";
        d->executable_suffix = ".exe";
        d->static_prefix = "";
        d->static_suffix = ".lib";
        d->shared_prefix = "";
        d->shared_suffix = ".dll";
        d->include_prefix = "/I";
        d->define_prefix = "/D";
        d->libdir_prefix = "/LIBPATH:";
        d->link_prefix = "";
        d->link_suffix = ".lib";
        d->deps = DepsStyle::kMsvc;

        auto& c = d->compile.args;
        append_literals(c, cl);
        append_literals(c, {"/nologo", "/showIncludes"});
        append_literals(c, cppflags);
        append_literals(c, langflags);
        c.push_back(slot(Slot::kFlags));
        c.push_back(slot(Slot::kIncludes));
        c.push_back(lit("/c"));
        c.push_back(slot(Slot::kIn));
        c.push_back(slot(Slot::kOut, "/Fo"));

        for (auto* t : {&d->link_executable, &d->link_shared}) {
            auto& l = t->args;
            l.push_back(lit("link"));
            l.push_back(lit("/nologo"));
            if (t == &d->link_shared) l.push_back(lit("/DLL"));
            append_literals(l, ldflags);
            l.push_back(slot(Slot::kFlags));
            l.push_back(slot(Slot::kIn));
            l.push_back(slot(Slot::kLibDirs));
            l.push_back(slot(Slot::kLibs));
            append_literals(l, ldlibs);
            l.push_back(slot(Slot::kOut, "/OUT:"));
        }

        auto& a = d->archive.args;
        append_literals(a, lib);
        a.push_back(lit("/nologo"));
        a.push_back(slot(Slot::kOut, "/OUT:"));
        a.push_back(slot(Slot::kIn));
        return d;
    }

    const bool gcc = key.family == Family::kGcc;
    const auto cc = split_flags(env_or(is_c ? "CC" : "CXX", is_c ? (gcc ? "gcc" : "clang") : (gcc ? "g++" : "clang++")));
    const auto ar = split_flags(env_or("AR", "ar"));

    std::string shared_mode = "-shared";
    switch (key.platform) {
        case Platform::kLinux:
            d->pic_flag = "-fPIC";
            d->rpath_flag = "-Wl,-rpath,$ORIGIN";
            break;
        case Platform::kDarwin:
            d->shared_suffix = ".dylib";
            d->pic_flag = "-fPIC";
            d->rpath_flag = "-Wl,-rpath,@loader_path";
            shared_mode = "-dynamiclib";
            break;
        case Platform::kWindows:
            d->executable_suffix = ".exe";
            d->shared_prefix = "";
            d->shared_suffix = ".dll";
            break;
    }
    d->deps = DepsStyle::kGcc;

    auto& c = d->compile.args;
    append_literals(c, cc);
    append_literals(c, cppflags);
    append_literals(c, langflags);
    c.push_back(slot(Slot::kFlags));
    c.push_back(slot(Slot::kIncludes));
    c.push_back(lit("-MMD"));
    c.push_back(lit("-MF"));
    c.push_back(slot(Slot::kDepfile));
    c.push_back(lit("-c"));
    c.push_back(slot(Slot::kIn));
    c.push_back(lit("-o"));
    c.push_back(slot(Slot::kOut));

    for (auto* t : {&d->link_executable, &d->link_shared}) {
        auto& l = t->args;
        append_literals(l, cc);
        if (t == &d->link_shared) l.push_back(lit(shared_mode));
        append_literals(l, ldflags);
        l.push_back(slot(Slot::kFlags));
        l.push_back(slot(Slot::kIn));
        l.push_back(slot(Slot::kLibDirs));
        l.push_back(slot(Slot::kLibs));
        append_literals(l, ldlibs);
        l.push_back(lit("-o"));
        l.push_back(slot(Slot::kOut));
    }

    auto& a = d->archive.args;
    append_literals(a, ar);
    a.push_back(lit("cr"));
    a.push_back(slot(Slot::kOut));
    a.push_back(slot(Slot::kIn));
    return d;
}

} // namespace kiln::toolchain
