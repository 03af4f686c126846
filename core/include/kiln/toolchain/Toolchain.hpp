#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/diag/DiagCode.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace kiln::toolchain {

enum class Language : uint8_t {
    kC,
    kCxx,
};

enum class Platform : uint8_t {
    kLinux,
    kDarwin,
    kWindows,
};

enum class Family : uint8_t {
    kGcc,
    kClang,
    kMsvc,
};

std::optional<Language> parse_language(std::string_view s);
std::optional<Platform> parse_platform(std::string_view s);
std::optional<Family> parse_family(std::string_view s);
std::string_view language_name(Language l);
std::string_view platform_name(Platform p);
std::string_view family_name(Family f);

Platform host_platform();

// `.c` -> c, `.cpp` `.cc` `.cxx` `.C` -> c++
std::optional<Language> language_for_source(std::string_view path);

struct Key {
    Language language = Language::kCxx;
    Platform platform = Platform::kLinux;
    Family family = Family::kGcc;

    bool operator<(const Key& o) const {
        return std::tie(language, platform, family) < std::tie(o.language, o.platform, o.family);
    }
};

enum class Slot : uint8_t {
    kLiteral,
    kFlags,
    kIncludes,
    kLibDirs,
    kLibs,
    kIn,
    kOut,
    kDepfile,
};

// A literal argument, or a placeholder whose values are each prefixed by
// `text` (msvc `/Fo$out`).
struct TemplateArg {
    Slot slot = Slot::kLiteral;
    std::string text{};

    bool operator==(const TemplateArg&) const = default;
};

struct CommandTemplate {
    std::string rule{};
    std::vector<TemplateArg> args{};
    // Custom commands carry their full argv per edge and share one rule.
    bool per_edge = false;

    bool operator==(const CommandTemplate&) const = default;
};

struct Bindings {
    std::vector<std::string> flags{};
    std::vector<std::string> includes{};
    std::vector<std::string> libdirs{};
    std::vector<std::string> libs{};
    std::vector<std::string> in{};
    std::vector<std::string> out{};
    std::string depfile{};
};

const std::vector<std::string>& slot_values(const Bindings& b, Slot s);
std::string_view slot_name(Slot s);

// Positional expansion; nothing is escaped here.
std::vector<std::string> expand(const CommandTemplate& tmpl, const Bindings& b);

enum class DepsStyle : uint8_t {
    kNone,
    kGcc,
    kMsvc,
};

struct ToolchainDescriptor {
    Key key{};

    CommandTemplate compile{};
    CommandTemplate link_executable{};
    CommandTemplate link_shared{};
    CommandTemplate archive{};

    std::string object_suffix = ".o";
    std::string executable_suffix{};
    std::string static_prefix = "lib";
    std::string static_suffix = ".a";
    std::string shared_prefix = "lib";
    std::string shared_suffix = ".so";

    std::string include_prefix = "-I";
    std::string define_prefix = "-D";
    std::string libdir_prefix = "-L";
    std::string link_prefix = "-l";
    std::string link_suffix{};

    std::string pic_flag{};
    std::string rpath_flag{};

    DepsStyle deps = DepsStyle::kNone;

    std::string include_flag(std::string_view dir) const { return include_prefix + std::string(dir); }
    std::string define_flag(std::string_view def) const { return define_prefix + std::string(def); }
    std::string libdir_flag(std::string_view dir) const { return libdir_prefix + std::string(dir); }
    std::string link_flag(std::string_view name) const { return link_prefix + std::string(name) + link_suffix; }

    std::string object_name(std::string_view source) const { return std::string(source) + object_suffix; }
    std::string executable_name(std::string_view name) const { return std::string(name) + executable_suffix; }
    std::string static_library_name(std::string_view name) const { return static_prefix + std::string(name) + static_suffix; }
    std::string shared_library_name(std::string_view name) const { return shared_prefix + std::string(name) + shared_suffix; }
};

// Variables captured at configure time: CC CXX AR CFLAGS CXXFLAGS CPPFLAGS
// LDFLAGS LDLIBS.
using Environment = std::map<std::string, std::string>;

Environment capture_environment();
const std::vector<std::string>& environment_keys();

// Whitespace split used for the *FLAGS variables.
std::vector<std::string> split_flags(std::string_view text);

class Registry {
public:
    explicit Registry(Environment env = {}) : env_(std::move(env)) {}

    // null + T_UNSUPPORTED_TOOLCHAIN for unknown combinations
    std::shared_ptr<const ToolchainDescriptor> lookup(const Key& key, const ast::Span& site, diag::Bag& diags);

    static bool supported(const Key& key);

private:
    std::shared_ptr<const ToolchainDescriptor> make_descriptor(const Key& key) const;
    std::string env_or(const char* name, std::string_view fallback) const;

    Environment env_{};
    std::map<Key, std::shared_ptr<const ToolchainDescriptor>> cache_{};
};

} // namespace kiln::toolchain
