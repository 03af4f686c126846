#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/graph/Path.hpp>
#include <kiln/opt/OptionSchema.hpp>
#include <kiln/toolchain/Toolchain.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::desc {

// Everything a generation run depends on. Built once by the caller and only
// read afterwards.
struct GenerationContext {
    std::filesystem::path source_root{};
    std::filesystem::path build_root{};
    toolchain::Platform platform = toolchain::Platform::kLinux;
    toolchain::Family family = toolchain::Family::kGcc;
    toolchain::Environment env{};
    opt::ResolvedOptions options{};
};

// Source directory as seen from the build directory: "" when equal, a
// relative path when possible, otherwise absolute.
std::string source_prefix(const GenerationContext& gen);

enum class TargetKind : uint8_t {
    kExecutable,
    kStaticLibrary,
    kSharedLibrary,
    kCustomCommand,
    kAlias,
};

std::string_view target_kind_name(TargetKind k);

class TargetHandle {
public:
    TargetHandle() = default;

    bool valid() const { return id_ != k_invalid; }
    uint32_t index() const { return id_; }

    bool operator==(const TargetHandle& o) const { return id_ == o.id_; }

private:
    friend class Context;

    static constexpr uint32_t k_invalid = std::numeric_limits<uint32_t>::max();

    explicit TargetHandle(uint32_t id) : id_(id) {}

    uint32_t id_ = k_invalid;
};

// A plain string (path, argument or external library name) or a target.
struct Ref {
    std::string text{};
    TargetHandle target{};

    bool is_target() const { return target.valid(); }

    static Ref str(std::string s) { return Ref{std::move(s), TargetHandle{}}; }
    static Ref of(TargetHandle h) { return Ref{{}, h}; }
};

struct SourceFile {
    graph::Path path{};
    toolchain::Language language = toolchain::Language::kCxx;
};

struct Target {
    std::string name{};
    TargetKind kind = TargetKind::kExecutable;
    ast::Span site{};

    // executable / library
    std::vector<SourceFile> sources{};
    std::vector<graph::Path> generated_headers{};
    std::vector<std::string> flags{};
    std::vector<std::string> includes{};
    std::vector<Ref> links{};
    std::vector<TargetHandle> deps{};
    toolchain::Language link_language = toolchain::Language::kCxx;
    std::map<toolchain::Language, std::shared_ptr<const toolchain::ToolchainDescriptor>> toolchains{};

    // custom command
    std::vector<graph::Path> inputs{};
    std::vector<TargetHandle> input_targets{};
    std::vector<toolchain::TemplateArg> run{};
    std::vector<TargetHandle> order_only{};

    // alias
    std::vector<TargetHandle> members{};

    std::vector<graph::Path> outputs{};

    const toolchain::ToolchainDescriptor* link_toolchain() const {
        const auto it = toolchains.find(link_language);
        return it == toolchains.end() ? nullptr : it->second.get();
    }
};

struct ProjectInfo {
    std::string name{};
    std::string version{};
};

struct TargetRegistry {
    ProjectInfo project{};
    std::vector<Target> targets{};
    std::map<toolchain::Language, std::vector<std::string>> global_flags{};
    bool has_default_statement = false;
    std::vector<TargetHandle> defaults{};
    std::vector<TargetHandle> installs{};

    const Target& get(TargetHandle h) const { return targets[h.index()]; }
};

enum class LibraryKind : uint8_t {
    kStatic,
    kShared,
};

struct ExecutableDecl {
    std::string name{};
    std::vector<Ref> sources{};
    std::vector<std::string> flags{};
    std::vector<Ref> links{};
    std::vector<TargetHandle> deps{};
    std::vector<std::string> includes{};
    std::optional<toolchain::Language> language{};
    ast::Span site{};
};

struct LibraryDecl {
    std::string name{};
    std::vector<Ref> sources{};
    std::vector<std::string> flags{};
    LibraryKind kind = LibraryKind::kStatic;
    std::vector<Ref> links{};
    std::vector<TargetHandle> deps{};
    std::vector<std::string> includes{};
    std::optional<toolchain::Language> language{};
    ast::Span site{};
};

struct CommandDecl {
    std::string name{};
    std::vector<Ref> inputs{};
    std::vector<std::string> outputs{};
    // "$in" / "$out" arguments are placeholders
    std::vector<Ref> command{};
    std::vector<TargetHandle> order_only{};
    ast::Span site{};
};

class Context {
public:
    Context(const GenerationContext& gen, toolchain::Registry& toolchains, diag::Bag& diags)
        : gen_(gen), toolchains_(toolchains), diags_(diags) {}

    bool set_project(std::string name, std::string version, const ast::Span& site);

    std::optional<TargetHandle> declare_executable(const ExecutableDecl& d);
    std::optional<TargetHandle> declare_library(const LibraryDecl& d);
    std::optional<TargetHandle> declare_custom_command(const CommandDecl& d);
    std::optional<TargetHandle> declare_alias(const std::string& name,
                                              const std::vector<TargetHandle>& members,
                                              const ast::Span& site);
    // false + D_INVALID_DECLARATION for a flag holding a line break
    bool declare_global_flags(const std::vector<std::string>& flags,
                              toolchain::Language language,
                              const ast::Span& site);

    // null + O_UNKNOWN_OPTION when the option is not declared
    const opt::OptionValue* reference_option(std::string_view name, const ast::Span& site);

    bool set_default(const std::vector<TargetHandle>& targets, const ast::Span& site);
    bool install(const std::vector<TargetHandle>& targets, const ast::Span& site);

    std::optional<TargetHandle> find(std::string_view name) const;
    const Target& target(TargetHandle h) const { return registry_.get(h); }
    const TargetRegistry& registry() const { return registry_; }
    const GenerationContext& generation() const { return gen_; }

private:
    std::optional<TargetHandle> declare_compiled(TargetKind kind,
                                                 const std::string& name,
                                                 const std::vector<Ref>& sources,
                                                 const std::vector<std::string>& flags,
                                                 const std::vector<Ref>& links,
                                                 const std::vector<TargetHandle>& deps,
                                                 const std::vector<std::string>& includes,
                                                 std::optional<toolchain::Language> language,
                                                 const ast::Span& site);

    bool check_new_name(const std::string& name, const ast::Span& site);
    bool check_handle(TargetHandle h, const ast::Span& site, std::string_view what);
    bool normalize_source(const std::string& raw, const ast::Span& site, std::string& out);
    TargetHandle push(Target t);

    void error(diag::Code code, const ast::Span& site, std::string msg);

    const GenerationContext& gen_;
    toolchain::Registry& toolchains_;
    diag::Bag& diags_;

    TargetRegistry registry_{};
    std::map<std::string, TargetHandle> by_name_{};
    bool project_set_ = false;
};

} // namespace kiln::desc
