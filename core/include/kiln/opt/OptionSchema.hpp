#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/config/Config.hpp>
#include <kiln/diag/DiagCode.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kiln::opt {

using OptionType = ast::OptionType;

// Enum options hold their choice as a string.
using OptionValue = std::variant<std::string, bool, std::vector<std::string>>;

enum class ValidatorKind : uint8_t {
    kNonEmpty,
    kMatches,
    kMinItems,
};

struct Validator {
    ValidatorKind kind = ValidatorKind::kNonEmpty;
    std::string pattern{};
    int64_t min_items = 0;
};

struct OptionDef {
    std::string name{};
    OptionType type = OptionType::kString;
    std::vector<std::string> choices{};
    OptionValue default_value{};
    std::string help{};
    std::vector<Validator> validators{};
    ast::Span site{};
};

class Schema {
public:
    bool declare(OptionDef def, diag::Bag& diags);

    const OptionDef* find(std::string_view name) const;
    const std::vector<OptionDef>& all() const { return defs_; }
    bool empty() const { return defs_.empty(); }

private:
    std::vector<OptionDef> defs_{};
    std::map<std::string, std::size_t> index_{};
};

// `-D name=value` from the command line, still as text.
struct CliOverride {
    std::string name{};
    std::string text{};
};

class ResolvedOptions {
public:
    const OptionValue* find(std::string_view name) const;
    const std::map<std::string, OptionValue>& values() const { return values_; }

private:
    friend std::optional<ResolvedOptions> resolve(const Schema&,
                                                  const config::FlatMap&,
                                                  const std::vector<CliOverride>&,
                                                  diag::Bag&);
    std::map<std::string, OptionValue> values_{};
};

bool parse_cli_override(std::string_view arg, CliOverride& out, std::string& err);

// Builds the schema from the `option` items of an options file.
bool load_schema(const ast::Program& program, Schema& out, diag::Bag& diags);

// default < project (typed kiln.toml values) < invocation (text)
std::optional<ResolvedOptions> resolve(const Schema& schema,
                                       const config::FlatMap& project_overrides,
                                       const std::vector<CliOverride>& cli_overrides,
                                       diag::Bag& diags);

std::string_view type_name(const OptionDef& def);

} // namespace kiln::opt
