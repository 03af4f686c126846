#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kiln::ast {

struct Span {
    std::string file;
    uint32_t line = 1;
    uint32_t column = 1;
};

enum class ExprKind : uint8_t {
    kString,
    kInt,
    kBool,
    kIdent,
    kList,
    kOptionRef,
    kConcat,
};

struct Expr {
    ExprKind kind = ExprKind::kIdent;
    Span span{};

    std::string text{};
    int64_t int_value = 0;
    bool bool_value = false;

    std::vector<std::unique_ptr<Expr>> items{};

    std::unique_ptr<Expr> lhs{};
    std::unique_ptr<Expr> rhs{};
};

// `name = expr;` inside a declaration body.
struct Field {
    std::string name{};
    Span span{};
    std::unique_ptr<Expr> value{};
};

enum class OptionType : uint8_t {
    kString,
    kBool,
    kEnum,
    kList,
};

struct ValidatorNode {
    std::string rule{};
    Span span{};
    std::unique_ptr<Expr> arg{};
};

struct OptionDecl {
    std::string name{};
    OptionType type = OptionType::kString;
    std::vector<std::string> choices{};
    std::unique_ptr<Expr> default_value{};
    std::vector<Field> fields{};
    std::vector<ValidatorNode> validators{};
};

enum class ItemKind : uint8_t {
    kProject,
    kOption,
    kLet,
    kGlobalFlags,
    kExecutable,
    kLibrary,
    kCommand,
    kAlias,
    kDefault,
    kInstall,
};

struct Item {
    ItemKind kind = ItemKind::kProject;
    Span span{};

    // target / let / alias / project name, global_flags language
    std::string name{};
    std::string version{};

    OptionDecl option{};
    std::vector<Field> fields{};

    // let value, alias members, default/install lists, global flags
    std::unique_ptr<Expr> expr{};
};

struct Program {
    std::vector<Item> items{};
};

} // namespace kiln::ast
