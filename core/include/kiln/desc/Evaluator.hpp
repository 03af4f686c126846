#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/desc/Context.hpp>
#include <kiln/diag/DiagCode.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::desc {

struct Value {
    enum class Kind : uint8_t {
        kString,
        kBool,
        kInt,
        kList,
        kTarget,
    };

    Kind kind = Kind::kString;
    std::string str{};
    bool b = false;
    int64_t i = 0;
    std::vector<Value> items{};
    TargetHandle target{};

    static Value make_string(std::string s) {
        Value v{};
        v.kind = Kind::kString;
        v.str = std::move(s);
        return v;
    }
    static Value make_bool(bool x) {
        Value v{};
        v.kind = Kind::kBool;
        v.b = x;
        return v;
    }
    static Value make_int(int64_t x) {
        Value v{};
        v.kind = Kind::kInt;
        v.i = x;
        return v;
    }
    static Value make_list(std::vector<Value> xs) {
        Value v{};
        v.kind = Kind::kList;
        v.items = std::move(xs);
        return v;
    }
    static Value make_target(TargetHandle h) {
        Value v{};
        v.kind = Kind::kTarget;
        v.target = h;
        return v;
    }
};

std::string_view value_kind_name(Value::Kind k);

// Walks a parsed description once, in declaration order, issuing one
// Context call per statement. Stops at the first failing statement.
class Evaluator {
public:
    Evaluator(Context& ctx, diag::Bag& diags) : ctx_(ctx), diags_(diags) {}

    bool run(const ast::Program& program);

private:
    bool eval_item(const ast::Item& item);
    bool eval_target(const ast::Item& item);
    bool eval_executable(const ast::Item& item, const std::map<std::string, Value>& fields);
    bool eval_library(const ast::Item& item, const std::map<std::string, Value>& fields);
    bool eval_command(const ast::Item& item, const std::map<std::string, Value>& fields);

    std::optional<Value> eval(const ast::Expr& e);
    std::optional<Value> concat(const Value& lhs, const Value& rhs, const ast::Span& sp);

    bool to_string(const Value& v, const ast::Span& sp, std::string_view what, std::string& out);
    bool to_strings(const Value& v, const ast::Span& sp, std::string_view what, std::vector<std::string>& out);
    bool to_refs(const Value& v, const ast::Span& sp, std::string_view what, std::vector<Ref>& out);
    bool to_targets(const Value& v, const ast::Span& sp, std::string_view what, std::vector<TargetHandle>& out);
    bool to_language(const Value& v, const ast::Span& sp, std::optional<toolchain::Language>& out);

    void error(diag::Code code, const ast::Span& sp, std::string msg);

    Context& ctx_;
    diag::Bag& diags_;
    std::map<std::string, Value> lets_{};
    std::map<std::string, ast::Span> field_sites_{};
};

} // namespace kiln::desc
