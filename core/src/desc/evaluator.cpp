#include <kiln/desc/Evaluator.hpp>

#include <set>

namespace kiln::desc {

namespace {

const std::set<std::string>& allowed_fields(ast::ItemKind k) {
    static const std::set<std::string> exe{"sources", "flags", "link", "deps", "includes", "lang"};
    static const std::set<std::string> lib{"kind", "sources", "flags", "link", "deps", "includes", "lang"};
    static const std::set<std::string> cmd{"inputs", "outputs", "run", "order_only"};
    static const std::set<std::string> none{};
    switch (k) {
        case ast::ItemKind::kExecutable: return exe;
        case ast::ItemKind::kLibrary: return lib;
        case ast::ItemKind::kCommand: return cmd;
        default: return none;
    }
}

std::string_view item_word(ast::ItemKind k) {
    switch (k) {
        case ast::ItemKind::kExecutable: return "executable";
        case ast::ItemKind::kLibrary: return "library";
        case ast::ItemKind::kCommand: return "command";
        default: return "item";
    }
}

} // namespace

std::string_view value_kind_name(Value::Kind k) {
    switch (k) {
        case Value::Kind::kString: return "string";
        case Value::Kind::kBool: return "bool";
        case Value::Kind::kInt: return "int";
        case Value::Kind::kList: return "list";
        case Value::Kind::kTarget: return "target";
    }
    return "unknown";
}

void Evaluator::error(diag::Code code, const ast::Span& sp, std::string msg) {
    diags_.add(code, sp.file, sp.line, sp.column, std::move(msg));
}

bool Evaluator::run(const ast::Program& program) {
    for (const auto& item : program.items) {
        if (!eval_item(item)) return false;
    }
    return true;
}

bool Evaluator::eval_item(const ast::Item& item) {
    switch (item.kind) {
        case ast::ItemKind::kProject:
            return ctx_.set_project(item.name, item.version, item.span);

        case ast::ItemKind::kOption:
            error(diag::Code::D_INVALID_DECLARATION,
                  item.span,
                  "option '" + item.name + "' must be declared in options.kiln");
            return false;

        case ast::ItemKind::kLet: {
            if (lets_.contains(item.name)) {
                error(diag::Code::D_INVALID_DECLARATION, item.span, "binding '" + item.name + "' is already defined");
                return false;
            }
            if (!item.expr) return false;
            auto v = eval(*item.expr);
            if (!v) return false;
            lets_[item.name] = std::move(*v);
            return true;
        }

        case ast::ItemKind::kGlobalFlags: {
            const auto lang = toolchain::parse_language(item.name);
            if (!lang) {
                error(diag::Code::D_INVALID_DECLARATION, item.span, "unknown language '" + item.name + "'");
                return false;
            }
            if (!item.expr) return false;
            auto v = eval(*item.expr);
            if (!v) return false;
            std::vector<std::string> flags{};
            if (!to_strings(*v, item.span, "global_flags", flags)) return false;
            return ctx_.declare_global_flags(flags, *lang, item.span);
        }

        case ast::ItemKind::kExecutable:
        case ast::ItemKind::kLibrary:
        case ast::ItemKind::kCommand:
            return eval_target(item);

        case ast::ItemKind::kAlias: {
            if (!item.expr) return false;
            auto v = eval(*item.expr);
            if (!v) return false;
            std::vector<TargetHandle> members{};
            if (!to_targets(*v, item.span, "alias '" + item.name + "'", members)) return false;
            return ctx_.declare_alias(item.name, members, item.span).has_value();
        }

        case ast::ItemKind::kDefault:
        case ast::ItemKind::kInstall: {
            const bool is_default = item.kind == ast::ItemKind::kDefault;
            if (!item.expr) return false;
            auto v = eval(*item.expr);
            if (!v) return false;
            std::vector<TargetHandle> targets{};
            if (!to_targets(*v, item.span, is_default ? "default" : "install", targets)) return false;
            return is_default ? ctx_.set_default(targets, item.span) : ctx_.install(targets, item.span);
        }
    }
    return false;
}

bool Evaluator::eval_target(const ast::Item& item) {
    const auto& allowed = allowed_fields(item.kind);
    std::map<std::string, Value> fields{};
    field_sites_.clear();

    for (const auto& f : item.fields) {
        if (!allowed.contains(f.name)) {
            error(diag::Code::D_INVALID_DECLARATION,
                  f.span,
                  "unknown field '" + f.name + "' in " + std::string(item_word(item.kind)) + " '" + item.name + "'");
            return false;
        }
        if (fields.contains(f.name)) {
            error(diag::Code::D_INVALID_DECLARATION, f.span, "field '" + f.name + "' is set twice");
            return false;
        }
        if (!f.value) return false;
        auto v = eval(*f.value);
        if (!v) return false;
        fields[f.name] = std::move(*v);
        field_sites_[f.name] = f.span;
    }

    switch (item.kind) {
        case ast::ItemKind::kExecutable: return eval_executable(item, fields);
        case ast::ItemKind::kLibrary: return eval_library(item, fields);
        case ast::ItemKind::kCommand: return eval_command(item, fields);
        default: return false;
    }
}

bool Evaluator::eval_executable(const ast::Item& item, const std::map<std::string, Value>& fields) {
    ExecutableDecl d{};
    d.name = item.name;
    d.site = item.span;

    for (const auto& [name, v] : fields) {
        const auto& sp = field_sites_[name];
        bool ok = true;
        if (name == "sources") ok = to_refs(v, sp, "sources", d.sources);
        else if (name == "flags") ok = to_strings(v, sp, "flags", d.flags);
        else if (name == "link") ok = to_refs(v, sp, "link", d.links);
        else if (name == "deps") ok = to_targets(v, sp, "deps", d.deps);
        else if (name == "includes") ok = to_strings(v, sp, "includes", d.includes);
        else if (name == "lang") ok = to_language(v, sp, d.language);
        if (!ok) return false;
    }
    return ctx_.declare_executable(d).has_value();
}

bool Evaluator::eval_library(const ast::Item& item, const std::map<std::string, Value>& fields) {
    LibraryDecl d{};
    d.name = item.name;
    d.site = item.span;

    for (const auto& [name, v] : fields) {
        const auto& sp = field_sites_[name];
        bool ok = true;
        if (name == "kind") {
            std::string kind{};
            ok = to_string(v, sp, "kind", kind);
            if (ok && kind == "static") {
                d.kind = LibraryKind::kStatic;
            } else if (ok && kind == "shared") {
                d.kind = LibraryKind::kShared;
            } else if (ok) {
                error(diag::Code::D_INVALID_DECLARATION, sp, "library kind must be \"static\" or \"shared\", got \"" + kind + "\"");
                ok = false;
            }
        }
        else if (name == "sources") ok = to_refs(v, sp, "sources", d.sources);
        else if (name == "flags") ok = to_strings(v, sp, "flags", d.flags);
        else if (name == "link") ok = to_refs(v, sp, "link", d.links);
        else if (name == "deps") ok = to_targets(v, sp, "deps", d.deps);
        else if (name == "includes") ok = to_strings(v, sp, "includes", d.includes);
        else if (name == "lang") ok = to_language(v, sp, d.language);
        if (!ok) return false;
    }
    return ctx_.declare_library(d).has_value();
}

bool Evaluator::eval_command(const ast::Item& item, const std::map<std::string, Value>& fields) {
    CommandDecl d{};
    d.name = item.name;
    d.site = item.span;

    for (const auto& [name, v] : fields) {
        const auto& sp = field_sites_[name];
        bool ok = true;
        if (name == "inputs") ok = to_refs(v, sp, "inputs", d.inputs);
        else if (name == "outputs") ok = to_strings(v, sp, "outputs", d.outputs);
        else if (name == "run") ok = to_refs(v, sp, "run", d.command);
        else if (name == "order_only") ok = to_targets(v, sp, "order_only", d.order_only);
        if (!ok) return false;
    }
    return ctx_.declare_custom_command(d).has_value();
}

std::optional<Value> Evaluator::eval(const ast::Expr& e) {
    switch (e.kind) {
        case ast::ExprKind::kString:
            return Value::make_string(e.text);
        case ast::ExprKind::kBool:
            return Value::make_bool(e.bool_value);
        case ast::ExprKind::kInt:
            return Value::make_int(e.int_value);

        case ast::ExprKind::kIdent: {
            if (const auto it = lets_.find(e.text); it != lets_.end()) return it->second;
            if (const auto h = ctx_.find(e.text)) return Value::make_target(*h);
            error(diag::Code::D_UNDECLARED_TARGET,
                  e.span,
                  "'" + e.text + "' is not a declared target or binding");
            return std::nullopt;
        }

        case ast::ExprKind::kList: {
            std::vector<Value> items{};
            items.reserve(e.items.size());
            for (const auto& it : e.items) {
                if (!it) return std::nullopt;
                auto v = eval(*it);
                if (!v) return std::nullopt;
                items.push_back(std::move(*v));
            }
            return Value::make_list(std::move(items));
        }

        case ast::ExprKind::kOptionRef: {
            const auto* ov = ctx_.reference_option(e.text, e.span);
            if (ov == nullptr) return std::nullopt;
            if (const auto* s = std::get_if<std::string>(ov)) return Value::make_string(*s);
            if (const auto* b = std::get_if<bool>(ov)) return Value::make_bool(*b);
            std::vector<Value> items{};
            for (const auto& s : std::get<std::vector<std::string>>(*ov)) items.push_back(Value::make_string(s));
            return Value::make_list(std::move(items));
        }

        case ast::ExprKind::kConcat: {
            if (!e.lhs || !e.rhs) return std::nullopt;
            auto l = eval(*e.lhs);
            if (!l) return std::nullopt;
            auto r = eval(*e.rhs);
            if (!r) return std::nullopt;
            return concat(*l, *r, e.span);
        }
    }
    return std::nullopt;
}

std::optional<Value> Evaluator::concat(const Value& lhs, const Value& rhs, const ast::Span& sp) {
    using K = Value::Kind;
    if (lhs.kind == K::kString && rhs.kind == K::kString) {
        return Value::make_string(lhs.str + rhs.str);
    }
    if (lhs.kind == K::kList && rhs.kind == K::kList) {
        auto out = lhs.items;
        out.insert(out.end(), rhs.items.begin(), rhs.items.end());
        return Value::make_list(std::move(out));
    }
    if (lhs.kind == K::kList && (rhs.kind == K::kString || rhs.kind == K::kTarget)) {
        auto out = lhs.items;
        out.push_back(rhs);
        return Value::make_list(std::move(out));
    }
    if ((lhs.kind == K::kString || lhs.kind == K::kTarget) && rhs.kind == K::kList) {
        std::vector<Value> out{lhs};
        out.insert(out.end(), rhs.items.begin(), rhs.items.end());
        return Value::make_list(std::move(out));
    }
    error(diag::Code::D_INVALID_DECLARATION,
          sp,
          "cannot apply '+' to " + std::string(value_kind_name(lhs.kind)) + " and " +
              std::string(value_kind_name(rhs.kind)));
    return std::nullopt;
}

bool Evaluator::to_string(const Value& v, const ast::Span& sp, std::string_view what, std::string& out) {
    if (v.kind != Value::Kind::kString) {
        error(diag::Code::D_INVALID_DECLARATION,
              sp,
              std::string(what) + " must be a string, got " + std::string(value_kind_name(v.kind)));
        return false;
    }
    out = v.str;
    return true;
}

bool Evaluator::to_strings(const Value& v, const ast::Span& sp, std::string_view what, std::vector<std::string>& out) {
    out.clear();
    if (v.kind == Value::Kind::kString) {
        out.push_back(v.str);
        return true;
    }
    if (v.kind != Value::Kind::kList) {
        error(diag::Code::D_INVALID_DECLARATION,
              sp,
              std::string(what) + " must be a list of strings, got " + std::string(value_kind_name(v.kind)));
        return false;
    }
    for (const auto& it : v.items) {
        if (it.kind != Value::Kind::kString) {
            error(diag::Code::D_INVALID_DECLARATION,
                  sp,
                  std::string(what) + " must contain only strings, got " + std::string(value_kind_name(it.kind)));
            return false;
        }
        out.push_back(it.str);
    }
    return true;
}

bool Evaluator::to_refs(const Value& v, const ast::Span& sp, std::string_view what, std::vector<Ref>& out) {
    out.clear();
    auto push = [&](const Value& it) -> bool {
        if (it.kind == Value::Kind::kString) {
            out.push_back(Ref::str(it.str));
            return true;
        }
        if (it.kind == Value::Kind::kTarget) {
            out.push_back(Ref::of(it.target));
            return true;
        }
        error(diag::Code::D_INVALID_DECLARATION,
              sp,
              std::string(what) + " must contain strings or targets, got " + std::string(value_kind_name(it.kind)));
        return false;
    };
    if (v.kind != Value::Kind::kList) return push(v);
    for (const auto& it : v.items) {
        if (!push(it)) return false;
    }
    return true;
}

bool Evaluator::to_targets(const Value& v, const ast::Span& sp, std::string_view what, std::vector<TargetHandle>& out) {
    out.clear();
    auto push = [&](const Value& it) -> bool {
        if (it.kind == Value::Kind::kTarget) {
            out.push_back(it.target);
            return true;
        }
        if (it.kind == Value::Kind::kString) {
            // a quoted name still has to be declared already
            if (const auto h = ctx_.find(it.str)) {
                out.push_back(*h);
                return true;
            }
            error(diag::Code::D_UNDECLARED_TARGET, sp, std::string(what) + " refers to undeclared target '" + it.str + "'");
            return false;
        }
        error(diag::Code::D_INVALID_DECLARATION,
              sp,
              std::string(what) + " must contain targets, got " + std::string(value_kind_name(it.kind)));
        return false;
    };
    if (v.kind != Value::Kind::kList) return push(v);
    for (const auto& it : v.items) {
        if (!push(it)) return false;
    }
    return true;
}

bool Evaluator::to_language(const Value& v, const ast::Span& sp, std::optional<toolchain::Language>& out) {
    std::string s{};
    if (!to_string(v, sp, "lang", s)) return false;
    out = toolchain::parse_language(s);
    if (!out) {
        error(diag::Code::D_INVALID_DECLARATION, sp, "unknown language '" + s + "'");
        return false;
    }
    return true;
}

} // namespace kiln::desc
