#include <kiln/opt/OptionSchema.hpp>

#include <kiln/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace kiln::opt {

namespace {

constexpr std::string_view k_project_site = "kiln.toml";
constexpr std::string_view k_cli_site = "<command-line>";

void add_invalid(diag::Bag& diags, std::string_view file, const ast::Span* sp, std::string msg) {
    diags.add(diag::Code::O_INVALID_OPTION,
              sp ? sp->file : std::string(file),
              sp ? sp->line : 1,
              sp ? sp->column : 1,
              std::move(msg));
}

bool valid_option_name(std::string_view name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name.front())) && name.front() != '_') return false;
    for (const char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

bool compile_pattern(const std::string& pattern, std::regex& out, std::string& err) {
    try {
        out = std::regex(pattern, std::regex::ECMAScript);
        return true;
    } catch (const std::regex_error& e) {
        err = std::string("invalid regular expression \"") + pattern + "\": " + e.what();
        return false;
    }
}

// Returns an empty string when `v` passes every validator of `def`.
std::string check_validators(const OptionDef& def, const OptionValue& v) {
    for (const auto& val : def.validators) {
        switch (val.kind) {
            case ValidatorKind::kNonEmpty: {
                if (const auto* s = std::get_if<std::string>(&v); s && s->empty()) {
                    return "value must not be empty";
                }
                if (const auto* l = std::get_if<std::vector<std::string>>(&v); l && l->empty()) {
                    return "list must not be empty";
                }
                break;
            }
            case ValidatorKind::kMatches: {
                std::regex re;
                std::string err{};
                if (!compile_pattern(val.pattern, re, err)) return err;
                if (const auto* s = std::get_if<std::string>(&v)) {
                    if (!std::regex_match(*s, re)) {
                        return "value \"" + *s + "\" does not match \"" + val.pattern + "\"";
                    }
                }
                if (const auto* l = std::get_if<std::vector<std::string>>(&v)) {
                    for (const auto& item : *l) {
                        if (!std::regex_match(item, re)) {
                            return "list item \"" + item + "\" does not match \"" + val.pattern + "\"";
                        }
                    }
                }
                break;
            }
            case ValidatorKind::kMinItems: {
                if (const auto* l = std::get_if<std::vector<std::string>>(&v)) {
                    if (static_cast<int64_t>(l->size()) < val.min_items) {
                        return "list needs at least " + std::to_string(val.min_items) + " item(s), got " +
                               std::to_string(l->size());
                    }
                }
                break;
            }
        }
    }
    return {};
}

bool check_choice(const OptionDef& def, const std::string& s, std::string& err) {
    if (std::find(def.choices.begin(), def.choices.end(), s) != def.choices.end()) return true;
    std::string choices{};
    for (const auto& c : def.choices) {
        if (!choices.empty()) choices += ", ";
        choices += c;
    }
    err = "\"" + s + "\" is not one of [" + choices + "]";
    return false;
}

std::optional<OptionValue> default_from_expr(const OptionDef& def, const ast::Expr& e, std::string& err) {
    switch (def.type) {
        case OptionType::kString:
            if (e.kind == ast::ExprKind::kString) return OptionValue{e.text};
            err = "default must be a string literal";
            return std::nullopt;
        case OptionType::kBool:
            if (e.kind == ast::ExprKind::kBool) return OptionValue{e.bool_value};
            err = "default must be true or false";
            return std::nullopt;
        case OptionType::kEnum:
            if (e.kind != ast::ExprKind::kString) {
                err = "default must be a string literal";
                return std::nullopt;
            }
            if (!check_choice(def, e.text, err)) return std::nullopt;
            return OptionValue{e.text};
        case OptionType::kList: {
            if (e.kind != ast::ExprKind::kList) {
                err = "default must be a list of strings";
                return std::nullopt;
            }
            std::vector<std::string> items{};
            for (const auto& it : e.items) {
                if (!it || it->kind != ast::ExprKind::kString) {
                    err = "default must be a list of strings";
                    return std::nullopt;
                }
                items.push_back(it->text);
            }
            return OptionValue{std::move(items)};
        }
    }
    err = "unsupported option type";
    return std::nullopt;
}

OptionValue zero_value(const OptionDef& def) {
    switch (def.type) {
        case OptionType::kString: return OptionValue{std::string{}};
        case OptionType::kBool: return OptionValue{false};
        case OptionType::kEnum: return OptionValue{def.choices.empty() ? std::string{} : def.choices.front()};
        case OptionType::kList: return OptionValue{std::vector<std::string>{}};
    }
    return OptionValue{std::string{}};
}

bool convert_validator(const OptionDef& def, const ast::ValidatorNode& node, Validator& out, diag::Bag& diags) {
    if (node.rule == "nonempty") {
        if (node.arg) {
            add_invalid(diags, "", &node.span, "validator 'nonempty' takes no argument");
            return false;
        }
        if (def.type == OptionType::kBool) {
            add_invalid(diags, "", &node.span, "validator 'nonempty' does not apply to bool option '" + def.name + "'");
            return false;
        }
        out.kind = ValidatorKind::kNonEmpty;
        return true;
    }
    if (node.rule == "matches") {
        if (!node.arg || node.arg->kind != ast::ExprKind::kString) {
            add_invalid(diags, "", &node.span, "validator 'matches' expects a pattern string");
            return false;
        }
        if (def.type == OptionType::kBool) {
            add_invalid(diags, "", &node.span, "validator 'matches' does not apply to bool option '" + def.name + "'");
            return false;
        }
        std::regex re;
        std::string err{};
        if (!compile_pattern(node.arg->text, re, err)) {
            add_invalid(diags, "", &node.span, err);
            return false;
        }
        out.kind = ValidatorKind::kMatches;
        out.pattern = node.arg->text;
        return true;
    }
    if (node.rule == "min_items") {
        if (!node.arg || node.arg->kind != ast::ExprKind::kInt) {
            add_invalid(diags, "", &node.span, "validator 'min_items' expects an integer");
            return false;
        }
        if (def.type != OptionType::kList) {
            add_invalid(diags, "", &node.span, "validator 'min_items' only applies to list options");
            return false;
        }
        out.kind = ValidatorKind::kMinItems;
        out.min_items = node.arg->int_value;
        return true;
    }
    add_invalid(diags, "", &node.span, "unknown validator '" + node.rule + "'");
    return false;
}

std::optional<OptionValue> from_project_value(const OptionDef& def, const config::Value& v, std::string& err) {
    switch (def.type) {
        case OptionType::kString:
            if (const auto* s = std::get_if<std::string>(&v)) return OptionValue{*s};
            break;
        case OptionType::kBool:
            if (const auto* b = std::get_if<bool>(&v)) return OptionValue{*b};
            break;
        case OptionType::kEnum:
            if (const auto* s = std::get_if<std::string>(&v)) {
                if (!check_choice(def, *s, err)) return std::nullopt;
                return OptionValue{*s};
            }
            break;
        case OptionType::kList:
            if (const auto* l = std::get_if<std::vector<std::string>>(&v)) return OptionValue{*l};
            break;
    }
    err = "expected " + std::string(type_name(def)) + " value, got " + config::render_value_toml(v);
    return std::nullopt;
}

std::optional<OptionValue> from_cli_text(const OptionDef& def, std::string_view raw, std::string& err) {
    const std::string text = trim(raw);
    const bool quoted = text.size() >= 2 && text.front() == '"' && text.back() == '"';

    switch (def.type) {
        case OptionType::kString: {
            if (quoted) {
                config::Value parsed{};
                if (!config::toml_lite::parse_value(text, parsed, err)) return std::nullopt;
                return OptionValue{std::get<std::string>(parsed)};
            }
            return OptionValue{text};
        }
        case OptionType::kBool: {
            std::string l = text;
            std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (l == "true" || l == "on" || l == "yes" || l == "1") return OptionValue{true};
            if (l == "false" || l == "off" || l == "no" || l == "0") return OptionValue{false};
            err = "expected bool value, got \"" + text + "\"";
            return std::nullopt;
        }
        case OptionType::kEnum: {
            std::string s = text;
            if (quoted) s = text.substr(1, text.size() - 2);
            if (!check_choice(def, s, err)) return std::nullopt;
            return OptionValue{s};
        }
        case OptionType::kList: {
            if (!text.empty() && text.front() == '[') {
                config::Value parsed{};
                if (!config::toml_lite::parse_value(text, parsed, err)) return std::nullopt;
                if (const auto* l = std::get_if<std::vector<std::string>>(&parsed)) return OptionValue{*l};
                err = "expected list of strings, got " + text;
                return std::nullopt;
            }
            std::vector<std::string> items{};
            std::string cur{};
            for (const char c : text) {
                if (c == ',') {
                    items.push_back(trim(cur));
                    cur.clear();
                    continue;
                }
                cur.push_back(c);
            }
            if (!text.empty()) items.push_back(trim(cur));
            return OptionValue{std::move(items)};
        }
    }
    err = "unsupported option type";
    return std::nullopt;
}

} // namespace

bool Schema::declare(OptionDef def, diag::Bag& diags) {
    if (index_.contains(def.name)) {
        const auto& prev = defs_[index_[def.name]].site;
        add_invalid(diags,
                    "",
                    &def.site,
                    "option '" + def.name + "' is already declared at " + prev.file + ":" + std::to_string(prev.line));
        return false;
    }
    index_[def.name] = defs_.size();
    defs_.push_back(std::move(def));
    return true;
}

const OptionDef* Schema::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &defs_[it->second];
}

const OptionValue* ResolvedOptions::find(std::string_view name) const {
    const auto it = values_.find(std::string(name));
    if (it == values_.end()) return nullptr;
    return &it->second;
}

bool parse_cli_override(std::string_view arg, CliOverride& out, std::string& err) {
    const auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        err = "expected name=value, got '" + std::string(arg) + "'";
        return false;
    }
    out.name = trim(arg.substr(0, eq));
    out.text = std::string(arg.substr(eq + 1));
    if (!valid_option_name(out.name)) {
        err = "invalid option name '" + out.name + "'";
        return false;
    }
    return true;
}

bool load_schema(const ast::Program& program, Schema& out, diag::Bag& diags) {
    bool ok = true;
    for (const auto& item : program.items) {
        if (item.kind != ast::ItemKind::kOption) {
            diags.add(diag::Code::D_INVALID_DECLARATION,
                      item.span.file,
                      item.span.line,
                      item.span.column,
                      "only option declarations are allowed in an options file");
            ok = false;
            continue;
        }

        const auto& decl = item.option;
        OptionDef def{};
        def.name = decl.name;
        def.type = decl.type;
        def.choices = decl.choices;
        def.site = item.span;

        bool item_ok = true;
        for (const auto& f : decl.fields) {
            if (f.name == "help") {
                if (!f.value || f.value->kind != ast::ExprKind::kString) {
                    add_invalid(diags, "", &f.span, "option field 'help' must be a string");
                    item_ok = false;
                    continue;
                }
                def.help = f.value->text;
                continue;
            }
            diags.add(diag::Code::D_INVALID_DECLARATION,
                      f.span.file,
                      f.span.line,
                      f.span.column,
                      "unknown option field '" + f.name + "'");
            item_ok = false;
        }

        for (const auto& vn : decl.validators) {
            Validator v{};
            if (!convert_validator(def, vn, v, diags)) {
                item_ok = false;
                continue;
            }
            def.validators.push_back(std::move(v));
        }

        if (decl.default_value) {
            std::string err{};
            auto dv = default_from_expr(def, *decl.default_value, err);
            if (!dv) {
                add_invalid(diags, "", &decl.default_value->span, "option '" + def.name + "': " + err);
                item_ok = false;
            } else {
                def.default_value = std::move(*dv);
            }
        } else {
            def.default_value = zero_value(def);
        }

        if (item_ok) {
            const std::string verr = check_validators(def, def.default_value);
            if (!verr.empty()) {
                add_invalid(diags, "", &def.site, "default of option '" + def.name + "' fails validation: " + verr);
                item_ok = false;
            }
        }

        if (!item_ok) {
            ok = false;
            continue;
        }
        if (!out.declare(std::move(def), diags)) ok = false;
    }
    return ok;
}

std::optional<ResolvedOptions> resolve(const Schema& schema,
                                       const config::FlatMap& project_overrides,
                                       const std::vector<CliOverride>& cli_overrides,
                                       diag::Bag& diags) {
    ResolvedOptions out{};
    bool ok = true;

    for (const auto& def : schema.all()) {
        out.values_[def.name] = def.default_value;
    }

    for (const auto& [name, value] : project_overrides) {
        const auto* def = schema.find(name);
        if (def == nullptr) {
            add_invalid(diags, k_project_site, nullptr, "override names undeclared option '" + name + "'");
            ok = false;
            continue;
        }
        std::string err{};
        auto v = from_project_value(*def, value, err);
        if (!v) {
            add_invalid(diags, k_project_site, nullptr, "option '" + name + "': " + err);
            ok = false;
            continue;
        }
        out.values_[name] = std::move(*v);
    }

    for (const auto& ov : cli_overrides) {
        const auto* def = schema.find(ov.name);
        if (def == nullptr) {
            add_invalid(diags, k_cli_site, nullptr, "override names undeclared option '" + ov.name + "'");
            ok = false;
            continue;
        }
        std::string err{};
        auto v = from_cli_text(*def, ov.text, err);
        if (!v) {
            add_invalid(diags, k_cli_site, nullptr, "option '" + ov.name + "': " + err);
            ok = false;
            continue;
        }
        out.values_[ov.name] = std::move(*v);
    }

    if (!ok) return std::nullopt;

    for (const auto& def : schema.all()) {
        const std::string verr = check_validators(def, out.values_[def.name]);
        if (!verr.empty()) {
            add_invalid(diags, "", &def.site, "option '" + def.name + "': " + verr);
            ok = false;
        }
    }
    if (!ok) return std::nullopt;
    return out;
}

std::string_view type_name(const OptionDef& def) {
    switch (def.type) {
        case OptionType::kString: return "string";
        case OptionType::kBool: return "bool";
        case OptionType::kEnum: return "enum";
        case OptionType::kList: return "list";
    }
    return "unknown";
}

} // namespace kiln::opt
