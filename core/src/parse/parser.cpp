#include <kiln/parse/Parser.hpp>

#include <cstdlib>

namespace kiln::parse {

namespace {

std::unique_ptr<ast::Expr> make_expr(ast::ExprKind k, const ast::Span& sp) {
    auto e = std::make_unique<ast::Expr>();
    e->kind = k;
    e->span = sp;
    return e;
}

} // namespace

const syntax::Token& Parser::peek(std::size_t k) const {
    const std::size_t i = pos_ + k;
    if (i >= tokens_.size()) return tokens_.back();
    return tokens_[i];
}

bool Parser::at(K k) const { return peek().kind == k; }

const syntax::Token& Parser::bump() {
    if (pos_ >= tokens_.size()) return tokens_.back();
    return tokens_[pos_++];
}

bool Parser::eat(K k) {
    if (!at(k)) return false;
    bump();
    return true;
}

bool Parser::expect(K k, std::string_view what) {
    if (eat(k)) return true;
    diag_expected(peek(), what);
    return false;
}

ast::Span Parser::span_from(const syntax::Token& t) const {
    return ast::Span{file_path_, t.loc.line, t.loc.column};
}

void Parser::diag_expected(const syntax::Token& t, std::string_view what) {
    const auto code = t.kind == K::kEof ? diag::Code::C_UNEXPECTED_EOF : diag::Code::C_UNEXPECTED_TOKEN;
    diags_.add(code,
               file_path_,
               t.loc.line,
               t.loc.column,
               "expected " + std::string(what) + ", found " + syntax::describe(t));
}

bool Parser::starts_item(K k) {
    switch (k) {
        case K::kKwProject:
        case K::kKwOption:
        case K::kKwLet:
        case K::kKwGlobalFlags:
        case K::kKwExecutable:
        case K::kKwLibrary:
        case K::kKwCommand:
        case K::kKwAlias:
        case K::kKwDefault:
        case K::kKwInstall:
            return true;
        default:
            return false;
    }
}

void Parser::skip_to_item_end() {
    int depth = 0;
    while (!at(K::kEof)) {
        const auto k = bump().kind;
        if (k == K::kLBrace) ++depth;
        if (k == K::kRBrace && --depth <= 0) {
            eat(K::kSemicolon);
            return;
        }
        if (k == K::kSemicolon && depth == 0) return;
    }
}

ast::Program Parser::parse_program() {
    ast::Program p{};
    while (!at(K::kEof)) {
        if (eat(K::kSemicolon)) continue;
        const std::size_t errors_before = diags_.all().size();
        auto item = parse_item();
        if (diags_.all().size() != errors_before) {
            // the failed item may already have consumed its own ';'
            const bool at_item_start = pos_ > 0 && tokens_[pos_ - 1].kind == K::kSemicolon &&
                                       (at(K::kEof) || starts_item(peek().kind));
            if (!at_item_start) skip_to_item_end();
            continue;
        }
        p.items.push_back(std::move(item));
    }
    return p;
}

ast::Item Parser::parse_item() {
    switch (peek().kind) {
        case K::kKwProject: return parse_project();
        case K::kKwOption: return parse_option();
        case K::kKwLet: return parse_let();
        case K::kKwGlobalFlags: return parse_global_flags();
        case K::kKwExecutable: return parse_target(ast::ItemKind::kExecutable);
        case K::kKwLibrary: return parse_target(ast::ItemKind::kLibrary);
        case K::kKwCommand: return parse_target(ast::ItemKind::kCommand);
        case K::kKwAlias: return parse_alias();
        case K::kKwDefault: return parse_name_list_stmt(ast::ItemKind::kDefault);
        case K::kKwInstall: return parse_name_list_stmt(ast::ItemKind::kInstall);
        default: break;
    }

    const auto& t = peek();
    diags_.add(diag::Code::C_UNEXPECTED_TOKEN,
               file_path_,
               t.loc.line,
               t.loc.column,
               "expected a declaration, found " + syntax::describe(t));
    return ast::Item{};
}

ast::Item Parser::parse_project() {
    const auto start = bump(); // project
    ast::Item it{};
    it.kind = ast::ItemKind::kProject;
    it.span = span_from(start);

    if (at(K::kStringLit)) {
        it.name = bump().lexeme;
    } else {
        diag_expected(peek(), "project name string");
        return it;
    }

    if (at(K::kIdent) && peek().lexeme == "version") {
        bump();
        if (at(K::kStringLit)) {
            it.version = bump().lexeme;
        } else {
            diag_expected(peek(), "version string");
            return it;
        }
    }
    expect(K::kSemicolon, "';'");
    return it;
}

bool Parser::parse_option_type(ast::OptionDecl& decl) {
    if (eat(K::kKwString)) {
        decl.type = ast::OptionType::kString;
        return true;
    }
    if (eat(K::kKwBool)) {
        decl.type = ast::OptionType::kBool;
        return true;
    }
    if (eat(K::kKwList)) {
        decl.type = ast::OptionType::kList;
        return true;
    }
    if (eat(K::kKwEnum)) {
        decl.type = ast::OptionType::kEnum;
        if (!expect(K::kLBracket, "'[' after enum")) return false;
        while (!at(K::kRBracket) && !at(K::kEof)) {
            if (!at(K::kStringLit)) {
                diag_expected(peek(), "enum choice string");
                return false;
            }
            decl.choices.push_back(bump().lexeme);
            if (!eat(K::kComma)) break;
        }
        if (!expect(K::kRBracket, "']'")) return false;
        if (decl.choices.empty()) {
            diag_expected(peek(), "at least one enum choice");
            return false;
        }
        return true;
    }
    diag_expected(peek(), "option type (string, bool, enum, list)");
    return false;
}

void Parser::parse_option_body(ast::OptionDecl& decl) {
    while (!at(K::kRBrace) && !at(K::kEof)) {
        if (at(K::kKwValidate)) {
            const auto vt = bump();
            ast::ValidatorNode v{};
            v.span = span_from(vt);
            if (!at(K::kIdent)) {
                diag_expected(peek(), "validator name");
                return;
            }
            v.rule = bump().lexeme;
            if (!at(K::kSemicolon)) {
                v.arg = parse_expr();
            }
            decl.validators.push_back(std::move(v));
            if (!expect(K::kSemicolon, "';' after validator")) return;
            continue;
        }

        if (!at(K::kIdent)) {
            diag_expected(peek(), "option field name");
            return;
        }
        const auto ft = bump();
        ast::Field f{};
        f.name = ft.lexeme;
        f.span = span_from(ft);
        if (!expect(K::kAssign, "'='")) return;
        f.value = parse_expr();
        decl.fields.push_back(std::move(f));
        if (!expect(K::kSemicolon, "';'")) return;
    }
}

ast::Item Parser::parse_option() {
    const auto start = bump(); // option
    ast::Item it{};
    it.kind = ast::ItemKind::kOption;
    it.span = span_from(start);

    if (!at(K::kIdent)) {
        diag_expected(peek(), "option name");
        return it;
    }
    it.option.name = bump().lexeme;
    it.name = it.option.name;

    if (!expect(K::kColon, "':' before option type")) return it;
    if (!parse_option_type(it.option)) return it;

    if (eat(K::kAssign)) {
        it.option.default_value = parse_expr();
    }

    if (eat(K::kLBrace)) {
        parse_option_body(it.option);
        expect(K::kRBrace, "'}'");
        eat(K::kSemicolon);
        return it;
    }
    expect(K::kSemicolon, "';'");
    return it;
}

ast::Item Parser::parse_let() {
    const auto start = bump(); // let
    ast::Item it{};
    it.kind = ast::ItemKind::kLet;
    it.span = span_from(start);

    if (!at(K::kIdent)) {
        diag_expected(peek(), "binding name");
        return it;
    }
    it.name = bump().lexeme;
    if (!expect(K::kAssign, "'='")) return it;
    it.expr = parse_expr();
    expect(K::kSemicolon, "';'");
    return it;
}

ast::Item Parser::parse_global_flags() {
    const auto start = bump(); // global_flags
    ast::Item it{};
    it.kind = ast::ItemKind::kGlobalFlags;
    it.span = span_from(start);

    if (!at(K::kStringLit)) {
        diag_expected(peek(), "language string");
        return it;
    }
    it.name = bump().lexeme;
    it.expr = parse_expr();
    expect(K::kSemicolon, "';'");
    return it;
}

std::vector<ast::Field> Parser::parse_field_block(std::string_view where) {
    std::vector<ast::Field> fields{};
    if (!expect(K::kLBrace, "'{' in " + std::string(where))) return fields;

    while (!at(K::kRBrace) && !at(K::kEof)) {
        if (!at(K::kIdent)) {
            diag_expected(peek(), std::string(where) + " field name");
            return fields;
        }
        const auto ft = bump();
        ast::Field f{};
        f.name = ft.lexeme;
        f.span = span_from(ft);
        if (!expect(K::kAssign, "'='")) return fields;
        f.value = parse_expr();
        fields.push_back(std::move(f));
        if (!expect(K::kSemicolon, "';'")) return fields;
    }
    expect(K::kRBrace, "'}'");
    eat(K::kSemicolon);
    return fields;
}

ast::Item Parser::parse_target(ast::ItemKind kind) {
    const auto start = bump(); // executable | library | command
    ast::Item it{};
    it.kind = kind;
    it.span = span_from(start);

    if (!at(K::kIdent)) {
        diag_expected(peek(), "target name");
        return it;
    }
    it.name = bump().lexeme;
    it.fields = parse_field_block(start.lexeme);
    return it;
}

ast::Item Parser::parse_alias() {
    const auto start = bump(); // alias
    ast::Item it{};
    it.kind = ast::ItemKind::kAlias;
    it.span = span_from(start);

    if (!at(K::kIdent)) {
        diag_expected(peek(), "alias name");
        return it;
    }
    it.name = bump().lexeme;
    if (!expect(K::kAssign, "'='")) return it;
    it.expr = parse_expr();
    expect(K::kSemicolon, "';'");
    return it;
}

ast::Item Parser::parse_name_list_stmt(ast::ItemKind kind) {
    const auto start = bump(); // default | install
    ast::Item it{};
    it.kind = kind;
    it.span = span_from(start);
    it.expr = parse_expr();
    expect(K::kSemicolon, "';'");
    return it;
}

std::unique_ptr<ast::Expr> Parser::parse_expr() {
    auto lhs = parse_primary();
    while (at(K::kPlus)) {
        const auto op = bump();
        auto e = make_expr(ast::ExprKind::kConcat, span_from(op));
        e->lhs = std::move(lhs);
        e->rhs = parse_primary();
        lhs = std::move(e);
    }
    return lhs;
}

std::unique_ptr<ast::Expr> Parser::parse_list_lit() {
    const auto start = bump(); // [
    auto e = make_expr(ast::ExprKind::kList, span_from(start));
    while (!at(K::kRBracket) && !at(K::kEof)) {
        e->items.push_back(parse_expr());
        if (!eat(K::kComma)) break;
    }
    expect(K::kRBracket, "']'");
    return e;
}

std::unique_ptr<ast::Expr> Parser::parse_primary() {
    const auto& t = peek();
    const auto sp = span_from(t);

    switch (t.kind) {
        case K::kStringLit: {
            auto e = make_expr(ast::ExprKind::kString, sp);
            e->text = bump().lexeme;
            return e;
        }
        case K::kIntLit: {
            auto e = make_expr(ast::ExprKind::kInt, sp);
            e->text = bump().lexeme;
            e->int_value = std::strtoll(e->text.c_str(), nullptr, 10);
            return e;
        }
        case K::kKwTrue:
        case K::kKwFalse: {
            auto e = make_expr(ast::ExprKind::kBool, sp);
            e->bool_value = bump().kind == K::kKwTrue;
            return e;
        }
        case K::kIdent: {
            auto e = make_expr(ast::ExprKind::kIdent, sp);
            e->text = bump().lexeme;
            return e;
        }
        case K::kLBracket:
            return parse_list_lit();
        case K::kLParen: {
            bump();
            auto inner = parse_expr();
            expect(K::kRParen, "')'");
            return inner;
        }
        case K::kKwOption: {
            bump();
            auto e = make_expr(ast::ExprKind::kOptionRef, sp);
            expect(K::kLParen, "'(' after option");
            if (at(K::kStringLit)) {
                e->text = bump().lexeme;
            } else {
                diag_expected(peek(), "option name string");
            }
            expect(K::kRParen, "')'");
            return e;
        }
        default:
            break;
    }

    diag_expected(t, "expression");
    if (!at(K::kSemicolon) && !at(K::kRBrace) && !at(K::kRBracket) && !at(K::kRParen) && !at(K::kEof)) bump();
    return make_expr(ast::ExprKind::kString, sp);
}

ast::Program parse_source(std::string_view source,
                          std::string_view file_path,
                          diag::Bag& diags) {
    auto toks = lex(source, file_path, diags);
    Parser p(std::move(toks), std::string(file_path), diags);
    return p.parse_program();
}

} // namespace kiln::parse
