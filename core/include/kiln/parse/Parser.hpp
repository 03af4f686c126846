#pragma once

#include <kiln/ast/Nodes.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/syntax/TokenKind.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::parse {

std::vector<syntax::Token> lex(std::string_view source, std::string_view file_path, diag::Bag& diags);

class Parser {
public:
    Parser(std::vector<syntax::Token> tokens,
           std::string file_path,
           diag::Bag& diags)
        : tokens_(std::move(tokens)),
          file_path_(std::move(file_path)),
          diags_(diags) {}

    ast::Program parse_program();

private:
    using K = syntax::TokenKind;

    const syntax::Token& peek(std::size_t k = 0) const;
    bool at(K k) const;
    const syntax::Token& bump();
    bool eat(K k);
    bool expect(K k, std::string_view what);

    ast::Item parse_item();
    ast::Item parse_project();
    ast::Item parse_option();
    ast::Item parse_let();
    ast::Item parse_global_flags();
    ast::Item parse_target(ast::ItemKind kind);
    ast::Item parse_alias();
    ast::Item parse_name_list_stmt(ast::ItemKind kind);

    bool parse_option_type(ast::OptionDecl& decl);
    void parse_option_body(ast::OptionDecl& decl);
    std::vector<ast::Field> parse_field_block(std::string_view where);
    static bool starts_item(K k);
    void skip_to_item_end();

    std::unique_ptr<ast::Expr> parse_expr();
    std::unique_ptr<ast::Expr> parse_primary();
    std::unique_ptr<ast::Expr> parse_list_lit();

    ast::Span span_from(const syntax::Token& t) const;
    void diag_expected(const syntax::Token& t, std::string_view what);

    std::vector<syntax::Token> tokens_;
    std::string file_path_;
    diag::Bag& diags_;
    std::size_t pos_ = 0;
};

ast::Program parse_source(std::string_view source,
                          std::string_view file_path,
                          diag::Bag& diags);

} // namespace kiln::parse
