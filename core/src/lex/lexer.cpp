#include <kiln/parse/Parser.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace kiln::parse {

namespace {

using K = syntax::TokenKind;

constexpr std::array<std::pair<std::string_view, K>, 17> k_keywords{{
    {"project", K::kKwProject},
    {"option", K::kKwOption},
    {"let", K::kKwLet},
    {"executable", K::kKwExecutable},
    {"library", K::kKwLibrary},
    {"command", K::kKwCommand},
    {"alias", K::kKwAlias},
    {"default", K::kKwDefault},
    {"install", K::kKwInstall},
    {"global_flags", K::kKwGlobalFlags},
    {"validate", K::kKwValidate},
    {"true", K::kKwTrue},
    {"false", K::kKwFalse},
    {"string", K::kKwString},
    {"bool", K::kKwBool},
    {"enum", K::kKwEnum},
    {"list", K::kKwList},
}};

K punctuator(char c) {
    switch (c) {
        case '(': return K::kLParen;
        case ')': return K::kRParen;
        case '{': return K::kLBrace;
        case '}': return K::kRBrace;
        case '[': return K::kLBracket;
        case ']': return K::kRBracket;
        case ',': return K::kComma;
        case ':': return K::kColon;
        case ';': return K::kSemicolon;
        case '=': return K::kAssign;
        case '+': return K::kPlus;
        default: return K::kError;
    }
}

bool word_char(char c, bool first) {
    const auto u = static_cast<unsigned char>(c);
    return c == '_' || (first ? std::isalpha(u) != 0 : std::isalnum(u) != 0);
}

class Scanner {
public:
    Scanner(std::string_view src, std::string_view file, diag::Bag& diags)
        : src_(src), file_(file), diags_(diags) {}

    std::vector<syntax::Token> run() {
        out_.reserve(src_.size() / 3 + 1);
        while (skip_trivia()) {
            const uint32_t line = line_;
            const uint32_t col = col_;
            const char c = cur();

            if (const K p = punctuator(c); p != K::kError) {
                step();
                emit(p, std::string(1, c), line, col);
            } else if (c == '"') {
                emit(K::kStringLit, string_body(line, col), line, col);
            } else if (std::isdigit(static_cast<unsigned char>(c))) {
                emit(K::kIntLit, take_while([](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }),
                     line, col);
            } else if (word_char(c, true)) {
                std::string word = take_while([](char ch) { return word_char(ch, false); });
                const K kind = keyword(word);
                emit(kind, std::move(word), line, col);
            } else {
                report(diag::Code::C_UNEXPECTED_TOKEN, line, col, "unknown character '" + std::string(1, c) + "'");
                step();
            }
        }
        out_.push_back(syntax::Token{K::kEof, "", {line_, col_}});
        return std::move(out_);
    }

private:
    static K keyword(std::string_view word) {
        for (const auto& [text, kind] : k_keywords) {
            if (text == word) return kind;
        }
        return K::kIdent;
    }

    bool done() const { return pos_ >= src_.size(); }
    char cur() const { return peek(0); }
    char peek(size_t off) const { return pos_ + off < src_.size() ? src_[pos_ + off] : '\0'; }

    void step() {
        if (done()) return;
        if (src_[pos_++] == '\n') {
            ++line_;
            col_ = 1;
        } else {
            ++col_;
        }
    }

    template <typename Pred>
    std::string take_while(Pred pred) {
        std::string text;
        while (!done() && pred(cur())) {
            text.push_back(cur());
            step();
        }
        return text;
    }

    void emit(K kind, std::string lexeme, uint32_t line, uint32_t col) {
        out_.push_back(syntax::Token{kind, std::move(lexeme), {line, col}});
    }

    void report(diag::Code code, uint32_t line, uint32_t col, std::string msg) {
        diags_.add(code, std::string(file_), line, col, std::move(msg));
    }

    // Skips whitespace and comments (`//`, `#`, `/* */`); false at end of input.
    bool skip_trivia() {
        while (!done()) {
            const char c = cur();
            if (std::isspace(static_cast<unsigned char>(c))) {
                step();
            } else if (c == '#' || (c == '/' && peek(1) == '/')) {
                while (!done() && cur() != '\n') step();
            } else if (c == '/' && peek(1) == '*') {
                const uint32_t line = line_;
                const uint32_t col = col_;
                step();
                step();
                while (!done() && !(cur() == '*' && peek(1) == '/')) step();
                if (done()) {
                    report(diag::Code::C_UNEXPECTED_EOF, line, col, "unterminated block comment");
                    return false;
                }
                step();
                step();
            } else {
                return true;
            }
        }
        return false;
    }

    std::string string_body(uint32_t line, uint32_t col) {
        step();
        std::string text;
        while (!done() && cur() != '\n') {
            const char c = cur();
            step();
            if (c == '"') return text;
            if (c != '\\') {
                text.push_back(c);
                continue;
            }
            if (done()) break;
            const char esc = cur();
            switch (esc) {
                case 'n': text.push_back('\n'); break;
                case 't': text.push_back('\t'); break;
                case '"':
                case '\\': text.push_back(esc); break;
                default:
                    report(diag::Code::C_INVALID_LITERAL, line_, col_,
                           std::string("unknown escape sequence '\\") + esc + "'");
                    text.push_back(esc);
                    break;
            }
            step();
        }
        report(diag::Code::C_INVALID_LITERAL, line, col, "unterminated string literal");
        return text;
    }

    std::string_view src_;
    std::string_view file_;
    diag::Bag& diags_;
    std::vector<syntax::Token> out_{};
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
};

} // namespace

std::vector<syntax::Token> lex(std::string_view source, std::string_view file_path, diag::Bag& diags) {
    return Scanner(source, file_path, diags).run();
}

} // namespace kiln::parse
