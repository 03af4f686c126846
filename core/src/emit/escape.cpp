#include <kiln/emit/Escape.hpp>

namespace kiln::emit {

namespace {

bool is_shell_safe(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_' || c == '@' || c == '%' || c == '+' || c == ':' ||
           c == ',' || c == '.' || c == '/' || c == '-';
}

std::string make_escaped(std::string_view s, bool rule_line) {
    std::string out{};
    for (char c : s) {
        if (c == '$') {
            out += "$$";
            continue;
        }
        if (c == ' ' || c == ':' || c == '#' || (rule_line && c == '%')) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string shell_quote(std::string_view s) {
    if (s.empty()) return "''";

    bool safe = true;
    for (char c : s) {
        if (!is_shell_safe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return std::string(s);

    std::string out{"'"};
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& argv) {
    std::string out{};
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += " ";
        out += shell_quote(argv[i]);
    }
    return out;
}

std::string double_dollar(std::string_view s) {
    std::string out{};
    out.reserve(s.size());
    for (char c : s) {
        if (c == '$') out.push_back('$');
        out.push_back(c);
    }
    return out;
}

bool has_newline(std::string_view s) {
    return s.find('\n') != std::string_view::npos || s.find('\r') != std::string_view::npos;
}

std::string ninja_path(std::string_view s) {
    std::string out{};
    for (char c : s) {
        if (c == '$' || c == ':' || c == ' ') out.push_back('$');
        out.push_back(c);
    }
    return out;
}

std::string make_target(std::string_view s) {
    return make_escaped(s, true);
}

std::string make_include_path(std::string_view s) {
    return make_escaped(s, false);
}

} // namespace kiln::emit
