#include <kiln/config/TomlLite.hpp>

#include <kiln/os/File.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kiln::config::toml_lite {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (is_blank(s.front()) || s.front() == '\n')) s.remove_prefix(1);
    while (!s.empty() && (is_blank(s.back()) || s.back() == '\n')) s.remove_suffix(1);
    return s;
}

bool valid_key(std::string_view key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    });
}

bool to_int(std::string_view word, int64_t& out) {
    if (!word.empty() && word.front() == '+') word.remove_prefix(1);
    if (word.empty()) return false;
    const auto [end, ec] = std::from_chars(word.data(), word.data() + word.size(), out);
    return ec == std::errc{} && end == word.data() + word.size();
}

// Reads one TOML value from a cursor; trailing blanks and a `#` comment are
// allowed after it.
class ValueReader {
public:
    explicit ValueReader(std::string_view text) : text_(text) {}

    bool read_all(Value& out, std::string& err) {
        skip_blank();
        if (!read_value(out, err)) return false;
        skip_blank();
        if (!done() && cur() != '#') {
            err = "unexpected text after value";
            return false;
        }
        return true;
    }

private:
    bool done() const { return pos_ >= text_.size(); }
    char cur() const { return text_[pos_]; }

    void skip_blank() {
        while (!done() && is_blank(cur())) ++pos_;
    }

    std::string_view read_word() {
        const size_t start = pos_;
        while (!done() && !is_blank(cur()) && cur() != ',' && cur() != ']' && cur() != '#') ++pos_;
        return text_.substr(start, pos_ - start);
    }

    bool read_value(Value& out, std::string& err) {
        if (done() || cur() == '#') {
            err = "empty value";
            return false;
        }
        if (cur() == '"') {
            std::string s{};
            if (!read_string(s, err)) return false;
            out = std::move(s);
            return true;
        }
        if (cur() == '[') return read_array(out, err);

        const auto word = read_word();
        int64_t iv = 0;
        if (word == "true" || word == "false") {
            out = word == "true";
        } else if (to_int(word, iv)) {
            out = iv;
        } else {
            err = word.empty() ? "empty value" : "unsupported TOML value '" + std::string(word) + "'";
            return false;
        }
        return true;
    }

    bool read_string(std::string& out, std::string& err) {
        ++pos_;
        while (!done()) {
            const char c = text_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (done()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case '"':
                case '\\': out.push_back(esc); break;
                default:
                    err = std::string("unknown escape '\\") + esc + "' in string literal";
                    return false;
            }
        }
        err = "unterminated string literal";
        return false;
    }

    // String and integer arrays only; a trailing comma is accepted.
    bool read_array(Value& out, std::string& err) {
        ++pos_;
        std::vector<std::string> strs{};
        std::vector<int64_t> ints{};
        for (;;) {
            skip_blank();
            if (done()) break;
            if (cur() == ']') {
                ++pos_;
                if (ints.empty()) {
                    out = std::move(strs);
                } else {
                    out = std::move(ints);
                }
                return true;
            }
            if (cur() == ',') {
                err = "empty array element";
                return false;
            }

            Value item{};
            if (!read_value(item, err)) return false;
            if (auto* s = std::get_if<std::string>(&item)) {
                strs.push_back(std::move(*s));
            } else if (const auto* i = std::get_if<int64_t>(&item)) {
                ints.push_back(*i);
            } else {
                err = "array values must be strings or integers";
                return false;
            }
            if (!strs.empty() && !ints.empty()) {
                err = "array values must be homogeneous strings or integers";
                return false;
            }

            skip_blank();
            if (done()) break;
            if (cur() == ',') {
                ++pos_;
            } else if (cur() != ']') {
                err = "expected ',' or ']' in array";
                return false;
            }
        }
        err = "unterminated array";
        return false;
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

bool parse_value(std::string_view text, Value& out, std::string& err) {
    return ValueReader(text).read_all(out, err);
}

bool parse_text(std::string_view text,
                std::string_view origin,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::string section{};
    size_t line_no = 0;
    auto fail = [&](const std::string& msg) {
        err = std::string(origin) + ":" + std::to_string(line_no) + ": " + msg;
        return false;
    };

    for (size_t pos = 0; pos <= text.size();) {
        const size_t nl = std::min(text.find('\n', pos), text.size());
        const auto line = trim(text.substr(pos, nl - pos));
        pos = nl + 1;
        ++line_no;
        if (line.empty() || line.front() == '#') continue;

        if (line.front() == '[') {
            const auto close = line.find(']');
            if (close == std::string_view::npos) return fail("invalid section header");
            const auto rest = trim(line.substr(close + 1));
            if (!rest.empty() && rest.front() != '#') return fail("unexpected text after section header");
            const auto name = trim(line.substr(1, close - 1));
            if (!valid_key(name)) return fail("invalid section name");
            section = std::string(name);
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) return fail("expected '='");
        const auto key = trim(line.substr(0, eq));
        if (!valid_key(key)) return fail("invalid key");

        Value parsed{};
        std::string why{};
        if (!parse_value(line.substr(eq + 1), parsed, why)) return fail(why);

        const std::string full = section.empty() ? std::string(key) : section + "." + std::string(key);
        if (out.contains(full)) {
            warnings.push_back(std::string(origin) + ":" + std::to_string(line_no) + ": duplicate key '" + full +
                               "', overriding");
        }
        out[full] = std::move(parsed);
    }
    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::error_code ec{};
    if (path.empty() || !std::filesystem::exists(path, ec)) return true;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    const auto r = os::read_text_file(path.string());
    if (!r.ok) {
        err = path.string() + ": " + r.err;
        return false;
    }
    return parse_text(r.text, path.string(), out, warnings, err);
}

bool write_file(const std::filesystem::path& path, const FlatMap& values, std::string& err) {
    return os::write_file_atomic(path, render_toml(values), err);
}

} // namespace kiln::config::toml_lite
