#include <kiln/ast/Nodes.hpp>
#include <kiln/diag/DiagCode.hpp>
#include <kiln/parse/Parser.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static kiln::ast::Program parse_ok_(std::string_view src, bool& ok) {
        kiln::diag::Bag bag;
        auto prog = kiln::parse::parse_source(src, "build.kiln", bag);
        ok = !bag.has_error();
        if (!ok) std::cerr << bag.render_text();
        return prog;
    }

    static bool fails_with_(std::string_view src, kiln::diag::Code code) {
        kiln::diag::Bag bag;
        (void)kiln::parse::parse_source(src, "build.kiln", bag);
        if (!bag.has_code(code)) {
            std::cerr << "  - expected " << kiln::diag::code_name(code) << ", got:\n" << bag.render_text();
            return false;
        }
        return true;
    }

    static bool test_full_description_() {
        const char* src =
            "project \"demo\" version \"1.0\";\n"
            "global_flags \"c++\" [\"-DNAME=\\\"demo\\\"\"];\n"
            "let common = [\"-Wall\"] + option(\"extra_flags\");\n"
            "library util {\n"
            "    kind = \"static\";\n"
            "    sources = [\"src/util.cpp\"];\n"
            "    flags = common;\n"
            "}\n"
            "command gen_version {\n"
            "    inputs = [\"tools/version.txt\"];\n"
            "    outputs = [\"version.h\"];\n"
            "    run = [\"cp\", \"$in\", \"$out\"];\n"
            "}\n"
            "executable simple {\n"
            "    sources = [\"simple.cpp\"];\n"
            "    link = [util];\n"
            "    deps = [gen_version];\n"
            "};\n"
            "alias tools = [simple];\n"
            "default [simple];\n"
            "install [simple, util];\n";

        bool ok = false;
        const auto prog = parse_ok_(src, ok);
        if (!require_(ok, "description must parse")) return false;
        if (!require_(prog.items.size() == 9, "nine items expected")) return false;

        using kiln::ast::ItemKind;
        bool good = true;
        good &= require_(prog.items[0].kind == ItemKind::kProject && prog.items[0].name == "demo" &&
                             prog.items[0].version == "1.0",
                         "project name/version");
        good &= require_(prog.items[1].kind == ItemKind::kGlobalFlags && prog.items[1].name == "c++",
                         "global_flags language");
        good &= require_(prog.items[2].kind == ItemKind::kLet && prog.items[2].expr &&
                             prog.items[2].expr->kind == kiln::ast::ExprKind::kConcat,
                         "let binds a concatenation");
        good &= require_(prog.items[3].kind == ItemKind::kLibrary && prog.items[3].fields.size() == 3,
                         "library has three fields");
        good &= require_(prog.items[4].kind == ItemKind::kCommand && prog.items[4].name == "gen_version",
                         "command name");
        good &= require_(prog.items[5].kind == ItemKind::kExecutable, "executable item");
        good &= require_(prog.items[6].kind == ItemKind::kAlias && prog.items[6].name == "tools", "alias item");
        good &= require_(prog.items[7].kind == ItemKind::kDefault, "default item");
        good &= require_(prog.items[8].kind == ItemKind::kInstall && prog.items[8].expr &&
                             prog.items[8].expr->items.size() == 2,
                         "install lists two targets");
        good &= require_(prog.items[5].span.line == 14, "executable span line");

        const auto& flags = prog.items[1].expr;
        good &= require_(flags && flags->items.size() == 1 && flags->items[0]->text == "-DNAME=\"demo\"",
                         "escaped quotes are unescaped");
        return good;
    }

    static bool test_option_declarations_() {
        const char* src =
            "option name: string = \"app\" {\n"
            "    help = \"executable name\";\n"
            "    validate nonempty;\n"
            "    validate matches \"^[a-z]+$\";\n"
            "};\n"
            "option mode: enum [\"debug\", \"release\"] = \"release\";\n"
            "option defs: list { validate min_items 1; }\n"
            "option fast: bool = true;\n";

        bool ok = false;
        const auto prog = parse_ok_(src, ok);
        if (!require_(ok, "options must parse")) return false;
        if (!require_(prog.items.size() == 4, "four options expected")) return false;

        using kiln::ast::OptionType;
        const auto& name = prog.items[0].option;
        const auto& mode = prog.items[1].option;
        const auto& defs = prog.items[2].option;
        const auto& fast = prog.items[3].option;

        bool good = true;
        good &= require_(name.type == OptionType::kString && name.default_value &&
                             name.default_value->text == "app",
                         "string option with default");
        good &= require_(name.fields.size() == 1 && name.fields[0].name == "help", "help field");
        good &= require_(name.validators.size() == 2 && name.validators[1].rule == "matches" &&
                             name.validators[1].arg,
                         "matches validator keeps its argument");
        good &= require_(mode.type == OptionType::kEnum && mode.choices.size() == 2 &&
                             mode.choices[1] == "release",
                         "enum choices");
        good &= require_(defs.type == OptionType::kList && !defs.default_value &&
                             defs.validators.size() == 1 && defs.validators[0].arg &&
                             defs.validators[0].arg->int_value == 1,
                         "list option with min_items");
        good &= require_(fast.type == OptionType::kBool && fast.default_value &&
                             fast.default_value->bool_value,
                         "bool option");
        return good;
    }

    static bool test_comments_and_trailing_semicolon_() {
        const char* src =
            "// leading comment\n"
            "executable app { sources = [\"main.c\",]; } // trailing\n"
            "/* block\n comment */\n"
            "default [app];\n";
        bool ok = false;
        const auto prog = parse_ok_(src, ok);
        if (!require_(ok, "must parse")) return false;
        return require_(prog.items.size() == 2, "two items expected");
    }

    static bool test_unexpected_token_() {
        return fails_with_("executable app { sources = [\"a.c\"] }\n", kiln::diag::Code::C_UNEXPECTED_TOKEN) &&
               fails_with_("library = 3;\n", kiln::diag::Code::C_UNEXPECTED_TOKEN) &&
               fails_with_("@\n", kiln::diag::Code::C_UNEXPECTED_TOKEN);
    }

    static bool test_unexpected_eof_() {
        return fails_with_("executable app {\n  sources = [\"a.c\"];\n", kiln::diag::Code::C_UNEXPECTED_EOF) &&
               fails_with_("let x = [\"a\",", kiln::diag::Code::C_UNEXPECTED_EOF);
    }

    static bool test_invalid_literal_() {
        return fails_with_("let x = \"unterminated;\n", kiln::diag::Code::C_INVALID_LITERAL) &&
               fails_with_("let x = \"bad \\q escape\";\n", kiln::diag::Code::C_INVALID_LITERAL);
    }

    static bool test_error_recovery_reports_later_items_() {
        kiln::diag::Bag bag;
        const auto prog = kiln::parse::parse_source(
            "let a = ;\n"
            "let b = [\"ok\"];\n"
            "let c = ;\n",
            "build.kiln",
            bag);
        bool good = require_(bag.all().size() >= 2, "both broken items are reported");
        good &= require_(bag.all().front().line == 1, "first error on line 1");
        good &= require_(bag.all().back().line == 3, "last error on line 3");
        (void)prog;
        return good;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"full_description", test_full_description_},
        {"option_declarations", test_option_declarations_},
        {"comments_and_trailing_semicolon", test_comments_and_trailing_semicolon_},
        {"unexpected_token", test_unexpected_token_},
        {"unexpected_eof", test_unexpected_eof_},
        {"invalid_literal", test_invalid_literal_},
        {"error_recovery_reports_later_items", test_error_recovery_reports_later_items_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
