#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kiln::diag {

enum class Code : uint16_t {
    C_UNEXPECTED_TOKEN = 1,
    C_UNEXPECTED_EOF,
    C_INVALID_LITERAL,

    F_IO_ERROR = 50,

    O_INVALID_OPTION = 100,
    O_UNKNOWN_OPTION,

    T_UNSUPPORTED_TOOLCHAIN = 150,

    D_DUPLICATE_TARGET_NAME = 200,
    D_UNDECLARED_TARGET,
    D_INVALID_DECLARATION,

    G_CONFLICTING_OUTPUT = 300,
    G_DANGLING_INPUT,
    G_CYCLIC_DEPENDENCY,

    E_UNSUPPORTED_EDGE_KIND = 400,
    E_INVALID_TEXT,
    E_WRITE_FAILED,
};

enum class Category : uint8_t {
    kIo,
    kDescription,
    kGraph,
    kEmission,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::C_UNEXPECTED_TOKEN: return "C_UNEXPECTED_TOKEN";
        case Code::C_UNEXPECTED_EOF: return "C_UNEXPECTED_EOF";
        case Code::C_INVALID_LITERAL: return "C_INVALID_LITERAL";
        case Code::F_IO_ERROR: return "F_IO_ERROR";
        case Code::O_INVALID_OPTION: return "O_INVALID_OPTION";
        case Code::O_UNKNOWN_OPTION: return "O_UNKNOWN_OPTION";
        case Code::T_UNSUPPORTED_TOOLCHAIN: return "T_UNSUPPORTED_TOOLCHAIN";
        case Code::D_DUPLICATE_TARGET_NAME: return "D_DUPLICATE_TARGET_NAME";
        case Code::D_UNDECLARED_TARGET: return "D_UNDECLARED_TARGET";
        case Code::D_INVALID_DECLARATION: return "D_INVALID_DECLARATION";
        case Code::G_CONFLICTING_OUTPUT: return "G_CONFLICTING_OUTPUT";
        case Code::G_DANGLING_INPUT: return "G_DANGLING_INPUT";
        case Code::G_CYCLIC_DEPENDENCY: return "G_CYCLIC_DEPENDENCY";
        case Code::E_UNSUPPORTED_EDGE_KIND: return "E_UNSUPPORTED_EDGE_KIND";
        case Code::E_INVALID_TEXT: return "E_INVALID_TEXT";
        case Code::E_WRITE_FAILED: return "E_WRITE_FAILED";
    }
    return "UNKNOWN";
}

inline Category category_of(Code c) {
    const auto v = static_cast<uint16_t>(c);
    if (v >= 400) return Category::kEmission;
    if (v >= 300) return Category::kGraph;
    if (v >= 100 || v < 50) return Category::kDescription;
    return Category::kIo;
}

struct Diagnostic {
    Code code{};
    std::string file;
    uint32_t line = 1;
    uint32_t column = 1;
    std::string message;
};

class Bag {
public:
    void add(Code code, std::string file, uint32_t line, uint32_t column, std::string message) {
        diagnostics_.push_back(Diagnostic{code, std::move(file), line, column, std::move(message)});
    }

    bool has_error() const { return !diagnostics_.empty(); }

    bool has_code(Code code) const {
        for (const auto& d : diagnostics_) {
            if (d.code == code) return true;
        }
        return false;
    }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    // One `file:line:col: error[CODE]: message` line per diagnostic.
    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            oss << d.file << ":" << d.line << ":" << d.column << ": error[" << code_name(d.code) << "]: " << d.message
                << "\n";
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
};

// Process exit status for the first error in the bag: 0 when empty,
// 1 for I/O, 2 for description, 3 for graph and 4 for emission errors.
inline int exit_code_for(const Bag& bag) {
    if (!bag.has_error()) return 0;
    switch (category_of(bag.all().front().code)) {
        case Category::kIo: return 1;
        case Category::kDescription: return 2;
        case Category::kGraph: return 3;
        case Category::kEmission: return 4;
    }
    return 1;
}

} // namespace kiln::diag
