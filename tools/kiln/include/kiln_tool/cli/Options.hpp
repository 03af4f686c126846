#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace kiln_tool::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kCommand,
};

enum class Command : uint8_t {
    kNone,
    kConfigure,
    kRegenerate,
    kBuild,
    kCheck,
    kGraph,
};

// Toolchain selection and option overrides shared by every command that
// evaluates a description.
struct SelectOptions {
    std::vector<std::string> backends{};
    std::optional<std::string> toolchain{};
    std::optional<std::string> platform{};
    // raw `name=value` texts
    std::vector<std::string> defines{};
};

struct ConfigureOptions {
    std::string source_dir{};
    std::string build_dir{};
    SelectOptions select{};
    bool verbose = false;
};

struct RegenerateOptions {
    std::string build_dir{"."};
    bool verbose = false;
};

struct BuildOptions {
    std::string build_dir{"."};
    std::optional<uint32_t> jobs{};
    bool verbose = false;
};

struct CheckOptions {
    std::string source_dir{"."};
    SelectOptions select{};
};

struct GraphOptions {
    std::string source_dir{"."};
    std::string format{"json"};
    SelectOptions select{};
};

struct Options {
    Mode mode = Mode::kUsage;
    Command command = Command::kNone;

    ConfigureOptions configure{};
    RegenerateOptions regenerate{};
    BuildOptions build{};
    CheckOptions check{};
    GraphOptions graph{};

    bool ok = true;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

} // namespace kiln_tool::cli
