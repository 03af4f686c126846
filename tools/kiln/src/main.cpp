#include <kiln/Version.hpp>
#include <kiln_tool/cli/Options.hpp>
#include <kiln_tool/driver/Driver.hpp>

#include <iostream>

int main(int argc, char** argv) {
    using kiln_tool::cli::Mode;

    const auto opt = kiln_tool::cli::parse_options(argc, argv);
    if (!opt.ok) return kiln_tool::driver::usage_error(opt.error);

    switch (opt.mode) {
        case Mode::kVersion:
            std::cout << "kiln " << kiln::k_version_string << "\n";
            return 0;
        case Mode::kUsage:
            kiln_tool::cli::print_usage(std::cout);
            return 0;
        case Mode::kCommand:
            break;
    }
    return kiln_tool::driver::run(opt, argv[0]);
}
