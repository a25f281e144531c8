// tools/tesselc/src/main.cpp
#include "cli/Options.hpp"
#include "driver/Runner.hpp"
#include <tessel/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << tessel::k_version_string << "\n";
        tesselc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = tesselc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        tesselc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == tesselc::cli::Mode::kVersion) {
        std::cout << tessel::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == tesselc::cli::Mode::kUsage) {
        tesselc::cli::print_usage(std::cout);
        return 0;
    }

    return tesselc::driver::run(opt);
}
