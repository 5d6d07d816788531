// ============================================================================
// main.cpp — Entry point for the smtembed tool
// ============================================================================

#include "smtembed/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        smtembed::Options opts = smtembed::parse_args(argc, argv);

        if (opts.help) {
            smtembed::print_usage(argv[0]);
            return 0;
        }

        return smtembed::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        smtembed::print_usage(argv[0]);
        return 1;
    }
}
