// ============================================================================
// smtembed/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and dispatches to the
// self-tests, the expansion benchmark, or the definition walkthrough.
//
// ============================================================================

#ifndef SMTEMBED_CLI_HPP
#define SMTEMBED_CLI_HPP

#include <string>

namespace smtembed {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    bool     selftest   = false;
    bool     bench      = false;
    int      bench_depth = 12;
    bool     solve      = false;   // --bench: also time Z3 on both encodings
    bool     demo       = false;
    bool     trace      = false;   // echo executed commands to stderr
    unsigned timeout_ms = 0;       // 0 = no solver timeout
    std::string logic;             // empty = let Z3 choose
    bool     help       = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = failure).
int run(const Options& opts);

}  // namespace smtembed

#endif  // SMTEMBED_CLI_HPP
