// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "smtembed/cli.hpp"
#include "smtembed/ast.hpp"
#include "smtembed/benchmark.hpp"
#include "smtembed/builtins.hpp"
#include "smtembed/define_fun.hpp"
#include "smtembed/session.hpp"
#include "smtembed/test.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace smtembed {

// ── parse_args ──────────────────────────────────────────────────────────────

static unsigned parse_unsigned(const std::string& option, const std::string& text) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || text.empty() || text.front() == '-') {
        throw std::runtime_error(option + " expects a non-negative number, got '" +
                                 text + "'");
    }
    return static_cast<unsigned>(value);
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--bench") {
            opts.bench = true;
            // Optional depth argument.
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                opts.bench_depth = static_cast<int>(parse_unsigned("--bench", argv[++i]));
                if (opts.bench_depth > kMaxBenchmarkDepth) {
                    throw std::runtime_error("--bench depth must be <= " +
                                             std::to_string(kMaxBenchmarkDepth));
                }
            }
        } else if (arg == "--solve") {
            opts.solve = true;
        } else if (arg == "--demo") {
            opts.demo = true;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--timeout") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--timeout requires a millisecond argument");
            }
            opts.timeout_ms = parse_unsigned("--timeout", argv[++i]);
        } else if (arg == "--logic") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--logic requires a logic name");
            }
            opts.logic = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            throw std::runtime_error("unexpected argument: " + arg +
                                     " (script files are not read)");
        }
    }

    if (opts.solve && !opts.bench) {
        throw std::runtime_error("--solve is only meaningful with --bench");
    }
    if (!opts.help && !opts.selftest && !opts.bench && !opts.demo) {
        throw std::runtime_error("nothing to do (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " --selftest\n"
        << "       " << program_name << " --bench [DEPTH] [--solve] [--timeout MS]\n"
        << "       " << program_name << " --demo [--trace] [--logic NAME] [--timeout MS]\n"
        << "\n"
        << "SMT-LIB define-fun expansion over Z3.\n"
        << "\n"
        << "Options:\n"
        << "  --selftest      Run built-in tests\n"
        << "  --bench [N]     Print expansion sizes for definition chains of depth 0..N\n"
        << "                  (default 12, at most " << kMaxBenchmarkDepth << ")\n"
        << "  --solve         With --bench: also time Z3 on both encodings\n"
        << "  --demo          Define max/min/clamp/ten and check a property\n"
        << "  --trace         Echo every solver command to stderr\n"
        << "  --logic NAME    SMT-LIB logic for the solver (default: Z3's choice)\n"
        << "  --timeout MS    Per check-sat timeout in milliseconds\n"
        << "  --help, -h      Show this message\n";
}

// ── run_demo ────────────────────────────────────────────────────────────────
// Builds the definitions of the documentation examples and asks Z3 whether
// clamp can leave its interval.

static int run_demo(const Options& opts) {
    TermFactory f;
    SessionConfig cfg;
    cfg.logic = opts.logic;
    cfg.timeout_ms = opts.timeout_ms;
    Session session(f, cfg);
    if (opts.trace) {
        session.set_trace(&std::cerr);
    }

    SortId Int = f.int_sort();
    Term a = smt::int_var(f, "a");
    Term b = smt::int_var(f, "b");
    Term x = smt::int_var(f, "x");
    Term lo = smt::int_var(f, "lo");
    Term hi = smt::int_var(f, "hi");

    define_fun(session, "max", {{"a", Int}, {"b", Int}}, Int, smt::ite(a > b, a, b));
    define_fun(session, "min", {{"a", Int}, {"b", Int}}, Int, smt::ite(a < b, a, b));
    define_fun(session, "clamp", {{"x", Int}, {"lo", Int}, {"hi", Int}}, Int,
               smt::app(f, "max", {lo, smt::app(f, "min", {x, hi})}));
    define_fun(session, "ten", {}, Int, smt::int_val(f, 10));

    // Is there a y whose clamp to [0, ten] lies outside that interval?
    session.declare_const("y", Int);
    Term y = smt::int_var(f, "y");
    Term c = smt::app(f, "clamp", {y, smt::int_val(f, 0), smt::app(f, "ten")});
    session.assert_formula(c < 0 || c > 10);
    CheckResult r = session.check_sat();

    std::cout << "clamp(y, 0, ten) outside [0, 10]: " << check_result_name(r) << "\n";
    if (r == CheckResult::Unknown) {
        std::cout << "  reason: " << session.reason_unknown() << "\n";
    }
    return r == CheckResult::Unsat ? 0 : 1;
}

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    if (opts.bench) {
        BenchmarkOptions bopt;
        bopt.max_depth = opts.bench_depth;
        bopt.solve = opts.solve;
        if (opts.timeout_ms > 0) bopt.timeout_ms = opts.timeout_ms;
        return run_benchmarks(bopt, std::cout);
    }

    if (opts.demo) {
        try {
            return run_demo(opts);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}

}  // namespace smtembed
