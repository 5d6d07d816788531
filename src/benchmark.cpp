// ============================================================================
// benchmark.cpp — Axiomatized vs inlined definition expansion
// ============================================================================
//
// Called via `--bench` from the CLI.
//
// ============================================================================

#include "smtembed/benchmark.hpp"
#include "smtembed/ast.hpp"
#include "smtembed/define_fun.hpp"
#include "smtembed/rewrite.hpp"
#include "smtembed/session.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace smtembed {

// ── Helpers ─────────────────────────────────────────────────────────────────

static std::string level_name(int k) {
    return "f" + std::to_string(k);
}

// ── doubling_chain ──────────────────────────────────────────────────────────

std::vector<DefinitionForm> doubling_chain(int depth, TermFactory& f) {
    SortId int_sort = f.int_sort();
    TermId x = f.make_var("x", int_sort);

    std::vector<DefinitionForm> defs;
    defs.push_back(DefinitionForm{level_name(0), {{"x", int_sort}}, int_sort,
                                  f.make_add({x, f.make_int(1)})});
    for (int k = 1; k <= depth; ++k) {
        std::string prev = level_name(k - 1);
        TermId inner = f.make_app(prev, {x});
        TermId body = f.make_app(prev, {inner});
        defs.push_back(DefinitionForm{level_name(k), {{"x", int_sort}}, int_sort, body});
    }
    return defs;
}

/// (= (f{depth} 0) 2^depth)
static TermId chain_goal(int depth, TermFactory& f) {
    TermId call = f.make_app(level_name(depth), {f.make_int(0)});
    return f.make_eq(call, f.make_int(std::int64_t{1} << depth));
}

static double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto d = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(d).count();
}

/// Prove the goal by refuting its negation.  Returns the check result and
/// stores the wall time in `ms`.
static CheckResult refute(TermFactory& f, const std::vector<DefinitionForm>& defs,
                          TermId goal, unsigned timeout_ms, double& ms) {
    SessionConfig cfg;
    cfg.timeout_ms = timeout_ms;
    Session session(f, cfg);

    auto start = std::chrono::steady_clock::now();
    for (const DefinitionForm& d : defs) {
        define_fun(session, d, f);
    }
    session.assert_formula(f.make_not(goal));
    CheckResult r = session.check_sat();
    ms = elapsed_ms(start);
    return r;
}

// ── run_benchmarks ──────────────────────────────────────────────────────────

int run_benchmarks(const BenchmarkOptions& opt, std::ostream& out) {
    if (opt.max_depth < 0 || opt.max_depth > kMaxBenchmarkDepth) {
        throw std::runtime_error("benchmark depth must be in [0, " +
                                 std::to_string(kMaxBenchmarkDepth) + "]");
    }

    out << "depth,definitions,axiom_nodes,inline_nodes";
    if (opt.solve) {
        out << ",axiom_result,axiom_ms,inline_result,inline_ms";
    }
    out << "\n";

    int mismatches = 0;
    for (int depth = 0; depth <= opt.max_depth; ++depth) {
        TermFactory f;
        std::vector<DefinitionForm> defs = doubling_chain(depth, f);
        TermId goal = chain_goal(depth, f);

        std::uint64_t axiom_nodes = f.tree_size(goal) + 1;
        DefinitionTable table;
        for (const DefinitionForm& d : defs) {
            axiom_nodes += expansion_size(expand_definition(d, f), f);
            table.emplace(d.name, d);
        }
        TermId inlined = inline_definitions(goal, table, f);
        std::uint64_t inline_nodes = f.tree_size(inlined) + 1;

        out << depth << "," << defs.size() << "," << axiom_nodes << "," << inline_nodes;

        if (opt.solve) {
            double axiom_ms = 0.0;
            double inline_ms = 0.0;
            CheckResult ra = refute(f, defs, goal, opt.timeout_ms, axiom_ms);
            CheckResult ri = refute(f, {}, inlined, opt.timeout_ms, inline_ms);
            if (ra == CheckResult::Sat || ri == CheckResult::Sat) {
                std::cerr << "depth " << depth << ": goal refuted by the solver\n";
                ++mismatches;
            }
            out << "," << check_result_name(ra) << "," << axiom_ms
                << "," << check_result_name(ri) << "," << inline_ms;
        }
        out << "\n";
    }

    return mismatches == 0 ? 0 : 1;
}

}  // namespace smtembed
