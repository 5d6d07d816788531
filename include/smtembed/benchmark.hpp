// ============================================================================
// smtembed/benchmark.hpp — Expansion-size curves: axiomatized vs inlined
// ============================================================================
//
// Family "doubling chain":
//
//   f0(x) = x + 1
//   fk(x) = f{k-1}(f{k-1}(x))          so fk(x) = x + 2^k
//
// For every depth k the suite reports the size of the define-fun expansions
// of f0..fk plus the query, the tree size of the same query with all
// definitions substituted inline, and optionally the time Z3 needs to prove
// (= (fk 0) 2^k) under each strategy.  Results are printed as CSV.
//
// ============================================================================

#ifndef SMTEMBED_BENCHMARK_HPP
#define SMTEMBED_BENCHMARK_HPP

#include "smtembed/ast.hpp"
#include "smtembed/define_fun.hpp"

#include <iosfwd>
#include <vector>

namespace smtembed {

// ── BenchmarkOptions ────────────────────────────────────────────────────────

struct BenchmarkOptions {
    int      max_depth  = 12;     // k = 0..max_depth
    bool     solve      = false;  // also run Z3 on both encodings
    unsigned timeout_ms = 10000;  // per check-sat, when solving
};

/// Largest depth accepted (2^k must fit in a 64-bit Int literal).
inline constexpr int kMaxBenchmarkDepth = 40;

/// Definitions f0..f{depth} of the doubling chain, in dependency order.
std::vector<DefinitionForm> doubling_chain(int depth, TermFactory& f);

/// Run the doubling-chain family and write CSV rows to `out`.
/// Returns 0 on success, non-zero if a solver run disagreed with the
/// expected result.
int run_benchmarks(const BenchmarkOptions& opt, std::ostream& out);

}  // namespace smtembed

#endif  // SMTEMBED_BENCHMARK_HPP
