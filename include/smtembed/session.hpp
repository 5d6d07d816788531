// ============================================================================
// smtembed/session.hpp — Z3-backed solver session
// ============================================================================
//
// A Session owns one Z3 context and solver and executes SMT-LIB commands
// against them.  Terms are translated from the TermFactory into Z3
// expressions when they are asserted or evaluated.
//
// Usage:
//   TermFactory f;
//   Session s(f);
//   s.declare_fun("x", {}, f.int_sort());
//   s.assert_formula(f.make_gt(f.make_app("x", {}), f.make_int(3)));
//   if (s.check_sat() == CheckResult::Sat) {
//       auto model = s.get_model();
//   }
//
// Symbol scoping follows the SMT-LIB front end of Z3: declarations made
// after a push are removed by the matching pop, and a name that is still
// visible cannot be declared again.  A variable that is not bound by an
// enclosing quantifier must name a declared constant of the same sort.
// Every failure, including errors raised
// by Z3 itself, is reported as SolverError.
//
// The macro finder (SessionConfig::macro_finder) is a process-wide Z3
// parameter; it is applied when a Session is constructed.
//
// ============================================================================

#ifndef SMTEMBED_SESSION_HPP
#define SMTEMBED_SESSION_HPP

#include "smtembed/ast.hpp"
#include "smtembed/builtins.hpp"
#include "smtembed/command.hpp"

#include <z3++.h>

#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace smtembed {

// ── CheckResult ─────────────────────────────────────────────────────────────

enum class CheckResult {
    Sat,
    Unsat,
    Unknown
};

/// "sat", "unsat" or "unknown".
const char* check_result_name(CheckResult r) noexcept;

// ── SolverError ─────────────────────────────────────────────────────────────

class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── SessionConfig ───────────────────────────────────────────────────────────

struct SessionConfig {
    std::string logic;                 // empty: Z3 picks the logic
    bool        produce_models = true;
    bool        macro_finder   = true; // smt.macro_finder
    unsigned    timeout_ms     = 0;    // 0: no timeout
};

// ── ModelEntry ──────────────────────────────────────────────────────────────

struct ModelEntry {
    std::string name;
    std::string value;
};

// ── Session ─────────────────────────────────────────────────────────────────

class Session : public CommandSink {
public:
    explicit Session(TermFactory& factory, SessionConfig config = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ── Commands ────────────────────────────────────────────────────────
    void set_logic(const std::string& logic);
    void set_option(const std::string& keyword, const std::string& value);
    void declare_sort(const std::string& name);
    void declare_fun(const std::string& name,
                     const std::vector<SortId>& arg_sorts,
                     SortId result_sort) override;
    void declare_const(const std::string& name, SortId sort);
    void assert_formula(TermId formula) override;
    void assert_formula(const Term& formula);
    void push(unsigned levels = 1);
    void pop(unsigned levels = 1);
    CheckResult check_sat();

    /// Constant interpretations of the last satisfying model, sorted by name.
    /// Requires the last check_sat() to have returned Sat with no command
    /// executed since.
    std::vector<ModelEntry> get_model();

    /// Value of `term` in the last model (model completion enabled).
    std::string eval(TermId term);

    /// Reason reported by Z3 for the last Unknown result.
    std::string reason_unknown() const;

    /// Execute any command value.  GetModel is printed to the trace stream.
    void execute(const Command& cmd);

    // ── Introspection ───────────────────────────────────────────────────
    void         set_trace(std::ostream* out) noexcept { trace_ = out; }
    bool         is_declared(const std::string& name) const;
    bool         is_sort_declared(const std::string& name) const;
    std::size_t  num_assertions() const;
    std::size_t  num_scopes() const noexcept { return scopes_.size() - 1; }
    TermFactory& factory() const noexcept { return factory_; }

private:
    struct Scope {
        std::vector<std::string> funs;
        std::vector<std::string> sorts;
    };

    // Applies process-wide Z3 parameters; runs before ctx_ is constructed.
    static bool apply_global_params(const SessionConfig& config);

    void trace(const Command& cmd);
    void invalidate() noexcept { has_model_ = false; }
    void configure_solver();

    z3::sort to_z3_sort(SortId id);
    z3::expr to_z3(TermId id);
    // `bound` holds the variables bound by the enclosing quantifiers.  A
    // Var outside it must name a declared constant of the same sort.
    using TranslationMemo = std::unordered_map<TermId, std::unique_ptr<z3::expr>>;
    z3::expr translate(TermId id, const std::unordered_set<TermId>& bound,
                       TranslationMemo& memo);
    z3::expr translate_free_var(const TermNode& n);
    z3::func_decl lookup_fun(const std::string& name, std::size_t arity);

    TermFactory&  factory_;
    SessionConfig config_;
    bool          params_applied_;
    z3::context   ctx_;
    z3::solver    solver_;

    // Function and sort symbols visible in the current scope.
    std::unordered_map<std::string, std::unique_ptr<z3::func_decl>> funs_;
    std::unordered_map<std::string, std::unique_ptr<z3::sort>>      sorts_;
    std::vector<Scope> scopes_;   // scopes_[0] is the base level

    std::ostream* trace_     = nullptr;
    bool          has_model_ = false;
};

}  // namespace smtembed

#endif  // SMTEMBED_SESSION_HPP
