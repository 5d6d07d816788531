// ============================================================================
// smtembed/define_fun.hpp — Function-definition expansion (define-fun)
// ============================================================================
//
// A definition (name, params, result sort, body) is compiled into exactly
// two primitive commands instead of being substituted at every call site:
//
//   zero parameters    (declare-fun ten () Int)
//                      (assert (= ten 10))
//
//   N >= 1 parameters  (declare-fun max (Int Int) Int)
//                      (assert (forall ((a Int) (b Int))
//                                (= (max a b) (ite (> a b) a b))))
//
// Other definitions are referenced from a body by application only, so the
// size of an expansion is independent of how large the bodies of the
// functions it calls are.  Z3's macro finder recognises the quantified
// equation and uses it as a macro.
//
// Expansion is a pure syntax transformation over the TermFactory; it never
// touches a solver.  Structural problems with the definition form are
// reported as StructuralError before any command is issued.  Sort errors in
// the body and name clashes are left to the solver and surface when the
// commands are executed.
//
// define_fun() issues the declaration and then the assertion.  There is no
// rollback: if the assertion is rejected, the declaration stays in the
// session.
//
// ============================================================================

#ifndef SMTEMBED_DEFINE_FUN_HPP
#define SMTEMBED_DEFINE_FUN_HPP

#include "smtembed/ast.hpp"
#include "smtembed/builtins.hpp"
#include "smtembed/command.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace smtembed {

// ── Definition form ─────────────────────────────────────────────────────────

struct Param {
    std::string name;
    SortId      sort = kInvalidSort;   // kInvalidSort: type missing
};

struct DefinitionForm {
    std::string        name;
    std::vector<Param> params;
    SortId             result = kInvalidSort;
    TermId             body   = kInvalidTerm;
};

// ── StructuralError ─────────────────────────────────────────────────────────
// The definition form fits neither the zero-parameter nor the N-parameter
// shape.  Raised before any primitive command is issued.

class StructuralError : public std::runtime_error {
public:
    explicit StructuralError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Parameter shape ─────────────────────────────────────────────────────────

struct EmptyParams {};

struct NonEmptyParams {
    std::vector<Param> params;   // declared order
};

using ParamShape = std::variant<EmptyParams, NonEmptyParams>;

/// Classify a definition form by the shape of its parameter list.
/// Throws StructuralError if the form is malformed.
ParamShape match_params(const DefinitionForm& form, const TermFactory& factory);

// ── Expansion ───────────────────────────────────────────────────────────────

struct Expansion {
    Command declaration;   // DeclareFun
    Command assertion;     // Assert

    bool operator==(const Expansion& o) const noexcept {
        return declaration == o.declaration && assertion == o.assertion;
    }
};

/// Expand a definition into its declaration and defining assertion.
Expansion expand_definition(const DefinitionForm& form, TermFactory& factory);

/// Tree size of both commands of an expansion.
std::uint64_t expansion_size(const Expansion& expansion, const TermFactory& factory);

/// SMT-LIB text of an expansion, one command per line.
std::string expansion_to_string(const Expansion& expansion, const TermFactory& factory);

/// Expand `form` and submit the result to `sink` (declaration first).
/// Returns the issued expansion.  Errors from the sink propagate unchanged.
Expansion define_fun(CommandSink& sink, const DefinitionForm& form, TermFactory& factory);

/// Convenience overload for forms built from Term handles.
Expansion define_fun(CommandSink& sink, const std::string& name,
                     const std::vector<Param>& params, SortId result,
                     const Term& body);

}  // namespace smtembed

#endif  // SMTEMBED_DEFINE_FUN_HPP
