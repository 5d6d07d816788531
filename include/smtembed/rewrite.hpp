// ============================================================================
// smtembed/rewrite.hpp — Substitution and inline expansion of definitions
// ============================================================================
//
// Both functions are pure: they take a TermId and a TermFactory and return
// a new (interned) TermId.
//
// inline_definitions() implements the call-site substitution strategy: every
// application of a defined function is replaced by the function body with
// the formal parameters replaced by the actual arguments.  Written out as a
// tree, the result grows exponentially with the nesting depth of
// definitions that apply other definitions more than once.  It is kept for
// comparison with the axiomatized expansion of define_fun().
//
// ============================================================================

#ifndef SMTEMBED_REWRITE_HPP
#define SMTEMBED_REWRITE_HPP

#include "smtembed/ast.hpp"
#include "smtembed/define_fun.hpp"

#include <string>
#include <unordered_map>

namespace smtembed {

// ── Substitution ────────────────────────────────────────────────────────────
//
// Replace free occurrences of Var terms.  `replacements` maps a Var TermId
// to its replacement.  Variables bound by a quantifier inside `id` shadow
// the map.  A binder that occurs free in a replacement is renamed to a fresh
// variable `name!k` before the body is rewritten, so no replacement is
// captured.

using Substitution = std::unordered_map<TermId, TermId>;

TermId substitute(TermId id, const Substitution& replacements, TermFactory& f);

// ── Inlining ────────────────────────────────────────────────────────────────
//
// Definitions keyed by function name.  Applications whose name is not in
// the table, or whose argument count differs from the definition's, are
// left in place.  A definition that reaches itself through its body throws
// std::runtime_error.

using DefinitionTable = std::unordered_map<std::string, DefinitionForm>;

TermId inline_definitions(TermId id, const DefinitionTable& table, TermFactory& f);

}  // namespace smtembed

#endif  // SMTEMBED_REWRITE_HPP
