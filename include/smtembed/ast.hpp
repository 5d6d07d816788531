// ============================================================================
// smtembed/ast.hpp — Sorts and terms of the embedded SMT-LIB language
// ============================================================================
//
// Design notes:
//
//   Every sort and every term is a node in an interned DAG owned by a
//   TermFactory.  Two terms that are structurally identical share the same
//   TermId, so equality of handles is equality of syntax.  Expanding the
//   same definition twice therefore produces the very same ids.
//
//   Sorts:
//     - Bool, Int, Real         : built-in theories
//     - Uninterpreted           : user sort introduced by declare-sort
//     - Array                   : (Array domain range)
//
//   Term kinds (children are ordered):
//     - True/False              : boolean constants
//     - IntLit / RealLit        : numerals (RealLit is a reduced fraction)
//     - Var                     : symbol with a sort; free, or bound by an
//                                 enclosing quantifier
//     - App                     : application of a declared function symbol
//                                 (zero or more arguments)
//     - Not .. Abs              : SMT-LIB core and arithmetic operators
//     - Select, Store           : array theory
//     - Forall, Exists          : children = bound Vars..., body (last)
//
//   The factory does no sort checking.  Ill-sorted terms are representable
//   and are rejected by the solver when they are asserted.
//
// ============================================================================

#ifndef SMTEMBED_AST_HPP
#define SMTEMBED_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace smtembed {

// ── Handles ─────────────────────────────────────────────────────────────────
// Lightweight indices into the factory's node vectors.  kInvalid* signal
// "no sort" / "no term".

using SortId = std::uint32_t;
using TermId = std::uint32_t;
inline constexpr SortId kInvalidSort = static_cast<SortId>(-1);
inline constexpr TermId kInvalidTerm = static_cast<TermId>(-1);

// ── SortKind / SortNode ─────────────────────────────────────────────────────

enum class SortKind : std::uint8_t {
    Bool,
    Int,
    Real,
    Uninterpreted,
    Array
};

struct SortNode {
    SortKind    kind{};
    std::string name;                 // Uninterpreted only
    SortId      domain{kInvalidSort}; // Array only
    SortId      range{kInvalidSort};  // Array only

    bool operator==(const SortNode& o) const noexcept;
};

struct SortNodeHash {
    std::size_t operator()(const SortNode& n) const noexcept;
};

// ── TermKind ────────────────────────────────────────────────────────────────

enum class TermKind : std::uint8_t {
    // Constants
    True,
    False,
    IntLit,
    RealLit,

    // Symbols
    Var,
    App,

    // Core
    Not,
    And,
    Or,
    Implies,
    Xor,
    Eq,
    Distinct,
    Ite,

    // Arithmetic comparison
    Lt,
    Le,
    Gt,
    Ge,

    // Arithmetic
    Add,
    Sub,
    Neg,
    Mul,
    Div,        // real division  (/ a b)
    IntDiv,     // integer division (div a b)
    Mod,
    Abs,

    // Arrays
    Select,
    Store,

    // Quantifiers
    Forall,
    Exists
};

/// SMT-LIB operator symbol for a TermKind ("and", "<=", "forall", ...).
/// Leaves return a descriptive name instead.
const char* term_kind_name(TermKind k) noexcept;

// ── TermNode ────────────────────────────────────────────────────────────────
// Immutable stored node.  The TermFactory is the sole owner.

struct TermNode {
    TermKind            kind{};
    std::string         name;          // Var / App symbol
    std::int64_t        num{0};        // IntLit value, RealLit numerator
    std::int64_t        den{1};        // RealLit denominator (> 0)
    SortId              sort{kInvalidSort};  // Var only
    std::vector<TermId> children;

    bool operator==(const TermNode& o) const noexcept;
};

struct TermNodeHash {
    std::size_t operator()(const TermNode& n) const noexcept;
};

// ── TermFactory ─────────────────────────────────────────────────────────────
// Thread-unsafe (single-threaded design).  Owns sort and term storage and the
// interning maps.  Every make_*() method returns the canonical id for that
// structure.  Misuse of the builder API (a dangling id, a quantifier over a
// non-variable) throws std::invalid_argument.

class TermFactory {
public:
    TermFactory();

    // ── Sorts ───────────────────────────────────────────────────────────
    SortId bool_sort();
    SortId int_sort();
    SortId real_sort();
    SortId uninterpreted_sort(const std::string& name);
    SortId array_sort(SortId domain, SortId range);

    const SortNode& sort(SortId id) const;
    bool            owns_sort(SortId id) const noexcept;
    std::size_t     num_sorts() const noexcept;
    std::string     sort_to_string(SortId id) const;

    // ── Constants and symbols ───────────────────────────────────────────
    TermId make_true();
    TermId make_false();
    TermId make_bool(bool value);
    TermId make_int(std::int64_t value);
    TermId make_real(std::int64_t num, std::int64_t den = 1);
    TermId make_var(const std::string& name, SortId sort);
    TermId make_app(const std::string& name, const std::vector<TermId>& args);

    // ── Core ────────────────────────────────────────────────────────────
    // make_and / make_or accept any number of operands: zero yields the
    // neutral element, one yields the operand itself.
    TermId make_not(TermId child);
    TermId make_and(const std::vector<TermId>& args);
    TermId make_or(const std::vector<TermId>& args);
    TermId make_implies(TermId lhs, TermId rhs);
    TermId make_xor(TermId lhs, TermId rhs);
    TermId make_eq(TermId lhs, TermId rhs);
    TermId make_distinct(const std::vector<TermId>& args);
    TermId make_ite(TermId cond, TermId then_term, TermId else_term);

    // ── Arithmetic ──────────────────────────────────────────────────────
    TermId make_lt(TermId lhs, TermId rhs);
    TermId make_le(TermId lhs, TermId rhs);
    TermId make_gt(TermId lhs, TermId rhs);
    TermId make_ge(TermId lhs, TermId rhs);
    TermId make_add(const std::vector<TermId>& args);
    TermId make_sub(TermId lhs, TermId rhs);
    TermId make_neg(TermId child);
    TermId make_mul(const std::vector<TermId>& args);
    TermId make_div(TermId lhs, TermId rhs);
    TermId make_idiv(TermId lhs, TermId rhs);
    TermId make_mod(TermId lhs, TermId rhs);
    TermId make_abs(TermId child);

    // ── Arrays ──────────────────────────────────────────────────────────
    TermId make_select(TermId array, TermId index);
    TermId make_store(TermId array, TermId index, TermId value);

    // ── Quantifiers ─────────────────────────────────────────────────────
    // Every element of `bound` must be a Var term; at least one is required.
    TermId make_forall(const std::vector<TermId>& bound, TermId body);
    TermId make_exists(const std::vector<TermId>& bound, TermId body);

    // ── Accessors ───────────────────────────────────────────────────────
    const TermNode& node(TermId id) const;
    bool            owns(TermId id) const noexcept;
    std::size_t     size() const noexcept;

    // Body of a quantifier node (its last child).
    TermId quantifier_body(TermId id) const;

    // Same node as `id` with its children replaced (same arity).
    TermId with_children(TermId id, const std::vector<TermId>& children);

    // ── Metrics ─────────────────────────────────────────────────────────
    // Number of nodes of the term written out as a tree (shared sub-terms
    // are counted once per occurrence).  Saturates at UINT64_MAX.
    std::uint64_t tree_size(TermId id) const;

    // True when a Forall or Exists node occurs anywhere in the term.
    bool has_quantifier(TermId id) const;

    // ── Pretty-print ────────────────────────────────────────────────────
    // SMT-LIB s-expression rendering.
    std::string to_string(TermId id) const;

private:
    SortId intern_sort(SortNode node);
    TermId intern(TermNode node);
    TermId make_unary(TermKind kind, TermId child);
    TermId make_binary(TermKind kind, TermId lhs, TermId rhs);
    TermId make_nary(TermKind kind, const std::vector<TermId>& args);
    TermId make_quantifier(TermKind kind, const std::vector<TermId>& bound,
                           TermId body);
    void   require(TermId id, const char* context) const;

    std::uint64_t tree_size_memo(TermId id,
                                 std::unordered_map<TermId, std::uint64_t>& memo) const;
    void write(TermId id, std::string& out) const;

    std::vector<SortNode>                                 sorts_;
    std::unordered_map<SortNode, SortId, SortNodeHash>    sort_intern_;
    std::vector<TermNode>                                 nodes_;
    std::unordered_map<TermNode, TermId, TermNodeHash>    intern_;
};

}  // namespace smtembed

#endif  // SMTEMBED_AST_HPP
