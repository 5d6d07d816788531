// ============================================================================
// smtembed/builtins.hpp — SMT-LIB built-in operators under C++-safe names
// ============================================================================
//
// Term is a small value handle (factory pointer + TermId) so that solver
// expressions can be written as ordinary C++ expressions:
//
//   Term a = smt::int_var(f, "a");
//   Term b = smt::int_var(f, "b");
//   Term m = smt::ite(a > b, a, b);          // (ite (> a b) a b)
//
// Every SMT-LIB primitive is available in namespace smtembed::smt under its
// SMT-LIB name, with a trailing underscore where the name is a C++ keyword
// or would clash with a common identifier (and_, or_, not_, xor_).  Integer
// division is `idiv` to keep it apart from real division `div`.
//
// Mixing terms from two factories throws std::invalid_argument.
//
// ============================================================================

#ifndef SMTEMBED_BUILTINS_HPP
#define SMTEMBED_BUILTINS_HPP

#include "smtembed/ast.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace smtembed {

// ── Term ────────────────────────────────────────────────────────────────────

class Term {
public:
    Term() = default;
    Term(TermFactory& factory, TermId id);

    TermId       id() const noexcept { return id_; }
    TermFactory& factory() const;
    bool         valid() const noexcept { return factory_ != nullptr; }

    std::string to_string() const;

private:
    TermFactory* factory_ = nullptr;
    TermId       id_      = kInvalidTerm;
};

namespace smt {

// ── Literals and symbols ────────────────────────────────────────────────────

Term bool_val(TermFactory& f, bool value);
Term int_val(TermFactory& f, std::int64_t value);
Term real_val(TermFactory& f, std::int64_t num, std::int64_t den = 1);

Term var(TermFactory& f, const std::string& name, SortId sort);
Term bool_var(TermFactory& f, const std::string& name);
Term int_var(TermFactory& f, const std::string& name);
Term real_var(TermFactory& f, const std::string& name);

/// Application of a declared function symbol; `args` may be empty.
Term app(TermFactory& f, const std::string& name, const std::vector<Term>& args = {});

// ── Core ────────────────────────────────────────────────────────────────────

Term not_(const Term& a);
Term and_(const Term& a, const Term& b);
Term and_(const std::vector<Term>& args);
Term or_(const Term& a, const Term& b);
Term or_(const std::vector<Term>& args);
Term implies(const Term& a, const Term& b);
Term xor_(const Term& a, const Term& b);
Term eq(const Term& a, const Term& b);
Term distinct(const std::vector<Term>& args);
Term ite(const Term& c, const Term& t, const Term& e);

// ── Arithmetic ──────────────────────────────────────────────────────────────

Term lt(const Term& a, const Term& b);
Term le(const Term& a, const Term& b);
Term gt(const Term& a, const Term& b);
Term ge(const Term& a, const Term& b);
Term add(const std::vector<Term>& args);
Term sub(const Term& a, const Term& b);
Term neg(const Term& a);
Term mul(const std::vector<Term>& args);
Term div(const Term& a, const Term& b);
Term idiv(const Term& a, const Term& b);
Term mod(const Term& a, const Term& b);
Term abs(const Term& a);

// ── Arrays ──────────────────────────────────────────────────────────────────

Term select(const Term& array, const Term& index);
Term store(const Term& array, const Term& index, const Term& value);

// ── Quantifiers ─────────────────────────────────────────────────────────────

Term forall(const std::vector<Term>& bound, const Term& body);
Term exists(const std::vector<Term>& bound, const Term& body);

}  // namespace smt

// ── Operators ───────────────────────────────────────────────────────────────
// Integer operands are lifted to Int literals of the other operand's factory.

Term operator!(const Term& a);
Term operator&&(const Term& a, const Term& b);
Term operator||(const Term& a, const Term& b);

Term operator-(const Term& a);
Term operator+(const Term& a, const Term& b);
Term operator-(const Term& a, const Term& b);
Term operator*(const Term& a, const Term& b);
Term operator/(const Term& a, const Term& b);
Term operator+(const Term& a, std::int64_t b);
Term operator-(const Term& a, std::int64_t b);
Term operator*(std::int64_t a, const Term& b);

Term operator<(const Term& a, const Term& b);
Term operator<=(const Term& a, const Term& b);
Term operator>(const Term& a, const Term& b);
Term operator>=(const Term& a, const Term& b);
Term operator<(const Term& a, std::int64_t b);
Term operator<=(const Term& a, std::int64_t b);
Term operator>(const Term& a, std::int64_t b);
Term operator>=(const Term& a, std::int64_t b);

}  // namespace smtembed

#endif  // SMTEMBED_BUILTINS_HPP
