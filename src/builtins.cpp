// ============================================================================
// builtins.cpp — Term handle and the renamed SMT-LIB operator set
// ============================================================================

#include "smtembed/builtins.hpp"

#include <stdexcept>

namespace smtembed {

// ── Term ────────────────────────────────────────────────────────────────────

Term::Term(TermFactory& factory, TermId id) : factory_(&factory), id_(id) {
    factory.node(id);
}

TermFactory& Term::factory() const {
    if (!factory_) {
        throw std::invalid_argument("Term: empty handle");
    }
    return *factory_;
}

std::string Term::to_string() const {
    return factory().to_string(id_);
}

namespace {

// Common factory of a group of operands.
TermFactory& common_factory(const Term& a, const Term& b) {
    TermFactory& f = a.factory();
    if (&f != &b.factory()) {
        throw std::invalid_argument("terms belong to different factories");
    }
    return f;
}

TermFactory& common_factory(const std::vector<Term>& args, const char* op) {
    if (args.empty()) {
        throw std::invalid_argument(std::string(op) + ": no operands");
    }
    TermFactory& f = args.front().factory();
    for (const Term& t : args) {
        if (&t.factory() != &f) {
            throw std::invalid_argument("terms belong to different factories");
        }
    }
    return f;
}

std::vector<TermId> ids(const std::vector<Term>& args) {
    std::vector<TermId> out;
    out.reserve(args.size());
    for (const Term& t : args) out.push_back(t.id());
    return out;
}

Term lift(const Term& like, std::int64_t value) {
    return smt::int_val(like.factory(), value);
}

}  // namespace

namespace smt {

// ── Literals and symbols ────────────────────────────────────────────────────

Term bool_val(TermFactory& f, bool value) {
    return Term(f, f.make_bool(value));
}

Term int_val(TermFactory& f, std::int64_t value) {
    return Term(f, f.make_int(value));
}

Term real_val(TermFactory& f, std::int64_t num, std::int64_t den) {
    return Term(f, f.make_real(num, den));
}

Term var(TermFactory& f, const std::string& name, SortId sort) {
    return Term(f, f.make_var(name, sort));
}

Term bool_var(TermFactory& f, const std::string& name) {
    return var(f, name, f.bool_sort());
}

Term int_var(TermFactory& f, const std::string& name) {
    return var(f, name, f.int_sort());
}

Term real_var(TermFactory& f, const std::string& name) {
    return var(f, name, f.real_sort());
}

Term app(TermFactory& f, const std::string& name, const std::vector<Term>& args) {
    for (const Term& t : args) {
        if (&t.factory() != &f) {
            throw std::invalid_argument("terms belong to different factories");
        }
    }
    return Term(f, f.make_app(name, ids(args)));
}

// ── Core ────────────────────────────────────────────────────────────────────

Term not_(const Term& a) {
    return Term(a.factory(), a.factory().make_not(a.id()));
}

Term and_(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_and({a.id(), b.id()}));
}

Term and_(const std::vector<Term>& args) {
    TermFactory& f = common_factory(args, "and");
    return Term(f, f.make_and(ids(args)));
}

Term or_(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_or({a.id(), b.id()}));
}

Term or_(const std::vector<Term>& args) {
    TermFactory& f = common_factory(args, "or");
    return Term(f, f.make_or(ids(args)));
}

Term implies(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_implies(a.id(), b.id()));
}

Term xor_(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_xor(a.id(), b.id()));
}

Term eq(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_eq(a.id(), b.id()));
}

Term distinct(const std::vector<Term>& args) {
    TermFactory& f = common_factory(args, "distinct");
    return Term(f, f.make_distinct(ids(args)));
}

Term ite(const Term& c, const Term& t, const Term& e) {
    TermFactory& f = common_factory(c, t);
    common_factory(t, e);
    return Term(f, f.make_ite(c.id(), t.id(), e.id()));
}

// ── Arithmetic ──────────────────────────────────────────────────────────────

Term lt(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_lt(a.id(), b.id()));
}

Term le(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_le(a.id(), b.id()));
}

Term gt(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_gt(a.id(), b.id()));
}

Term ge(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_ge(a.id(), b.id()));
}

Term add(const std::vector<Term>& args) {
    TermFactory& f = common_factory(args, "+");
    return Term(f, f.make_add(ids(args)));
}

Term sub(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_sub(a.id(), b.id()));
}

Term neg(const Term& a) {
    return Term(a.factory(), a.factory().make_neg(a.id()));
}

Term mul(const std::vector<Term>& args) {
    TermFactory& f = common_factory(args, "*");
    return Term(f, f.make_mul(ids(args)));
}

Term div(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_div(a.id(), b.id()));
}

Term idiv(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_idiv(a.id(), b.id()));
}

Term mod(const Term& a, const Term& b) {
    TermFactory& f = common_factory(a, b);
    return Term(f, f.make_mod(a.id(), b.id()));
}

Term abs(const Term& a) {
    return Term(a.factory(), a.factory().make_abs(a.id()));
}

// ── Arrays ──────────────────────────────────────────────────────────────────

Term select(const Term& array, const Term& index) {
    TermFactory& f = common_factory(array, index);
    return Term(f, f.make_select(array.id(), index.id()));
}

Term store(const Term& array, const Term& index, const Term& value) {
    TermFactory& f = common_factory(array, index);
    common_factory(index, value);
    return Term(f, f.make_store(array.id(), index.id(), value.id()));
}

// ── Quantifiers ─────────────────────────────────────────────────────────────

Term forall(const std::vector<Term>& bound, const Term& body) {
    TermFactory& f = common_factory(bound, "forall");
    common_factory(bound.front(), body);
    return Term(f, f.make_forall(ids(bound), body.id()));
}

Term exists(const std::vector<Term>& bound, const Term& body) {
    TermFactory& f = common_factory(bound, "exists");
    common_factory(bound.front(), body);
    return Term(f, f.make_exists(ids(bound), body.id()));
}

}  // namespace smt

// ── Operators ───────────────────────────────────────────────────────────────

Term operator!(const Term& a)                  { return smt::not_(a); }
Term operator&&(const Term& a, const Term& b)  { return smt::and_(a, b); }
Term operator||(const Term& a, const Term& b)  { return smt::or_(a, b); }

Term operator-(const Term& a)                  { return smt::neg(a); }
Term operator+(const Term& a, const Term& b)   { return smt::add({a, b}); }
Term operator-(const Term& a, const Term& b)   { return smt::sub(a, b); }
Term operator*(const Term& a, const Term& b)   { return smt::mul({a, b}); }
Term operator/(const Term& a, const Term& b)   { return smt::div(a, b); }
Term operator+(const Term& a, std::int64_t b)  { return a + lift(a, b); }
Term operator-(const Term& a, std::int64_t b)  { return a - lift(a, b); }
Term operator*(std::int64_t a, const Term& b)  { return lift(b, a) * b; }

Term operator<(const Term& a, const Term& b)   { return smt::lt(a, b); }
Term operator<=(const Term& a, const Term& b)  { return smt::le(a, b); }
Term operator>(const Term& a, const Term& b)   { return smt::gt(a, b); }
Term operator>=(const Term& a, const Term& b)  { return smt::ge(a, b); }
Term operator<(const Term& a, std::int64_t b)  { return a < lift(a, b); }
Term operator<=(const Term& a, std::int64_t b) { return a <= lift(a, b); }
Term operator>(const Term& a, std::int64_t b)  { return a > lift(a, b); }
Term operator>=(const Term& a, std::int64_t b) { return a >= lift(a, b); }

}  // namespace smtembed
