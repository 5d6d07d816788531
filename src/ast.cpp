// ============================================================================
// ast.cpp — Implementation of sorts, terms, interning, and SMT-LIB printing
// ============================================================================

#include "smtembed/ast.hpp"
#include "smtembed/utils.hpp"

#include <limits>
#include <numeric>
#include <stdexcept>

namespace smtembed {

// ── term_kind_name ──────────────────────────────────────────────────────────

const char* term_kind_name(TermKind k) noexcept {
    switch (k) {
        case TermKind::True:     return "true";
        case TermKind::False:    return "false";
        case TermKind::IntLit:   return "IntLit";
        case TermKind::RealLit:  return "RealLit";
        case TermKind::Var:      return "Var";
        case TermKind::App:      return "App";
        case TermKind::Not:      return "not";
        case TermKind::And:      return "and";
        case TermKind::Or:       return "or";
        case TermKind::Implies:  return "=>";
        case TermKind::Xor:      return "xor";
        case TermKind::Eq:       return "=";
        case TermKind::Distinct: return "distinct";
        case TermKind::Ite:      return "ite";
        case TermKind::Lt:       return "<";
        case TermKind::Le:       return "<=";
        case TermKind::Gt:       return ">";
        case TermKind::Ge:       return ">=";
        case TermKind::Add:      return "+";
        case TermKind::Sub:      return "-";
        case TermKind::Neg:      return "-";
        case TermKind::Mul:      return "*";
        case TermKind::Div:      return "/";
        case TermKind::IntDiv:   return "div";
        case TermKind::Mod:      return "mod";
        case TermKind::Abs:      return "abs";
        case TermKind::Select:   return "select";
        case TermKind::Store:    return "store";
        case TermKind::Forall:   return "forall";
        case TermKind::Exists:   return "exists";
    }
    return "?";
}

// ── Node equality and hashing ───────────────────────────────────────────────

bool SortNode::operator==(const SortNode& o) const noexcept {
    return kind == o.kind && name == o.name &&
           domain == o.domain && range == o.range;
}

std::size_t SortNodeHash::operator()(const SortNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<SortId>{}(n.domain) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<SortId>{}(n.range) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

bool TermNode::operator==(const TermNode& o) const noexcept {
    return kind == o.kind &&
           name == o.name &&
           num == o.num &&
           den == o.den &&
           sort == o.sort &&
           children == o.children;
}

// Combine kind, name, literal value, sort and children via FNV-like mixing.
std::size_t TermNodeHash::operator()(const TermNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(n.num) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(n.den) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<SortId>{}(n.sort) + 0x9e3779b9 + (h << 6) + (h >> 2);
    for (TermId c : n.children) {
        h ^= std::hash<TermId>{}(c) + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

// ── TermFactory ─────────────────────────────────────────────────────────────

TermFactory::TermFactory() {
    // Built-in sorts and the boolean constants always exist, so that the
    // first ids are stable across factories.
    bool_sort();
    int_sort();
    real_sort();
    make_true();
    make_false();
}

SortId TermFactory::intern_sort(SortNode node) {
    auto it = sort_intern_.find(node);
    if (it != sort_intern_.end()) {
        return it->second;
    }
    SortId id = static_cast<SortId>(sorts_.size());
    sorts_.push_back(std::move(node));
    sort_intern_[sorts_.back()] = id;
    return id;
}

TermId TermFactory::intern(TermNode node) {
    // Check if a structurally identical node already exists.
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    TermId id = static_cast<TermId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

void TermFactory::require(TermId id, const char* context) const {
    if (!owns(id)) {
        throw std::invalid_argument(std::string(context) +
                                    ": term id does not belong to this factory");
    }
}

// ── Sorts ───────────────────────────────────────────────────────────────────

SortId TermFactory::bool_sort() {
    SortNode n;
    n.kind = SortKind::Bool;
    return intern_sort(std::move(n));
}

SortId TermFactory::int_sort() {
    SortNode n;
    n.kind = SortKind::Int;
    return intern_sort(std::move(n));
}

SortId TermFactory::real_sort() {
    SortNode n;
    n.kind = SortKind::Real;
    return intern_sort(std::move(n));
}

SortId TermFactory::uninterpreted_sort(const std::string& name) {
    if (!is_valid_symbol(name)) {
        throw std::invalid_argument("uninterpreted_sort: invalid sort name '" +
                                    name + "'");
    }
    SortNode n;
    n.kind = SortKind::Uninterpreted;
    n.name = name;
    return intern_sort(std::move(n));
}

SortId TermFactory::array_sort(SortId domain, SortId range) {
    if (!owns_sort(domain) || !owns_sort(range)) {
        throw std::invalid_argument("array_sort: sort id does not belong to this factory");
    }
    SortNode n;
    n.kind = SortKind::Array;
    n.domain = domain;
    n.range = range;
    return intern_sort(std::move(n));
}

const SortNode& TermFactory::sort(SortId id) const {
    if (!owns_sort(id)) {
        throw std::out_of_range("TermFactory::sort: invalid SortId");
    }
    return sorts_[id];
}

bool TermFactory::owns_sort(SortId id) const noexcept {
    return id < sorts_.size();
}

std::size_t TermFactory::num_sorts() const noexcept {
    return sorts_.size();
}

std::string TermFactory::sort_to_string(SortId id) const {
    const SortNode& s = sort(id);
    switch (s.kind) {
        case SortKind::Bool:          return "Bool";
        case SortKind::Int:           return "Int";
        case SortKind::Real:          return "Real";
        case SortKind::Uninterpreted: return quote_symbol(s.name);
        case SortKind::Array:
            return "(Array " + sort_to_string(s.domain) + " " +
                   sort_to_string(s.range) + ")";
    }
    return "?";
}

// ── Constants and symbols ───────────────────────────────────────────────────

TermId TermFactory::make_true() {
    TermNode n;
    n.kind = TermKind::True;
    return intern(std::move(n));
}

TermId TermFactory::make_false() {
    TermNode n;
    n.kind = TermKind::False;
    return intern(std::move(n));
}

TermId TermFactory::make_bool(bool value) {
    return value ? make_true() : make_false();
}

TermId TermFactory::make_int(std::int64_t value) {
    TermNode n;
    n.kind = TermKind::IntLit;
    n.num = value;
    return intern(std::move(n));
}

TermId TermFactory::make_real(std::int64_t num, std::int64_t den) {
    if (den == 0) {
        throw std::invalid_argument("make_real: zero denominator");
    }
    // Negation and gcd are undefined for the most negative value.
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    if (num == kMin || den == kMin) {
        throw std::invalid_argument("make_real: numerator and denominator must be "
                                    "greater than INT64_MIN");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }
    std::int64_t g = std::gcd(num, den);
    if (g > 1) {
        num /= g;
        den /= g;
    }
    TermNode n;
    n.kind = TermKind::RealLit;
    n.num = num;
    n.den = den;
    return intern(std::move(n));
}

TermId TermFactory::make_var(const std::string& name, SortId sort) {
    if (!is_valid_symbol(name)) {
        throw std::invalid_argument("make_var: invalid symbol '" + name + "'");
    }
    if (!owns_sort(sort)) {
        throw std::invalid_argument("make_var: variable '" + name + "' has no sort");
    }
    TermNode n;
    n.kind = TermKind::Var;
    n.name = name;
    n.sort = sort;
    return intern(std::move(n));
}

TermId TermFactory::make_app(const std::string& name, const std::vector<TermId>& args) {
    if (!is_valid_symbol(name)) {
        throw std::invalid_argument("make_app: invalid symbol '" + name + "'");
    }
    for (TermId a : args) require(a, "make_app");
    TermNode n;
    n.kind = TermKind::App;
    n.name = name;
    n.children = args;
    return intern(std::move(n));
}

// ── Generic helpers ─────────────────────────────────────────────────────────

TermId TermFactory::make_unary(TermKind kind, TermId child) {
    require(child, term_kind_name(kind));
    TermNode n;
    n.kind = kind;
    n.children = {child};
    return intern(std::move(n));
}

TermId TermFactory::make_binary(TermKind kind, TermId lhs, TermId rhs) {
    require(lhs, term_kind_name(kind));
    require(rhs, term_kind_name(kind));
    TermNode n;
    n.kind = kind;
    n.children = {lhs, rhs};
    return intern(std::move(n));
}

TermId TermFactory::make_nary(TermKind kind, const std::vector<TermId>& args) {
    if (args.empty()) {
        throw std::invalid_argument(std::string(term_kind_name(kind)) +
                                    ": at least one operand required");
    }
    for (TermId a : args) require(a, term_kind_name(kind));
    TermNode n;
    n.kind = kind;
    n.children = args;
    return intern(std::move(n));
}

// ── Core ────────────────────────────────────────────────────────────────────

TermId TermFactory::make_not(TermId child) {
    return make_unary(TermKind::Not, child);
}

TermId TermFactory::make_and(const std::vector<TermId>& args) {
    if (args.empty()) return make_true();
    if (args.size() == 1) {
        require(args[0], "and");
        return args[0];
    }
    return make_nary(TermKind::And, args);
}

TermId TermFactory::make_or(const std::vector<TermId>& args) {
    if (args.empty()) return make_false();
    if (args.size() == 1) {
        require(args[0], "or");
        return args[0];
    }
    return make_nary(TermKind::Or, args);
}

TermId TermFactory::make_implies(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Implies, lhs, rhs);
}

TermId TermFactory::make_xor(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Xor, lhs, rhs);
}

TermId TermFactory::make_eq(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Eq, lhs, rhs);
}

TermId TermFactory::make_distinct(const std::vector<TermId>& args) {
    if (args.size() < 2) {
        throw std::invalid_argument("distinct: at least two operands required");
    }
    return make_nary(TermKind::Distinct, args);
}

TermId TermFactory::make_ite(TermId cond, TermId then_term, TermId else_term) {
    require(cond, "ite");
    require(then_term, "ite");
    require(else_term, "ite");
    TermNode n;
    n.kind = TermKind::Ite;
    n.children = {cond, then_term, else_term};
    return intern(std::move(n));
}

// ── Arithmetic ──────────────────────────────────────────────────────────────

TermId TermFactory::make_lt(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Lt, lhs, rhs);
}

TermId TermFactory::make_le(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Le, lhs, rhs);
}

TermId TermFactory::make_gt(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Gt, lhs, rhs);
}

TermId TermFactory::make_ge(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Ge, lhs, rhs);
}

TermId TermFactory::make_add(const std::vector<TermId>& args) {
    return make_nary(TermKind::Add, args);
}

TermId TermFactory::make_sub(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Sub, lhs, rhs);
}

TermId TermFactory::make_neg(TermId child) {
    return make_unary(TermKind::Neg, child);
}

TermId TermFactory::make_mul(const std::vector<TermId>& args) {
    return make_nary(TermKind::Mul, args);
}

TermId TermFactory::make_div(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Div, lhs, rhs);
}

TermId TermFactory::make_idiv(TermId lhs, TermId rhs) {
    return make_binary(TermKind::IntDiv, lhs, rhs);
}

TermId TermFactory::make_mod(TermId lhs, TermId rhs) {
    return make_binary(TermKind::Mod, lhs, rhs);
}

TermId TermFactory::make_abs(TermId child) {
    return make_unary(TermKind::Abs, child);
}

// ── Arrays ──────────────────────────────────────────────────────────────────

TermId TermFactory::make_select(TermId array, TermId index) {
    return make_binary(TermKind::Select, array, index);
}

TermId TermFactory::make_store(TermId array, TermId index, TermId value) {
    require(array, "store");
    require(index, "store");
    require(value, "store");
    TermNode n;
    n.kind = TermKind::Store;
    n.children = {array, index, value};
    return intern(std::move(n));
}

// ── Quantifiers ─────────────────────────────────────────────────────────────

TermId TermFactory::make_quantifier(TermKind kind, const std::vector<TermId>& bound,
                                    TermId body) {
    if (bound.empty()) {
        throw std::invalid_argument(std::string(term_kind_name(kind)) +
                                    ": no bound variables");
    }
    for (TermId v : bound) {
        require(v, term_kind_name(kind));
        if (nodes_[v].kind != TermKind::Var) {
            throw std::invalid_argument(std::string(term_kind_name(kind)) +
                                        ": bound term is not a variable");
        }
    }
    require(body, term_kind_name(kind));
    TermNode n;
    n.kind = kind;
    n.children = bound;
    n.children.push_back(body);
    return intern(std::move(n));
}

TermId TermFactory::make_forall(const std::vector<TermId>& bound, TermId body) {
    return make_quantifier(TermKind::Forall, bound, body);
}

TermId TermFactory::make_exists(const std::vector<TermId>& bound, TermId body) {
    return make_quantifier(TermKind::Exists, bound, body);
}

// ── Accessors ───────────────────────────────────────────────────────────────

const TermNode& TermFactory::node(TermId id) const {
    if (!owns(id)) {
        throw std::out_of_range("TermFactory::node: invalid TermId");
    }
    return nodes_[id];
}

bool TermFactory::owns(TermId id) const noexcept {
    return id < nodes_.size();
}

std::size_t TermFactory::size() const noexcept {
    return nodes_.size();
}

TermId TermFactory::quantifier_body(TermId id) const {
    const TermNode& n = node(id);
    if (n.kind != TermKind::Forall && n.kind != TermKind::Exists) {
        throw std::invalid_argument("quantifier_body: not a quantifier");
    }
    return n.children.back();
}

TermId TermFactory::with_children(TermId id, const std::vector<TermId>& children) {
    TermNode n = node(id);
    if (children.size() != n.children.size()) {
        throw std::invalid_argument("with_children: arity mismatch");
    }
    for (TermId c : children) require(c, "with_children");
    if (n.kind == TermKind::Forall || n.kind == TermKind::Exists) {
        for (std::size_t i = 0; i + 1 < children.size(); ++i) {
            if (nodes_[children[i]].kind != TermKind::Var) {
                throw std::invalid_argument("with_children: bound term is not a variable");
            }
        }
    }
    n.children = children;
    return intern(std::move(n));
}

// ── Metrics ─────────────────────────────────────────────────────────────────

std::uint64_t TermFactory::tree_size_memo(
        TermId id, std::unordered_map<TermId, std::uint64_t>& memo) const {
    auto it = memo.find(id);
    if (it != memo.end()) {
        return it->second;
    }
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t total = 1;
    for (TermId c : nodes_[id].children) {
        std::uint64_t s = tree_size_memo(c, memo);
        total = (s > kMax - total) ? kMax : total + s;
    }
    memo.emplace(id, total);
    return total;
}

std::uint64_t TermFactory::tree_size(TermId id) const {
    node(id);
    std::unordered_map<TermId, std::uint64_t> memo;
    return tree_size_memo(id, memo);
}

bool TermFactory::has_quantifier(TermId id) const {
    std::vector<TermId> stack{id};
    std::vector<bool>   seen(nodes_.size(), false);
    node(id);
    while (!stack.empty()) {
        TermId cur = stack.back();
        stack.pop_back();
        if (seen[cur]) continue;
        seen[cur] = true;
        const TermNode& n = nodes_[cur];
        if (n.kind == TermKind::Forall || n.kind == TermKind::Exists) {
            return true;
        }
        stack.insert(stack.end(), n.children.begin(), n.children.end());
    }
    return false;
}

// ── Pretty-print ────────────────────────────────────────────────────────────

namespace {

// Magnitude of a numeral, safe for INT64_MIN.
std::string magnitude(std::int64_t v) {
    std::uint64_t m = v < 0 ? 0 - static_cast<std::uint64_t>(v)
                            : static_cast<std::uint64_t>(v);
    return std::to_string(m);
}

}  // namespace

void TermFactory::write(TermId id, std::string& out) const {
    const TermNode& n = nodes_[id];

    switch (n.kind) {
        case TermKind::True:
        case TermKind::False:
            out += term_kind_name(n.kind);
            return;

        case TermKind::IntLit:
            if (n.num < 0) {
                out += "(- " + magnitude(n.num) + ")";
            } else {
                out += magnitude(n.num);
            }
            return;

        case TermKind::RealLit: {
            std::string text = n.den == 1
                ? magnitude(n.num) + ".0"
                : "(/ " + magnitude(n.num) + ".0 " + magnitude(n.den) + ".0)";
            out += n.num < 0 ? "(- " + text + ")" : text;
            return;
        }

        case TermKind::Var:
            out += quote_symbol(n.name);
            return;

        case TermKind::App:
            if (n.children.empty()) {
                out += quote_symbol(n.name);
                return;
            }
            out += "(" + quote_symbol(n.name);
            for (TermId c : n.children) {
                out += ' ';
                write(c, out);
            }
            out += ')';
            return;

        case TermKind::Forall:
        case TermKind::Exists: {
            out += '(';
            out += term_kind_name(n.kind);
            out += " (";
            for (std::size_t i = 0; i + 1 < n.children.size(); ++i) {
                const TermNode& v = nodes_[n.children[i]];
                if (i > 0) out += ' ';
                out += "(" + quote_symbol(v.name) + " " + sort_to_string(v.sort) + ")";
            }
            out += ") ";
            write(n.children.back(), out);
            out += ')';
            return;
        }

        default:
            out += '(';
            out += term_kind_name(n.kind);
            for (TermId c : n.children) {
                out += ' ';
                write(c, out);
            }
            out += ')';
            return;
    }
}

std::string TermFactory::to_string(TermId id) const {
    node(id);
    std::string out;
    write(id, out);
    return out;
}

}  // namespace smtembed
