// ============================================================================
// rewrite.cpp — Substitution and inline expansion of definitions
// ============================================================================
//
// Both transformations are recursive and bottom-up over the interned DAG,
// memoised per TermId so that shared sub-terms are rewritten once.
//
// IMPORTANT: copy the node's kind and children before recursing.  Recursive
// calls grow the factory and invalidate references to TermNode.
//
// ============================================================================

#include "smtembed/rewrite.hpp"

#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace smtembed {

// ============================================================================
// Substitution
// ============================================================================

namespace {

// Names of every variable occurring in `id`, bound or free.
void collect_var_names(TermId id, const TermFactory& f,
                       std::unordered_set<std::string>& names,
                       std::unordered_set<TermId>& seen) {
    if (!seen.insert(id).second) {
        return;
    }
    const TermNode& n = f.node(id);
    if (n.kind == TermKind::Var) {
        names.insert(n.name);
    }
    for (TermId c : n.children) {
        collect_var_names(c, f, names, seen);
    }
}

// Variables occurring free in `id`.
void collect_free_vars(TermId id, const TermFactory& f,
                       std::unordered_set<TermId>& bound,
                       std::unordered_set<TermId>& free) {
    const TermNode& n = f.node(id);
    if (n.kind == TermKind::Var) {
        if (!bound.count(id)) free.insert(id);
        return;
    }
    if (n.kind == TermKind::Forall || n.kind == TermKind::Exists) {
        std::unordered_set<TermId> inner = bound;
        for (std::size_t i = 0; i + 1 < n.children.size(); ++i) {
            inner.insert(n.children[i]);
        }
        collect_free_vars(n.children.back(), f, inner, free);
        return;
    }
    for (TermId c : n.children) {
        collect_free_vars(c, f, bound, free);
    }
}

// `base!k` for the smallest k >= 1 not in `taken`.
std::string fresh_name(const std::string& base,
                       std::unordered_set<std::string>& taken) {
    for (unsigned k = 1;; ++k) {
        std::string candidate = base + "!" + std::to_string(k);
        if (taken.insert(candidate).second) {
            return candidate;
        }
    }
}

TermId substitute_memo(TermId id, const Substitution& sigma, TermFactory& f,
                       std::unordered_map<TermId, TermId>& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) {
        return hit->second;
    }

    TermKind kind = f.node(id).kind;
    std::vector<TermId> children = f.node(id).children;
    TermId result = id;

    if (kind == TermKind::Var) {
        auto it = sigma.find(id);
        if (it != sigma.end()) result = it->second;
    } else if (kind == TermKind::Forall || kind == TermKind::Exists) {
        // Bound variables shadow the substitution inside the body.
        Substitution inner = sigma;
        for (std::size_t i = 0; i + 1 < children.size(); ++i) {
            inner.erase(children[i]);
        }

        // A bound variable that occurs free in a replacement would capture
        // it: rename the binder first.
        std::unordered_set<TermId> range_free;
        for (const auto& [from, to] : inner) {
            std::unordered_set<TermId> none;
            collect_free_vars(to, f, none, range_free);
        }
        std::unordered_set<std::string> taken;
        bool names_collected = false;
        for (std::size_t i = 0; i + 1 < children.size(); ++i) {
            TermId v = children[i];
            if (!range_free.count(v)) continue;
            if (!names_collected) {
                std::unordered_set<TermId> seen;
                collect_var_names(id, f, taken, seen);
                for (const auto& [from, to] : inner) {
                    collect_var_names(to, f, taken, seen);
                }
                names_collected = true;
            }
            std::string name = f.node(v).name;
            SortId sort = f.node(v).sort;
            TermId renamed = f.make_var(fresh_name(name, taken), sort);
            inner[v] = renamed;
            children[i] = renamed;
        }

        std::unordered_map<TermId, TermId> inner_memo;
        children.back() = substitute_memo(children.back(), inner, f, inner_memo);
        result = f.with_children(id, children);
    } else if (!children.empty()) {
        for (TermId& c : children) {
            c = substitute_memo(c, sigma, f, memo);
        }
        result = f.with_children(id, children);
    }

    memo.emplace(id, result);
    return result;
}

}  // namespace

TermId substitute(TermId id, const Substitution& replacements, TermFactory& f) {
    if (replacements.empty()) {
        return id;
    }
    std::unordered_map<TermId, TermId> memo;
    return substitute_memo(id, replacements, f, memo);
}

// ============================================================================
// Inlining
// ============================================================================

namespace {

struct Inliner {
    const DefinitionTable&              table;
    TermFactory&                        f;
    std::unordered_map<TermId, TermId>  memo;
    std::unordered_map<std::string, TermId> inlined_bodies;
    std::unordered_set<std::string>     in_progress;

    // Body of a definition with its own applications already inlined.
    TermId body_of(const std::string& name, const DefinitionForm& def) {
        auto it = inlined_bodies.find(name);
        if (it != inlined_bodies.end()) {
            return it->second;
        }
        if (!in_progress.insert(name).second) {
            throw std::runtime_error("inline_definitions: '" + name +
                                     "' is defined recursively");
        }
        TermId body = run(def.body);
        in_progress.erase(name);
        inlined_bodies.emplace(name, body);
        return body;
    }

    TermId run(TermId id) {
        auto hit = memo.find(id);
        if (hit != memo.end()) {
            return hit->second;
        }

        TermKind kind = f.node(id).kind;
        std::string name = f.node(id).name;
        std::vector<TermId> children = f.node(id).children;
        TermId result = id;

        if (!children.empty()) {
            // Quantifier bound variables are Var leaves, rewriting them is a
            // no-op, so every child can be processed the same way.
            for (TermId& c : children) c = run(c);
            result = f.with_children(id, children);
        }

        if (kind == TermKind::App) {
            auto def = table.find(name);
            if (def != table.end() && def->second.params.size() == children.size()) {
                TermId body = body_of(name, def->second);
                Substitution sigma;
                for (std::size_t i = 0; i < children.size(); ++i) {
                    const Param& p = def->second.params[i];
                    sigma.emplace(f.make_var(p.name, p.sort), children[i]);
                }
                result = substitute(body, sigma, f);
            }
        }

        memo.emplace(id, result);
        return result;
    }
};

}  // namespace

TermId inline_definitions(TermId id, const DefinitionTable& table, TermFactory& f) {
    Inliner inliner{table, f, {}, {}, {}};
    return inliner.run(id);
}

}  // namespace smtembed
