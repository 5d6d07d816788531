// ============================================================================
// define_fun.cpp — Function-definition expansion
// ============================================================================

#include "smtembed/define_fun.hpp"
#include "smtembed/utils.hpp"

#include <limits>
#include <unordered_set>

namespace smtembed {

// ── match_params ────────────────────────────────────────────────────────────
// The empty shape is tried first; everything else must be a list of
// well-formed (name, sort) pairs.

ParamShape match_params(const DefinitionForm& form, const TermFactory& factory) {
    if (!is_valid_symbol(form.name)) {
        throw StructuralError("define-fun: invalid function name '" + form.name + "'");
    }
    if (!factory.owns_sort(form.result)) {
        throw StructuralError("define-fun " + form.name + ": missing result sort");
    }
    if (!factory.owns(form.body)) {
        throw StructuralError("define-fun " + form.name + ": missing body");
    }

    if (form.params.empty()) {
        return EmptyParams{};
    }

    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < form.params.size(); ++i) {
        const Param& p = form.params[i];
        std::string where = "define-fun " + form.name + ": parameter " +
                            std::to_string(i + 1);
        if (!is_valid_symbol(p.name)) {
            throw StructuralError(where + " has an invalid name '" + p.name + "'");
        }
        if (!factory.owns_sort(p.sort)) {
            throw StructuralError(where + " ('" + p.name + "') is missing its sort");
        }
        if (!seen.insert(p.name).second) {
            throw StructuralError(where + ": duplicate parameter name '" + p.name + "'");
        }
    }
    return NonEmptyParams{form.params};
}

// ── expand_definition ───────────────────────────────────────────────────────

Expansion expand_definition(const DefinitionForm& form, TermFactory& factory) {
    ParamShape shape = match_params(form, factory);

    if (std::holds_alternative<EmptyParams>(shape)) {
        // A constant: a quantifier over no variables would be degenerate.
        TermId self = factory.make_app(form.name, {});
        return Expansion{
            Command::declare_fun(form.name, {}, form.result),
            Command::assert_formula(factory.make_eq(self, form.body))};
    }

    const auto& params = std::get<NonEmptyParams>(shape).params;
    std::vector<SortId> arg_sorts;
    std::vector<TermId> bound;
    arg_sorts.reserve(params.size());
    bound.reserve(params.size());
    for (const Param& p : params) {
        arg_sorts.push_back(p.sort);
        bound.push_back(factory.make_var(p.name, p.sort));
    }

    TermId call = factory.make_app(form.name, bound);
    TermId axiom = factory.make_forall(bound, factory.make_eq(call, form.body));
    return Expansion{
        Command::declare_fun(form.name, std::move(arg_sorts), form.result),
        Command::assert_formula(axiom)};
}

// ── expansion_size / expansion_to_string ────────────────────────────────────

std::uint64_t expansion_size(const Expansion& expansion, const TermFactory& factory) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t d = command_size(expansion.declaration, factory);
    std::uint64_t a = command_size(expansion.assertion, factory);
    return a > kMax - d ? kMax : a + d;
}

std::string expansion_to_string(const Expansion& expansion, const TermFactory& factory) {
    return command_to_string(expansion.declaration, factory) + "\n" +
           command_to_string(expansion.assertion, factory);
}

// ── define_fun ──────────────────────────────────────────────────────────────

Expansion define_fun(CommandSink& sink, const DefinitionForm& form, TermFactory& factory) {
    Expansion e = expand_definition(form, factory);
    sink.declare_fun(e.declaration.name, e.declaration.arg_sorts,
                     e.declaration.result_sort);
    sink.assert_formula(e.assertion.term);
    return e;
}

Expansion define_fun(CommandSink& sink, const std::string& name,
                     const std::vector<Param>& params, SortId result,
                     const Term& body) {
    if (!body.valid()) {
        throw StructuralError("define-fun " + name + ": missing body");
    }
    DefinitionForm form{name, params, result, body.id()};
    return define_fun(sink, form, body.factory());
}

}  // namespace smtembed
