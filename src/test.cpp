// ============================================================================
// test.cpp — Self-test suite for the define-fun expansion tool
// ============================================================================
//
// Contains tests covering:
//   - Term interning, sorts and SMT-LIB rendering (literals, quoting)
//   - Renamed operator layer (smt::, Term operators)
//   - Primitive command rendering and sizes
//   - define-fun expansion: documentation scenarios, idempotence,
//     arity and argument order, quantifier presence, structural errors
//   - Command sink ordering and failure propagation
//   - Substitution and inline expansion
//   - Z3 session: definitions under check-sat, scoping, errors, models
//   - Benchmark output and command-line parsing
//
// ============================================================================

#include "smtembed/test.hpp"
#include "smtembed/ast.hpp"
#include "smtembed/benchmark.hpp"
#include "smtembed/builtins.hpp"
#include "smtembed/cli.hpp"
#include "smtembed/command.hpp"
#include "smtembed/define_fun.hpp"
#include "smtembed/rewrite.hpp"
#include "smtembed/session.hpp"
#include "smtembed/utils.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace smtembed {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Records every primitive call in order, as SMT-LIB text.
class RecordingSink : public CommandSink {
public:
    explicit RecordingSink(const TermFactory& f) : f_(f) {}

    void declare_fun(const std::string& name, const std::vector<SortId>& arg_sorts,
                     SortId result_sort) override {
        calls.push_back(command_to_string(
            Command::declare_fun(name, arg_sorts, result_sort), f_));
    }

    void assert_formula(TermId formula) override {
        calls.push_back(command_to_string(Command::assert_formula(formula), f_));
    }

    std::vector<std::string> calls;

private:
    const TermFactory& f_;
};

// Accepts declarations, rejects every assertion.
class RejectingSink : public CommandSink {
public:
    void declare_fun(const std::string& name, const std::vector<SortId>&,
                     SortId) override {
        declared.push_back(name);
    }

    void assert_formula(TermId) override {
        throw std::runtime_error("assertion rejected");
    }

    std::vector<std::string> declared;
};

DefinitionForm max_form(TermFactory& f) {
    SortId Int = f.int_sort();
    TermId a = f.make_var("a", Int);
    TermId b = f.make_var("b", Int);
    return {"max", {{"a", Int}, {"b", Int}}, Int,
            f.make_ite(f.make_gt(a, b), a, b)};
}

DefinitionForm min_form(TermFactory& f) {
    SortId Int = f.int_sort();
    TermId a = f.make_var("a", Int);
    TermId b = f.make_var("b", Int);
    return {"min", {{"a", Int}, {"b", Int}}, Int,
            f.make_ite(f.make_lt(a, b), a, b)};
}

DefinitionForm clamp_form(TermFactory& f) {
    SortId Int = f.int_sort();
    TermId x = f.make_var("x", Int);
    TermId lo = f.make_var("lo", Int);
    TermId hi = f.make_var("hi", Int);
    return {"clamp", {{"x", Int}, {"lo", Int}, {"hi", Int}}, Int,
            f.make_app("max", {lo, f.make_app("min", {x, hi})})};
}

DefinitionForm ten_form(TermFactory& f) {
    return {"ten", {}, f.int_sort(), f.make_int(10)};
}

Options parse(const std::vector<std::string>& words) {
    std::vector<std::string> storage = {"smtembed"};
    storage.insert(storage.end(), words.begin(), words.end());
    std::vector<char*> argv;
    for (std::string& w : storage) argv.push_back(w.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(storage.size()), argv.data());
}

}  // namespace

// ============================================================================
// Symbol Tests
// ============================================================================

static void test_symbol_quoting(TestContext& ctx) {
    ctx.check(is_simple_symbol("max"), "max is simple");
    ctx.check(is_simple_symbol("x!1"), "x!1 is simple");
    ctx.check(!is_simple_symbol("1x"), "leading digit is not simple");
    ctx.check(!is_simple_symbol("forall"), "reserved word is not simple");
    ctx.check(!is_simple_symbol("a b"), "space is not simple");
    ctx.check(is_valid_symbol("a b"), "space can be quoted");
    ctx.check(!is_valid_symbol("a|b"), "pipe cannot be quoted");
    ctx.check(!is_valid_symbol(""), "empty symbol is invalid");
    ctx.check_eq(quote_symbol("a b"), "|a b|", "quoted symbol");
    ctx.check_eq(quote_symbol("lo"), "lo", "simple symbol unquoted");
    ctx.check_eq(join({"Int", "Real"}, " "), "Int Real", "join");
}

// ============================================================================
// Term Factory Tests
// ============================================================================

static void test_term_interning(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    ctx.check(f.make_int(5) == f.make_int(5), "equal literals share an id");
    ctx.check(f.make_var("x", Int) == f.make_var("x", Int), "equal vars share an id");
    ctx.check(f.make_var("x", Int) != f.make_var("x", f.real_sort()),
              "sort distinguishes vars");
    ctx.check(f.make_real(2, 4) == f.make_real(1, 2), "reals are normalised");
    ctx.check(f.make_real(1, -2) == f.make_real(-1, 2), "denominator sign normalised");
    ctx.check(f.uninterpreted_sort("U") == f.uninterpreted_sort("U"), "sorts interned");
    ctx.check(f.array_sort(Int, Int) != f.array_sort(Int, f.bool_sort()),
              "array sorts distinguished by range");

    TermId p = f.make_var("p", f.bool_sort());
    ctx.check(f.make_and({}) == f.make_true(), "empty and is true");
    ctx.check(f.make_or({}) == f.make_false(), "empty or is false");
    ctx.check(f.make_and({p}) == p, "unary and collapses");
}

static void test_term_rendering(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    TermId x = f.make_var("x", Int);

    ctx.check_eq(f.to_string(f.make_int(42)), "42", "int literal");
    ctx.check_eq(f.to_string(f.make_int(-5)), "(- 5)", "negative int literal");
    ctx.check_eq(f.to_string(f.make_real(2)), "2.0", "integral real");
    ctx.check_eq(f.to_string(f.make_real(1, 3)), "(/ 1.0 3.0)", "rational real");
    ctx.check_eq(f.to_string(f.make_real(-1, 3)), "(- (/ 1.0 3.0))", "negative real");
    ctx.check_eq(f.to_string(f.make_app("ten", {})), "ten", "nullary application");
    ctx.check_eq(f.to_string(f.make_app("my fun", {x})), "(|my fun| x)",
                 "quoted application");
    ctx.check_eq(f.to_string(f.make_implies(f.make_true(), f.make_false())),
                 "(=> true false)", "implication");
    ctx.check_eq(f.to_string(f.make_idiv(x, f.make_int(2))), "(div x 2)", "integer div");
    ctx.check_eq(f.to_string(f.make_neg(x)), "(- x)", "negation");
    ctx.check_eq(f.sort_to_string(f.array_sort(Int, f.bool_sort())),
                 "(Array Int Bool)", "array sort");

    TermId y = f.make_var("y", Int);
    TermId q = f.make_exists({x, y}, f.make_distinct({x, y}));
    ctx.check_eq(f.to_string(q), "(exists ((x Int) (y Int)) (distinct x y))",
                 "exists rendering");
}

static void test_term_metrics(TestContext& ctx) {
    TermFactory f;
    TermId x = f.make_var("x", f.int_sort());
    TermId sum = f.make_add({x, x});
    ctx.check(f.tree_size(x) == 1, "leaf size");
    ctx.check(f.tree_size(sum) == 3, "shared children counted per occurrence");
    ctx.check(f.tree_size(f.make_mul({sum, sum})) == 7, "tree size of shared DAG");

    TermId q = f.make_forall({x}, f.make_ge(x, x));
    ctx.check(f.has_quantifier(q), "forall detected");
    ctx.check(f.has_quantifier(f.make_not(q)), "nested forall detected");
    ctx.check(!f.has_quantifier(sum), "no quantifier");
    ctx.check(f.quantifier_body(q) == f.make_ge(x, x), "quantifier body");
}

static void test_term_misuse(TestContext& ctx) {
    TermFactory f;
    TermId x = f.make_var("x", f.int_sort());
    ctx.check_throws<std::invalid_argument>([&] { f.make_distinct({x}); },
                                            "distinct of one operand");
    ctx.check_throws<std::invalid_argument>([&] { f.make_forall({}, f.make_true()); },
                                            "forall without variables");
    ctx.check_throws<std::invalid_argument>(
        [&] { f.make_forall({f.make_int(1)}, f.make_true()); },
        "forall over a non-variable");
    ctx.check_throws<std::invalid_argument>([&] { f.make_real(1, 0); },
                                            "zero denominator");
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    ctx.check_throws<std::invalid_argument>([&] { f.make_real(kMin); },
                                            "most negative numerator");
    ctx.check_throws<std::invalid_argument>([&] { f.make_real(1, kMin); },
                                            "most negative denominator");
    ctx.check_eq(f.to_string(f.make_real(kMin + 1, -1)), "9223372036854775807.0",
                 "largest representable magnitude");
    ctx.check_throws<std::invalid_argument>([&] { f.make_var("x", kInvalidSort); },
                                            "variable without sort");
    ctx.check_throws<std::invalid_argument>([&] { f.make_not(kInvalidTerm); },
                                            "foreign child id");
    ctx.check_throws<std::out_of_range>([&] { f.node(kInvalidTerm); },
                                        "node of invalid id");
}

// ============================================================================
// Operator Layer Tests
// ============================================================================

static void test_builtin_operators(TestContext& ctx) {
    TermFactory f;
    Term a = smt::int_var(f, "a");
    Term b = smt::int_var(f, "b");
    Term p = smt::bool_var(f, "p");

    ctx.check_eq(smt::ite(a > b, a, b).to_string(), "(ite (> a b) a b)", "ite/gt");
    ctx.check_eq((a + 1).to_string(), "(+ a 1)", "add literal");
    ctx.check_eq((2 * a).to_string(), "(* 2 a)", "scale");
    ctx.check_eq((a - b).to_string(), "(- a b)", "subtract");
    ctx.check_eq((-a).to_string(), "(- a)", "unary minus");
    ctx.check_eq((!p || p).to_string(), "(or (not p) p)", "boolean connectives");
    ctx.check_eq((a <= 3 && a >= 0).to_string(), "(and (<= a 3) (>= a 0))",
                 "range conjunction");
    ctx.check_eq(smt::and_({p}).to_string(), "p", "unary and_");
    ctx.check_eq(smt::xor_(p, smt::not_(p)).to_string(), "(xor p (not p))", "xor_");
    ctx.check_eq(smt::app(f, "max", {a, b}).to_string(), "(max a b)", "application");
    ctx.check_eq(smt::mod(a, b).to_string(), "(mod a b)", "mod");
    ctx.check_eq(smt::abs(a).to_string(), "(abs a)", "abs");

    SortId arr = f.array_sort(f.int_sort(), f.int_sort());
    Term m = smt::var(f, "m", arr);
    ctx.check_eq(smt::select(smt::store(m, a, b), a).to_string(),
                 "(select (store m a b) a)", "array operators");
    ctx.check_eq(smt::forall({a}, a >= a).to_string(), "(forall ((a Int)) (>= a a))",
                 "forall helper");
}

static void test_builtin_factory_mismatch(TestContext& ctx) {
    TermFactory f1;
    TermFactory f2;
    Term a = smt::int_var(f1, "a");
    Term b = smt::int_var(f2, "b");
    ctx.check_throws<std::invalid_argument>([&] { a + b; }, "operands from two factories");
    ctx.check_throws<std::invalid_argument>([&] { smt::app(f1, "g", {b}); },
                                            "argument from another factory");
    Term empty;
    ctx.check(!empty.valid(), "default term is empty");
    ctx.check_throws<std::invalid_argument>([&] { empty.factory(); },
                                            "factory of empty term");
}

// ============================================================================
// Command Tests
// ============================================================================

static void test_command_rendering(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    ctx.check_eq(command_to_string(Command::set_logic("ALL"), f), "(set-logic ALL)",
                 "set-logic");
    ctx.check_eq(command_to_string(Command::set_option(":timeout", "100"), f),
                 "(set-option :timeout 100)", "set-option strips colon");
    ctx.check_eq(command_to_string(Command::declare_sort("U"), f), "(declare-sort U 0)",
                 "declare-sort");
    ctx.check_eq(command_to_string(Command::declare_fun("g", {Int, f.real_sort()}, Int), f),
                 "(declare-fun g (Int Real) Int)", "declare-fun");
    ctx.check_eq(command_to_string(Command::declare_fun("c", {}, f.bool_sort()), f),
                 "(declare-fun c () Bool)", "declare-fun constant");
    ctx.check_eq(command_to_string(Command::assert_formula(f.make_true()), f),
                 "(assert true)", "assert");
    ctx.check_eq(command_to_string(Command::push(2), f), "(push 2)", "push");
    ctx.check_eq(command_to_string(Command::pop(), f), "(pop 1)", "pop");
    ctx.check_eq(command_to_string(Command::check_sat(), f), "(check-sat)", "check-sat");
    ctx.check_eq(command_to_string(Command::get_model(), f), "(get-model)", "get-model");

    ctx.check(command_size(Command::declare_fun("g", {Int, Int}, Int), f) == 4,
              "declaration size");
    TermId x = f.make_var("x", Int);
    ctx.check(command_size(Command::assert_formula(f.make_ge(x, x)), f) == 4,
              "assertion size");
    ctx.check(Command::push(1) == Command::push(), "command equality");
    ctx.check(Command::push(1) != Command::pop(1), "command inequality");
}

// ============================================================================
// Expansion Tests
// ============================================================================

static void test_expand_max(TestContext& ctx) {
    TermFactory f;
    Expansion e = expand_definition(max_form(f), f);
    ctx.check(e.declaration.kind == CommandKind::DeclareFun, "first command declares");
    ctx.check(e.assertion.kind == CommandKind::Assert, "second command asserts");
    ctx.check_eq(expansion_to_string(e, f),
                 "(declare-fun max (Int Int) Int)\n"
                 "(assert (forall ((a Int) (b Int)) (= (max a b) (ite (> a b) a b))))",
                 "max expansion");
}

static void test_expand_constant(TestContext& ctx) {
    TermFactory f;
    Expansion e = expand_definition(ten_form(f), f);
    ctx.check_eq(expansion_to_string(e, f),
                 "(declare-fun ten () Int)\n(assert (= ten 10))", "ten expansion");
    ctx.check(!f.has_quantifier(e.assertion.term), "constant has no quantifier");
    ctx.check(std::holds_alternative<EmptyParams>(match_params(ten_form(f), f)),
              "empty shape");
}

static void test_expand_clamp(TestContext& ctx) {
    TermFactory f;
    Expansion e = expand_definition(clamp_form(f), f);
    ctx.check_eq(expansion_to_string(e, f),
                 "(declare-fun clamp (Int Int Int) Int)\n"
                 "(assert (forall ((x Int) (lo Int) (hi Int)) "
                 "(= (clamp x lo hi) (max lo (min x hi)))))",
                 "clamp expansion");

    // Callees are referenced, not substituted: the size of clamp's
    // expansion does not depend on how big max's body is.
    TermFactory g;
    SortId Int = g.int_sort();
    TermId a = g.make_var("a", Int);
    TermId b = g.make_var("b", Int);
    TermId big = g.make_ite(g.make_gt(a, b), g.make_add({a, a, a, a}), g.make_mul({b, b}));
    expand_definition({"max", {{"a", Int}, {"b", Int}}, Int, big}, g);
    ctx.check(expansion_size(expand_definition(clamp_form(g), g), g) ==
              expansion_size(e, f), "expansion size independent of callee bodies");
}

static void test_expand_idempotent(TestContext& ctx) {
    TermFactory f;
    DefinitionForm form = clamp_form(f);
    Expansion first = expand_definition(form, f);
    Expansion second = expand_definition(form, f);
    ctx.check(first == second, "expanding twice yields identical commands");
    ctx.check_eq(expansion_to_string(second, f), expansion_to_string(first, f),
                 "identical text");
}

static void test_expand_arity(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    for (int n = 0; n <= 5; ++n) {
        DefinitionForm form;
        form.name = "g" + std::to_string(n);
        form.result = Int;
        TermId body = f.make_int(0);
        for (int i = 0; i < n; ++i) {
            std::string p = "p" + std::to_string(i);
            form.params.push_back({p, Int});
            body = f.make_add({body, f.make_var(p, Int)});
        }
        form.body = body;

        Expansion e = expand_definition(form, f);
        std::string tag = "N=" + std::to_string(n);
        ctx.check(e.declaration.arg_sorts.size() == static_cast<std::size_t>(n),
                  tag + ": declared arity");
        const TermNode& a = f.node(e.assertion.term);
        if (n == 0) {
            ctx.check(a.kind == TermKind::Eq, tag + ": plain equation");
        } else {
            ctx.check(a.kind == TermKind::Forall, tag + ": universal quantifier");
            ctx.check(a.children.size() == static_cast<std::size_t>(n) + 1,
                      tag + ": one bound variable per parameter");
            const TermNode& eq = f.node(f.quantifier_body(e.assertion.term));
            ctx.check(eq.kind == TermKind::Eq, tag + ": quantified equation");
            ctx.check(f.node(eq.children[0]).children.size() == static_cast<std::size_t>(n),
                      tag + ": application arity");
        }
    }
}

static void test_expand_argument_order(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    SortId Real = f.real_sort();
    SortId Bool = f.bool_sort();
    TermId a = f.make_var("a", Int);
    DefinitionForm form{"g", {{"z", Real}, {"a", Int}, {"m", Bool}}, Int, a};
    Expansion e = expand_definition(form, f);
    ctx.check(e.declaration.arg_sorts == std::vector<SortId>({Real, Int, Bool}),
              "declared sorts in parameter order");
    ctx.check_eq(expansion_to_string(e, f),
                 "(declare-fun g (Real Int Bool) Int)\n"
                 "(assert (forall ((z Real) (a Int) (m Bool)) (= (g z a m) a)))",
                 "bound variables and arguments in parameter order");
}

static void test_expand_structural_errors(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    TermId zero = f.make_int(0);

    auto rejects = [&](DefinitionForm form, const std::string& what) {
        RecordingSink sink(f);
        ctx.check_throws<StructuralError>([&] { define_fun(sink, form, f); }, what);
        ctx.check(sink.calls.empty(), what + ": nothing issued");
    };

    rejects({"", {}, Int, zero}, "empty name");
    rejects({"a|b", {}, Int, zero}, "unquotable name");
    rejects({"g", {}, kInvalidSort, zero}, "missing result sort");
    rejects({"g", {}, Int, kInvalidTerm}, "missing body");
    rejects({"g", {{"x", kInvalidSort}}, Int, zero}, "parameter without sort");
    rejects({"g", {{"", Int}}, Int, zero}, "parameter without name");
    rejects({"g", {{"x", Int}, {"x", Int}}, Int, zero}, "duplicate parameter");

    RecordingSink sink(f);
    ctx.check_throws<StructuralError>(
        [&] { define_fun(sink, "g", {}, Int, Term()); }, "empty body handle");

    try {
        expand_definition({"g", {{"x", Int}, {"y", kInvalidSort}}, Int, zero}, f);
        ctx.check(false, "missing parameter sort accepted");
    } catch (const StructuralError& e) {
        ctx.check(std::string(e.what()).find("parameter 2") != std::string::npos,
                  "message names the parameter");
    }
}

// ============================================================================
// Command Sink Tests
// ============================================================================

static void test_define_fun_sink_order(TestContext& ctx) {
    TermFactory f;
    RecordingSink sink(f);
    Expansion e = define_fun(sink, max_form(f), f);
    ctx.check(sink.calls.size() == 2, "exactly two primitive calls");
    if (sink.calls.size() == 2) {
        ctx.check_eq(sink.calls[0], command_to_string(e.declaration, f),
                     "declaration first");
        ctx.check_eq(sink.calls[1], command_to_string(e.assertion, f),
                     "assertion second");
    }

    Term a = smt::int_var(f, "a");
    define_fun(sink, "twice", {{"a", f.int_sort()}}, f.int_sort(), a + a);
    ctx.check(sink.calls.size() == 4, "term overload issues two calls");
}

static void test_define_fun_partial_effect(TestContext& ctx) {
    TermFactory f;
    RejectingSink sink;
    try {
        define_fun(sink, ten_form(f), f);
        ctx.check(false, "assertion failure swallowed");
    } catch (const std::runtime_error& e) {
        ctx.check_eq(e.what(), "assertion rejected", "sink error propagates unchanged");
    }
    ctx.check(sink.declared.size() == 1 && sink.declared[0] == "ten",
              "declaration left in place");
}

// ============================================================================
// Rewriting Tests
// ============================================================================

static void test_substitute(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    TermId x = f.make_var("x", Int);
    TermId y = f.make_var("y", Int);

    TermId t = f.make_add({x, f.make_int(1)});
    ctx.check_eq(f.to_string(substitute(t, {{x, f.make_int(5)}}, f)), "(+ 5 1)",
                 "replace variable");
    ctx.check(substitute(t, {}, f) == t, "empty substitution");

    TermId q = f.make_forall({x}, f.make_gt(x, y));
    TermId r = substitute(f.make_and({f.make_ge(x, y), q}),
                          {{x, f.make_int(0)}, {y, f.make_int(1)}}, f);
    ctx.check_eq(f.to_string(r), "(and (>= 0 1) (forall ((x Int)) (> x 1)))",
                 "bound variable shadows the substitution");

    TermId eq = f.make_forall({y}, f.make_eq(x, y));
    ctx.check_eq(f.to_string(substitute(eq, {{x, y}}, f)),
                 "(forall ((y!1 Int)) (= y y!1))", "binder renamed to avoid capture");

    TermId y1 = f.make_var("y!1", Int);
    TermId both = f.make_forall({y}, f.make_eq(x, f.make_add({y, y1})));
    ctx.check_eq(f.to_string(substitute(both, {{x, y}}, f)),
                 "(forall ((y!2 Int)) (= y (+ y!2 y!1)))", "fresh name skips used names");

    // Inlining a definition whose body binds the caller's argument name.
    DefinitionTable table;
    table.emplace("above", DefinitionForm{"above", {{"x", Int}}, f.bool_sort(),
                                          f.make_forall({y}, f.make_ge(x, y))});
    TermId call = f.make_app("above", {y});
    ctx.check_eq(f.to_string(inline_definitions(call, table, f)),
                 "(forall ((y!1 Int)) (>= y y!1))", "inlining avoids capture");
}

static void test_inline_growth(TestContext& ctx) {
    TermFactory f;
    std::vector<DefinitionForm> defs = doubling_chain(10, f);
    DefinitionTable table;
    for (const DefinitionForm& d : defs) table.emplace(d.name, d);

    TermId goal2 = f.make_app("f2", {f.make_int(0)});
    ctx.check_eq(f.to_string(inline_definitions(goal2, table, f)),
                 "(+ (+ (+ (+ 0 1) 1) 1) 1)", "depth 2 inlined");

    TermId goal10 = f.make_app("f10", {f.make_int(0)});
    ctx.check(f.tree_size(inline_definitions(goal10, table, f)) == 2049,
              "inlined size doubles per level");

    std::uint64_t s1 = expansion_size(expand_definition(defs[1], f), f);
    std::uint64_t s10 = expansion_size(expand_definition(defs[10], f), f);
    ctx.check(s1 == s10, "axiomatized size constant per level");

    TermId other = f.make_app("g", {f.make_int(0)});
    ctx.check(inline_definitions(other, table, f) == other, "unknown applications kept");
}

static void test_inline_recursion(TestContext& ctx) {
    TermFactory f;
    SortId Int = f.int_sort();
    TermId x = f.make_var("x", Int);
    DefinitionTable table;
    table.emplace("loop", DefinitionForm{"loop", {{"x", Int}}, Int,
                                         f.make_app("loop", {x})});
    ctx.check_throws<std::runtime_error>(
        [&] { inline_definitions(f.make_app("loop", {f.make_int(1)}), table, f); },
        "recursive definition detected");
}

// ============================================================================
// Z3 Session Tests
// ============================================================================

static void test_session_max(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    define_fun(s, max_form(f), f);
    ctx.check(s.is_declared("max"), "max declared");
    ctx.check(s.num_assertions() == 1, "one defining assertion");

    Term m = smt::app(f, "max", {smt::int_val(f, 3), smt::int_val(f, 5)});
    s.push();
    s.assert_formula(!smt::eq(m, smt::int_val(f, 5)));
    ctx.check(s.check_sat() == CheckResult::Unsat, "max(3, 5) = 5");
    s.pop();

    s.push();
    s.assert_formula(smt::eq(m, smt::int_val(f, 5)));
    ctx.check(s.check_sat() != CheckResult::Unsat, "max(3, 5) = 5 is consistent");
    s.pop();
}

static void test_session_constant(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    define_fun(s, ten_form(f), f);
    s.assert_formula(smt::app(f, "ten") > 10);
    ctx.check(s.check_sat() == CheckResult::Unsat, "ten > 10 is unsat");
}

static void test_session_clamp(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    define_fun(s, max_form(f), f);
    define_fun(s, min_form(f), f);
    define_fun(s, clamp_form(f), f);

    Term c = smt::app(f, "clamp", {smt::int_val(f, 15), smt::int_val(f, 0),
                                   smt::int_val(f, 10)});
    s.assert_formula(!smt::eq(c, smt::int_val(f, 10)));
    ctx.check(s.check_sat() == CheckResult::Unsat, "clamp(15, 0, 10) = 10");
}

static void test_session_sort_error(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    DefinitionForm bad{"bad", {}, f.int_sort(), f.make_true()};
    ctx.check_throws<SolverError>([&] { define_fun(s, bad, f); },
                                  "Int-valued constant with Bool body");
    ctx.check(s.is_declared("bad"), "declaration stays after failed assertion");
    ctx.check(s.num_assertions() == 0, "no assertion added");

    ctx.check_throws<SolverError>([&] { s.assert_formula(f.make_int(1)); },
                                  "non-Boolean assertion");
}

static void test_session_redeclaration(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    define_fun(s, max_form(f), f);
    try {
        define_fun(s, max_form(f), f);
        ctx.check(false, "redeclaration accepted");
    } catch (const SolverError& e) {
        ctx.check(std::string(e.what()).find("already declared") != std::string::npos,
                  "redeclaration message");
    }
    ctx.check(s.num_assertions() == 1, "second definition asserted nothing");
}

static void test_session_scopes(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    s.push();
    ctx.check(s.num_scopes() == 1, "one scope open");
    define_fun(s, ten_form(f), f);
    s.declare_sort("U");
    ctx.check(s.is_declared("ten") && s.is_sort_declared("U"), "visible inside scope");
    s.pop();
    ctx.check(!s.is_declared("ten"), "function removed by pop");
    ctx.check(!s.is_sort_declared("U"), "sort removed by pop");
    ctx.check(s.num_assertions() == 0, "assertion removed by pop");

    define_fun(s, ten_form(f), f);
    ctx.check(s.is_declared("ten"), "name reusable after pop");
    ctx.check_throws<SolverError>([&] { s.pop(); }, "pop below base level");
}

static void test_session_models(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    ctx.check_throws<SolverError>([&] { s.get_model(); }, "no model before check-sat");

    s.declare_const("x", f.int_sort());
    Term x = smt::app(f, "x");
    s.assert_formula(x > 3 && x < 5);
    ctx.check(s.check_sat() == CheckResult::Sat, "4 is a witness");

    std::vector<ModelEntry> model = s.get_model();
    ctx.check(model.size() == 1, "one constant in the model");
    if (!model.empty()) {
        ctx.check_eq(model[0].name, "x", "model constant name");
        ctx.check_eq(model[0].value, "4", "model constant value");
    }
    ctx.check_eq(s.eval((x + 1).id()), "5", "evaluate in model");

    s.assert_formula(x > 4);
    ctx.check_throws<SolverError>([&] { s.get_model(); }, "model invalidated by assert");
    ctx.check(s.check_sat() == CheckResult::Unsat, "no witness above 4");
    ctx.check_throws<SolverError>([&] { s.get_model(); }, "no model after unsat");
}

static void test_session_errors(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    ctx.check_throws<SolverError>(
        [&] { s.assert_formula(smt::app(f, "nope", {smt::int_val(f, 1)}) > 0); },
        "unknown function");
    ctx.check_throws<SolverError>(
        [&] { s.declare_fun("e", {}, f.uninterpreted_sort("U")); }, "undeclared sort");
    ctx.check_throws<SolverError>([&] { s.set_option("no-such-option", "1"); },
                                  "unknown option");
    s.set_option(":timeout", "5000");
    ctx.check_throws<SolverError>([&] { s.set_option(":timeout", "-1"); },
                                  "negative timeout");
    ctx.check_throws<SolverError>([&] { s.set_option(":timeout", "4294967296"); },
                                  "timeout out of range");
    ctx.check_throws<SolverError>([&] { s.set_option(":timeout", ""); },
                                  "empty timeout");
    ctx.check_throws<SolverError>([&] { s.set_option(":produce-models", "bogus"); },
                                  "invalid value for a known option");
    s.set_option(":produce-models", "true");

    define_fun(s, max_form(f), f);
    ctx.check_throws<SolverError>(
        [&] { s.assert_formula(smt::app(f, "max", {smt::int_val(f, 1)}) > 0); },
        "arity mismatch");
    ctx.check_throws<SolverError>([&] { s.set_logic("QF_LIA"); },
                                  "set-logic after declarations");

    TermFactory other;
    ctx.check_throws<SolverError>([&] { s.assert_formula(smt::bool_val(other, true)); },
                                  "term from another factory");
}

static void test_session_undeclared_identifier(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    SortId Int = f.int_sort();
    Term a = smt::int_var(f, "a");
    Term c = smt::int_var(f, "c");

    // Free variables in a body are solver symbols, checked on assert.
    ctx.check_throws<SolverError>(
        [&] { define_fun(s, "g", {{"a", Int}}, Int, a + c); },
        "undeclared constant in a body");
    ctx.check(s.is_declared("g"), "declaration stays");
    ctx.check(s.num_assertions() == 0, "definition not asserted");

    ctx.check_throws<SolverError>([&] { s.assert_formula(c > 0); },
                                  "undeclared constant in an assertion");

    s.declare_const("c", Int);
    define_fun(s, "h", {{"a", Int}}, Int, a + c);
    ctx.check(s.num_assertions() == 1, "declared constant accepted");

    Term c_real = smt::real_var(f, "c");
    ctx.check_throws<SolverError>([&] { s.assert_formula(c_real > c_real); },
                                  "constant used at the wrong sort");

    // A binder hides the declared constant of the same name.
    Term b = smt::int_var(f, "b");
    ctx.check_throws<SolverError>([&] { s.assert_formula(b > 0); },
                                  "free b is undeclared");
    s.assert_formula(smt::forall({b}, b + 1 > b));
    ctx.check(s.check_sat() == CheckResult::Sat, "quantified b needs no declaration");
}

static void test_session_uninterpreted(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    SortId U = f.uninterpreted_sort("U");
    s.declare_sort("U");
    s.declare_const("e", U);
    Term e = smt::app(f, "e");
    Term v = smt::var(f, "v", U);
    define_fun(s, "same", {{"v", U}}, f.bool_sort(), smt::eq(v, e));
    s.assert_formula(!smt::app(f, "same", {e}));
    ctx.check(s.check_sat() == CheckResult::Unsat, "same(e) holds");
}

static void test_session_trace(TestContext& ctx) {
    TermFactory f;
    Session s(f);
    std::ostringstream out;
    s.set_trace(&out);
    s.execute(Command::declare_fun("b", {}, f.bool_sort()));
    s.execute(Command::assert_formula(f.make_app("b", {})));
    s.execute(Command::check_sat());
    ctx.check_eq(out.str(), "(declare-fun b () Bool)\n(assert b)\n(check-sat)\nsat\n",
                 "trace output");
}

// ============================================================================
// Benchmark and CLI Tests
// ============================================================================

static void test_benchmark_table(TestContext& ctx) {
    BenchmarkOptions opt;
    opt.max_depth = 3;
    std::ostringstream out;
    ctx.check(run_benchmarks(opt, out) == 0, "benchmark succeeds");

    std::istringstream in(out.str());
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    ctx.check(lines.size() == 5, "header plus one row per depth");
    if (lines.size() == 5) {
        ctx.check_eq(lines[0], "depth,definitions,axiom_nodes,inline_nodes", "header");
        ctx.check(lines[1].rfind("0,1,", 0) == 0, "depth 0 row");
        ctx.check(lines[4].rfind("3,4,", 0) == 0, "depth 3 row");
    }

    opt.max_depth = kMaxBenchmarkDepth + 1;
    ctx.check_throws<std::runtime_error>([&] { run_benchmarks(opt, out); },
                                         "depth out of range");
}

static void test_cli_parse(TestContext& ctx) {
    Options o = parse({"--bench", "5", "--solve", "--timeout", "250"});
    ctx.check(o.bench && o.bench_depth == 5 && o.solve, "bench with depth");
    ctx.check(o.timeout_ms == 250, "timeout");

    o = parse({"--bench", "--solve"});
    ctx.check(o.bench && o.bench_depth == 12 && o.solve, "bench default depth");

    o = parse({"--demo", "--trace", "--logic", "ALL"});
    ctx.check(o.demo && o.trace && o.logic == "ALL", "demo flags");

    ctx.check(parse({"--selftest"}).selftest, "selftest");
    ctx.check(parse({"-h"}).help, "help");

    ctx.check_throws<std::runtime_error>([&] { parse({}); }, "nothing to do");
    ctx.check_throws<std::runtime_error>([&] { parse({"--solve"}); }, "solve without bench");
    ctx.check_throws<std::runtime_error>([&] { parse({"--timeout", "x"}); }, "bad timeout");
    ctx.check_throws<std::runtime_error>([&] { parse({"--bench", "41"}); }, "depth too large");
    ctx.check_throws<std::runtime_error>([&] { parse({"--frobnicate"}); }, "unknown option");
    ctx.check_throws<std::runtime_error>([&] { parse({"input.smt2"}); }, "positional file");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Symbols and terms
    runner.run("symbol_quoting",            test_symbol_quoting);
    runner.run("term_interning",            test_term_interning);
    runner.run("term_rendering",            test_term_rendering);
    runner.run("term_metrics",              test_term_metrics);
    runner.run("term_misuse",               test_term_misuse);

    // Operator layer
    runner.run("builtin_operators",         test_builtin_operators);
    runner.run("builtin_factory_mismatch",  test_builtin_factory_mismatch);

    // Commands
    runner.run("command_rendering",         test_command_rendering);

    // Expansion
    runner.run("expand_max",                test_expand_max);
    runner.run("expand_constant",           test_expand_constant);
    runner.run("expand_clamp",              test_expand_clamp);
    runner.run("expand_idempotent",         test_expand_idempotent);
    runner.run("expand_arity",              test_expand_arity);
    runner.run("expand_argument_order",     test_expand_argument_order);
    runner.run("expand_structural_errors",  test_expand_structural_errors);

    // Sinks
    runner.run("define_fun_sink_order",     test_define_fun_sink_order);
    runner.run("define_fun_partial_effect", test_define_fun_partial_effect);

    // Rewriting
    runner.run("substitute",                test_substitute);
    runner.run("inline_growth",             test_inline_growth);
    runner.run("inline_recursion",          test_inline_recursion);

    // Z3 sessions
    runner.run("session_max",               test_session_max);
    runner.run("session_constant",          test_session_constant);
    runner.run("session_clamp",             test_session_clamp);
    runner.run("session_sort_error",        test_session_sort_error);
    runner.run("session_redeclaration",     test_session_redeclaration);
    runner.run("session_scopes",            test_session_scopes);
    runner.run("session_models",            test_session_models);
    runner.run("session_errors",            test_session_errors);
    runner.run("session_uninterpreted",     test_session_uninterpreted);
    runner.run("session_undeclared_identifier", test_session_undeclared_identifier);
    runner.run("session_trace",             test_session_trace);

    // Driver
    runner.run("benchmark_table",           test_benchmark_table);
    runner.run("cli_parse",                 test_cli_parse);

    return runner.summarise();
}

}  // namespace smtembed
