// ============================================================================
// session.cpp — Implementation of the Z3-backed solver session
// ============================================================================

#include "smtembed/session.hpp"

#include <algorithm>
#include <limits>
#include <ostream>

namespace smtembed {

namespace {

z3::solver make_solver(z3::context& ctx, const std::string& logic) {
    if (logic.empty()) {
        return z3::solver(ctx);
    }
    return z3::solver(ctx, logic.c_str());
}

// Milliseconds as an unsigned decimal that fits in `unsigned`.
unsigned parse_timeout(const std::string& text) {
    bool digits = !text.empty() &&
                  std::all_of(text.begin(), text.end(),
                              [](char c) { return c >= '0' && c <= '9'; });
    unsigned long long value = 0;
    if (digits) {
        try {
            value = std::stoull(text);
        } catch (const std::out_of_range&) {
            digits = false;
        }
    }
    if (!digits || value > std::numeric_limits<unsigned>::max()) {
        throw SolverError("set-option :timeout expects milliseconds in [0, " +
                          std::to_string(std::numeric_limits<unsigned>::max()) +
                          "], got '" + text + "'");
    }
    return static_cast<unsigned>(value);
}

// Current value of a global Z3 parameter; false if the name is unknown.
bool read_global_param(const std::string& key, std::string& out) {
    Z3_string value = nullptr;
    if (!Z3_global_param_get(key.c_str(), &value)) {
        return false;
    }
    out = value ? value : "";
    return true;
}

std::string strip_colon(const std::string& keyword) {
    if (!keyword.empty() && keyword.front() == ':') {
        return keyword.substr(1);
    }
    return keyword;
}

}  // namespace

// ── check_result_name ───────────────────────────────────────────────────────

const char* check_result_name(CheckResult r) noexcept {
    switch (r) {
        case CheckResult::Sat:     return "sat";
        case CheckResult::Unsat:   return "unsat";
        case CheckResult::Unknown: return "unknown";
    }
    return "unknown";
}

// ── Session ─────────────────────────────────────────────────────────────────

bool Session::apply_global_params(const SessionConfig& config) {
    z3::set_param("model", config.produce_models);
    z3::set_param("smt.macro_finder", config.macro_finder);
    return true;
}

Session::Session(TermFactory& factory, SessionConfig config)
    : factory_(factory),
      config_(std::move(config)),
      params_applied_(apply_global_params(config_)),
      ctx_(),
      solver_(make_solver(ctx_, config_.logic)),
      scopes_(1) {
    configure_solver();
}

void Session::configure_solver() {
    if (config_.timeout_ms > 0) {
        z3::params p(ctx_);
        p.set("timeout", config_.timeout_ms);
        solver_.set(p);
    }
}

void Session::trace(const Command& cmd) {
    if (trace_) {
        *trace_ << command_to_string(cmd, factory_) << "\n";
    }
}

bool Session::is_declared(const std::string& name) const {
    return funs_.count(name) != 0;
}

bool Session::is_sort_declared(const std::string& name) const {
    return sorts_.count(name) != 0;
}

std::size_t Session::num_assertions() const {
    return solver_.assertions().size();
}

// ── set_logic / set_option ──────────────────────────────────────────────────

void Session::set_logic(const std::string& logic) {
    trace(Command::set_logic(logic));
    if (!funs_.empty() || !sorts_.empty() || num_assertions() > 0 || num_scopes() > 0) {
        throw SolverError("set-logic: must precede declarations and assertions");
    }
    try {
        solver_ = make_solver(ctx_, logic);
        config_.logic = logic;
        configure_solver();
    } catch (const z3::exception& e) {
        throw SolverError("set-logic: " + std::string(e.msg()));
    }
    invalidate();
}

void Session::set_option(const std::string& keyword, const std::string& value) {
    std::string key = strip_colon(keyword);
    trace(Command::set_option(key, value));

    if (key == "timeout") {
        config_.timeout_ms = parse_timeout(value);
        configure_solver();
        return;
    }
    if (key == "produce-models") {
        key = "model";
    }

    std::string previous;
    if (!read_global_param(key, previous)) {
        throw SolverError("set-option: unsupported option :" + key);
    }
    z3::set_param(key.c_str(), value.c_str());

    // Z3 only warns about a value it cannot parse and keeps the old one.
    std::string now;
    if (!read_global_param(key, now) || (now != value && now == previous)) {
        throw SolverError("set-option :" + key + ": invalid value '" + value + "'");
    }
    if (key == "model") {
        config_.produce_models = now == "true";
    }
}

// ── Declarations ────────────────────────────────────────────────────────────

void Session::declare_sort(const std::string& name) {
    trace(Command::declare_sort(name));
    if (sorts_.count(name)) {
        throw SolverError("invalid declaration, sort '" + name + "' already declared");
    }
    try {
        sorts_[name] = std::make_unique<z3::sort>(ctx_.uninterpreted_sort(name.c_str()));
    } catch (const z3::exception& e) {
        throw SolverError("declare-sort " + name + ": " + e.msg());
    }
    scopes_.back().sorts.push_back(name);
    invalidate();
}

void Session::declare_fun(const std::string& name,
                          const std::vector<SortId>& arg_sorts,
                          SortId result_sort) {
    trace(Command::declare_fun(name, arg_sorts, result_sort));
    if (funs_.count(name)) {
        throw SolverError("invalid declaration, function '" + name + "' already declared");
    }
    try {
        z3::sort_vector domain(ctx_);
        for (SortId s : arg_sorts) {
            domain.push_back(to_z3_sort(s));
        }
        z3::sort range = to_z3_sort(result_sort);
        funs_[name] = std::make_unique<z3::func_decl>(
            ctx_.function(name.c_str(), domain, range));
    } catch (const z3::exception& e) {
        throw SolverError("declare-fun " + name + ": " + e.msg());
    }
    scopes_.back().funs.push_back(name);
    invalidate();
}

void Session::declare_const(const std::string& name, SortId sort) {
    declare_fun(name, {}, sort);
}

// ── Assertions ──────────────────────────────────────────────────────────────

void Session::assert_formula(TermId formula) {
    trace(Command::assert_formula(formula));
    try {
        z3::expr e = to_z3(formula);
        if (!e.is_bool()) {
            throw SolverError("assert: formula is not Boolean: " +
                              factory_.to_string(formula));
        }
        solver_.add(e);
    } catch (const z3::exception& e) {
        throw SolverError("assert: " + std::string(e.msg()));
    }
    invalidate();
}

void Session::assert_formula(const Term& formula) {
    if (&formula.factory() != &factory_) {
        throw SolverError("assert: term belongs to a different factory");
    }
    assert_formula(formula.id());
}

// ── Scopes ──────────────────────────────────────────────────────────────────

void Session::push(unsigned levels) {
    trace(Command::push(levels));
    for (unsigned i = 0; i < levels; ++i) {
        solver_.push();
        scopes_.emplace_back();
    }
    invalidate();
}

void Session::pop(unsigned levels) {
    trace(Command::pop(levels));
    if (levels > num_scopes()) {
        throw SolverError("pop: " + std::to_string(levels) + " levels requested, " +
                          std::to_string(num_scopes()) + " open");
    }
    for (unsigned i = 0; i < levels; ++i) {
        for (const std::string& name : scopes_.back().funs) funs_.erase(name);
        for (const std::string& name : scopes_.back().sorts) sorts_.erase(name);
        scopes_.pop_back();
    }
    try {
        solver_.pop(levels);
    } catch (const z3::exception& e) {
        throw SolverError("pop: " + std::string(e.msg()));
    }
    invalidate();
}

// ── check_sat ───────────────────────────────────────────────────────────────

CheckResult Session::check_sat() {
    trace(Command::check_sat());
    z3::check_result result;
    try {
        result = solver_.check();
    } catch (const z3::exception& e) {
        throw SolverError("check-sat: " + std::string(e.msg()));
    }

    switch (result) {
        case z3::sat:
            has_model_ = config_.produce_models;
            return CheckResult::Sat;
        case z3::unsat:
            has_model_ = false;
            return CheckResult::Unsat;
        case z3::unknown:
            has_model_ = false;
            return CheckResult::Unknown;
    }
    return CheckResult::Unknown;
}

std::string Session::reason_unknown() const {
    return solver_.reason_unknown();
}

// ── Models ──────────────────────────────────────────────────────────────────

std::vector<ModelEntry> Session::get_model() {
    if (!has_model_) {
        throw SolverError("get-model: no model available");
    }
    std::vector<ModelEntry> entries;
    try {
        z3::model model = solver_.get_model();
        for (unsigned i = 0; i < model.num_consts(); ++i) {
            z3::func_decl decl = model.get_const_decl(i);
            z3::expr value = model.get_const_interp(decl);
            entries.push_back(ModelEntry{decl.name().str(), value.to_string()});
        }
    } catch (const z3::exception& e) {
        throw SolverError("get-model: " + std::string(e.msg()));
    }
    std::sort(entries.begin(), entries.end(),
              [](const ModelEntry& a, const ModelEntry& b) { return a.name < b.name; });
    return entries;
}

std::string Session::eval(TermId term) {
    if (!has_model_) {
        throw SolverError("eval: no model available");
    }
    try {
        z3::model model = solver_.get_model();
        return model.eval(to_z3(term), true).to_string();
    } catch (const z3::exception& e) {
        throw SolverError("eval: " + std::string(e.msg()));
    }
}

// ── execute ─────────────────────────────────────────────────────────────────

void Session::execute(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::SetLogic:
            set_logic(cmd.name);
            return;
        case CommandKind::SetOption:
            set_option(cmd.name, cmd.value);
            return;
        case CommandKind::DeclareSort:
            declare_sort(cmd.name);
            return;
        case CommandKind::DeclareFun:
            declare_fun(cmd.name, cmd.arg_sorts, cmd.result_sort);
            return;
        case CommandKind::Assert:
            assert_formula(cmd.term);
            return;
        case CommandKind::Push:
            push(cmd.levels);
            return;
        case CommandKind::Pop:
            pop(cmd.levels);
            return;
        case CommandKind::CheckSat: {
            CheckResult r = check_sat();
            if (trace_) *trace_ << check_result_name(r) << "\n";
            return;
        }
        case CommandKind::GetModel: {
            trace(cmd);
            std::vector<ModelEntry> entries = get_model();
            if (trace_) {
                for (const ModelEntry& e : entries) {
                    *trace_ << "  " << e.name << " = " << e.value << "\n";
                }
            }
            return;
        }
    }
}

// ── Translation to Z3 ───────────────────────────────────────────────────────

z3::sort Session::to_z3_sort(SortId id) {
    const SortNode& s = factory_.sort(id);
    switch (s.kind) {
        case SortKind::Bool:
            return ctx_.bool_sort();
        case SortKind::Int:
            return ctx_.int_sort();
        case SortKind::Real:
            return ctx_.real_sort();
        case SortKind::Uninterpreted: {
            auto it = sorts_.find(s.name);
            if (it == sorts_.end()) {
                throw SolverError("unknown sort '" + s.name + "'");
            }
            return *it->second;
        }
        case SortKind::Array: {
            SortId domain = s.domain;
            SortId range = s.range;
            return ctx_.array_sort(to_z3_sort(domain), to_z3_sort(range));
        }
    }
    throw SolverError("unsupported sort");
}

z3::func_decl Session::lookup_fun(const std::string& name, std::size_t arity) {
    auto it = funs_.find(name);
    if (it == funs_.end()) {
        throw SolverError("unknown function '" + name + "'");
    }
    if (it->second->arity() != arity) {
        throw SolverError("function '" + name + "' expects " +
                          std::to_string(it->second->arity()) + " arguments, got " +
                          std::to_string(arity));
    }
    return *it->second;
}

z3::expr Session::to_z3(TermId id) {
    TranslationMemo memo;
    return translate(id, {}, memo);
}

z3::expr Session::translate_free_var(const TermNode& n) {
    auto it = funs_.find(n.name);
    if (it == funs_.end() || it->second->arity() != 0) {
        throw SolverError("unknown constant '" + n.name + "'");
    }
    z3::sort expected = to_z3_sort(n.sort);
    if (!Z3_is_eq_sort(ctx_, it->second->range(), expected)) {
        throw SolverError("constant '" + n.name + "' is declared as " +
                          it->second->range().to_string() + ", used as " +
                          factory_.sort_to_string(n.sort));
    }
    return (*it->second)();
}

z3::expr Session::translate(TermId id, const std::unordered_set<TermId>& bound,
                            TranslationMemo& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) {
        return *hit->second;
    }

    // Translation only reads the factory, so the node reference stays valid.
    const TermNode& n = factory_.node(id);

    std::vector<z3::expr> args;
    args.reserve(n.children.size());
    if (n.kind == TermKind::Forall || n.kind == TermKind::Exists) {
        // The body is translated under its own binders with a fresh memo:
        // the same Var means a different symbol inside and outside.
        std::unordered_set<TermId> inner = bound;
        for (std::size_t i = 0; i + 1 < n.children.size(); ++i) {
            inner.insert(n.children[i]);
        }
        TranslationMemo inner_memo;
        for (TermId c : n.children) {
            args.push_back(translate(c, inner, inner_memo));
        }
    } else {
        for (TermId c : n.children) {
            args.push_back(translate(c, bound, memo));
        }
    }

    // The C API reports sort errors through the context; check_error()
    // turns them into z3::exception.
    auto wrap = [&](Z3_ast r) {
        ctx_.check_error();
        return z3::expr(ctx_, r);
    };
    auto raw = [&](std::size_t first, std::size_t last) {
        return std::vector<Z3_ast>(args.begin() + first, args.begin() + last);
    };
    auto as_real = [&](const z3::expr& e) {
        return e.is_int() ? wrap(Z3_mk_int2real(ctx_, e)) : e;
    };

    z3::expr result(ctx_);
    switch (n.kind) {
        case TermKind::True:
            result = ctx_.bool_val(true);
            break;
        case TermKind::False:
            result = ctx_.bool_val(false);
            break;
        case TermKind::IntLit:
            result = ctx_.int_val(static_cast<int64_t>(n.num));
            break;
        case TermKind::RealLit: {
            std::string text = std::to_string(n.num) + "/" + std::to_string(n.den);
            result = ctx_.real_val(text.c_str());
            break;
        }
        case TermKind::Var:
            if (bound.count(id)) {
                result = ctx_.constant(n.name.c_str(), to_z3_sort(n.sort));
            } else {
                result = translate_free_var(n);
            }
            break;
        case TermKind::App: {
            z3::func_decl decl = lookup_fun(n.name, args.size());
            z3::expr_vector v(ctx_);
            for (const z3::expr& a : args) v.push_back(a);
            result = decl(v);
            break;
        }
        case TermKind::Not:
            result = wrap(Z3_mk_not(ctx_, args[0]));
            break;
        case TermKind::And: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_and(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Or: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_or(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Implies:
            result = wrap(Z3_mk_implies(ctx_, args[0], args[1]));
            break;
        case TermKind::Xor:
            result = wrap(Z3_mk_xor(ctx_, args[0], args[1]));
            break;
        case TermKind::Eq:
            result = wrap(Z3_mk_eq(ctx_, args[0], args[1]));
            break;
        case TermKind::Distinct: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_distinct(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Ite:
            result = wrap(Z3_mk_ite(ctx_, args[0], args[1], args[2]));
            break;
        case TermKind::Lt:
            result = wrap(Z3_mk_lt(ctx_, args[0], args[1]));
            break;
        case TermKind::Le:
            result = wrap(Z3_mk_le(ctx_, args[0], args[1]));
            break;
        case TermKind::Gt:
            result = wrap(Z3_mk_gt(ctx_, args[0], args[1]));
            break;
        case TermKind::Ge:
            result = wrap(Z3_mk_ge(ctx_, args[0], args[1]));
            break;
        case TermKind::Add: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_add(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Sub: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_sub(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Neg:
            result = wrap(Z3_mk_unary_minus(ctx_, args[0]));
            break;
        case TermKind::Mul: {
            auto r = raw(0, args.size());
            result = wrap(Z3_mk_mul(ctx_, static_cast<unsigned>(r.size()), r.data()));
            break;
        }
        case TermKind::Div:
            // SMT-LIB (/ a b) is real division even on Int operands.
            result = wrap(Z3_mk_div(ctx_, as_real(args[0]), as_real(args[1])));
            break;
        case TermKind::IntDiv:
            result = wrap(Z3_mk_div(ctx_, args[0], args[1]));
            break;
        case TermKind::Mod:
            result = wrap(Z3_mk_mod(ctx_, args[0], args[1]));
            break;
        case TermKind::Abs: {
            z3::expr zero = args[0].is_real() ? ctx_.real_val(0) : ctx_.int_val(0);
            z3::expr nonneg = wrap(Z3_mk_ge(ctx_, args[0], zero));
            z3::expr negated = wrap(Z3_mk_unary_minus(ctx_, args[0]));
            result = wrap(Z3_mk_ite(ctx_, nonneg, args[0], negated));
            break;
        }
        case TermKind::Select:
            result = wrap(Z3_mk_select(ctx_, args[0], args[1]));
            break;
        case TermKind::Store:
            result = wrap(Z3_mk_store(ctx_, args[0], args[1], args[2]));
            break;
        case TermKind::Forall:
        case TermKind::Exists: {
            std::vector<Z3_app> bound;
            for (std::size_t i = 0; i + 1 < args.size(); ++i) {
                bound.push_back(Z3_to_app(ctx_, args[i]));
            }
            bool is_forall = n.kind == TermKind::Forall;
            result = wrap(Z3_mk_quantifier_const(ctx_, is_forall, 0,
                                                 static_cast<unsigned>(bound.size()),
                                                 bound.data(), 0, nullptr,
                                                 args.back()));
            break;
        }
    }

    memo[id] = std::make_unique<z3::expr>(result);
    return result;
}

}  // namespace smtembed
