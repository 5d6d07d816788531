// ============================================================================
// command.cpp — Command constructors and SMT-LIB rendering
// ============================================================================

#include "smtembed/command.hpp"
#include "smtembed/utils.hpp"

#include <limits>

namespace smtembed {

// ── command_kind_name ───────────────────────────────────────────────────────

const char* command_kind_name(CommandKind k) noexcept {
    switch (k) {
        case CommandKind::SetLogic:    return "set-logic";
        case CommandKind::SetOption:   return "set-option";
        case CommandKind::DeclareSort: return "declare-sort";
        case CommandKind::DeclareFun:  return "declare-fun";
        case CommandKind::Assert:      return "assert";
        case CommandKind::Push:        return "push";
        case CommandKind::Pop:         return "pop";
        case CommandKind::CheckSat:    return "check-sat";
        case CommandKind::GetModel:    return "get-model";
    }
    return "?";
}

// ── Constructors ────────────────────────────────────────────────────────────

Command Command::set_logic(const std::string& logic) {
    Command c;
    c.kind = CommandKind::SetLogic;
    c.name = logic;
    return c;
}

Command Command::set_option(const std::string& keyword, const std::string& value) {
    Command c;
    c.kind = CommandKind::SetOption;
    c.name = (!keyword.empty() && keyword.front() == ':') ? keyword.substr(1) : keyword;
    c.value = value;
    return c;
}

Command Command::declare_sort(const std::string& name) {
    Command c;
    c.kind = CommandKind::DeclareSort;
    c.name = name;
    return c;
}

Command Command::declare_fun(const std::string& name,
                             std::vector<SortId> arg_sorts,
                             SortId result_sort) {
    Command c;
    c.kind = CommandKind::DeclareFun;
    c.name = name;
    c.arg_sorts = std::move(arg_sorts);
    c.result_sort = result_sort;
    return c;
}

Command Command::assert_formula(TermId formula) {
    Command c;
    c.kind = CommandKind::Assert;
    c.term = formula;
    return c;
}

Command Command::push(unsigned levels) {
    Command c;
    c.kind = CommandKind::Push;
    c.levels = levels;
    return c;
}

Command Command::pop(unsigned levels) {
    Command c;
    c.kind = CommandKind::Pop;
    c.levels = levels;
    return c;
}

Command Command::check_sat() {
    Command c;
    c.kind = CommandKind::CheckSat;
    return c;
}

Command Command::get_model() {
    Command c;
    c.kind = CommandKind::GetModel;
    return c;
}

bool Command::operator==(const Command& o) const noexcept {
    return kind == o.kind &&
           name == o.name &&
           value == o.value &&
           arg_sorts == o.arg_sorts &&
           result_sort == o.result_sort &&
           term == o.term &&
           levels == o.levels;
}

// ── command_to_string ───────────────────────────────────────────────────────

std::string command_to_string(const Command& cmd, const TermFactory& factory) {
    std::string head = std::string("(") + command_kind_name(cmd.kind);

    switch (cmd.kind) {
        case CommandKind::SetLogic:
            return head + " " + cmd.name + ")";

        case CommandKind::SetOption:
            return head + " :" + cmd.name + " " + cmd.value + ")";

        case CommandKind::DeclareSort:
            return head + " " + quote_symbol(cmd.name) + " 0)";

        case CommandKind::DeclareFun: {
            std::vector<std::string> args;
            for (SortId s : cmd.arg_sorts) {
                args.push_back(factory.sort_to_string(s));
            }
            return head + " " + quote_symbol(cmd.name) + " (" + join(args, " ") +
                   ") " + factory.sort_to_string(cmd.result_sort) + ")";
        }

        case CommandKind::Assert:
            return head + " " + factory.to_string(cmd.term) + ")";

        case CommandKind::Push:
        case CommandKind::Pop:
            return head + " " + std::to_string(cmd.levels) + ")";

        case CommandKind::CheckSat:
        case CommandKind::GetModel:
            return head + ")";
    }
    return head + ")";
}

// ── command_size ────────────────────────────────────────────────────────────

std::uint64_t command_size(const Command& cmd, const TermFactory& factory) {
    switch (cmd.kind) {
        case CommandKind::DeclareFun:
            return 2 + cmd.arg_sorts.size();

        case CommandKind::Assert: {
            std::uint64_t s = factory.tree_size(cmd.term);
            return s == std::numeric_limits<std::uint64_t>::max() ? s : s + 1;
        }

        default:
            return 1;
    }
}

}  // namespace smtembed
