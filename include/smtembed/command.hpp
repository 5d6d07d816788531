// ============================================================================
// smtembed/command.hpp — SMT-LIB commands and the primitive command interface
// ============================================================================
//
// A Command is a value describing one SMT-LIB command.  Commands refer to
// sorts and terms by id, so they are only meaningful together with the
// TermFactory that owns those ids.  Rendering produces the SMT-LIB text the
// command corresponds to, e.g.
//
//   (declare-fun max (Int Int) Int)
//   (assert (forall ((a Int) (b Int)) (= (max a b) (ite (> a b) a b))))
//
// CommandSink is the narrow interface the definition-expansion engine
// consumes: a signature declaration and an assertion.  Both report failure
// by throwing.
//
// ============================================================================

#ifndef SMTEMBED_COMMAND_HPP
#define SMTEMBED_COMMAND_HPP

#include "smtembed/ast.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace smtembed {

// ── CommandKind ─────────────────────────────────────────────────────────────

enum class CommandKind : std::uint8_t {
    SetLogic,
    SetOption,
    DeclareSort,
    DeclareFun,
    Assert,
    Push,
    Pop,
    CheckSat,
    GetModel
};

/// SMT-LIB command name ("declare-fun", "check-sat", ...).
const char* command_kind_name(CommandKind k) noexcept;

// ── Command ─────────────────────────────────────────────────────────────────

struct Command {
    CommandKind         kind{};
    std::string         name;                     // logic, option keyword, or symbol
    std::string         value;                    // SetOption value
    std::vector<SortId> arg_sorts;                // DeclareFun
    SortId              result_sort{kInvalidSort};// DeclareFun
    TermId              term{kInvalidTerm};       // Assert
    unsigned            levels{0};                // Push / Pop

    static Command set_logic(const std::string& logic);
    static Command set_option(const std::string& keyword, const std::string& value);
    static Command declare_sort(const std::string& name);
    static Command declare_fun(const std::string& name,
                               std::vector<SortId> arg_sorts,
                               SortId result_sort);
    static Command assert_formula(TermId formula);
    static Command push(unsigned levels = 1);
    static Command pop(unsigned levels = 1);
    static Command check_sat();
    static Command get_model();

    bool operator==(const Command& o) const noexcept;
    bool operator!=(const Command& o) const noexcept { return !(*this == o); }
};

/// SMT-LIB text of a command.
std::string command_to_string(const Command& cmd, const TermFactory& factory);

/// Number of tree nodes a command contributes: one for the command head,
/// one per sort reference, plus the tree size of an asserted term.
std::uint64_t command_size(const Command& cmd, const TermFactory& factory);

// ── CommandSink ─────────────────────────────────────────────────────────────
// Receiver of primitive commands.  Order matters: a function must be
// declared before an assertion that applies it is submitted.

class CommandSink {
public:
    virtual ~CommandSink() = default;

    virtual void declare_fun(const std::string& name,
                             const std::vector<SortId>& arg_sorts,
                             SortId result_sort) = 0;

    virtual void assert_formula(TermId formula) = 0;
};

}  // namespace smtembed

#endif  // SMTEMBED_COMMAND_HPP
