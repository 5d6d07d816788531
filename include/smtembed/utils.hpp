// ============================================================================
// smtembed/utils.hpp — Utility functions
// ============================================================================

#ifndef SMTEMBED_UTILS_HPP
#define SMTEMBED_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace smtembed {

// ── SMT-LIB symbols ─────────────────────────────────────────────────────────

/// True if `name` is an SMT-LIB simple symbol: a non-empty sequence of
/// letters, digits and ~!@$%^&*_-+=<>.?/ that does not start with a digit
/// and is not a reserved word.
bool is_simple_symbol(std::string_view name);

/// True if `name` can be written as an SMT-LIB symbol at all, either plain
/// or between vertical bars (non-empty, no '|' and no '\').
bool is_valid_symbol(std::string_view name);

/// Render a symbol, wrapping it in |...| when it is not a simple symbol.
std::string quote_symbol(const std::string& name);

// ── String helpers ──────────────────────────────────────────────────────────

/// Concatenate `parts` with `sep` between consecutive elements.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

}  // namespace smtembed

#endif  // SMTEMBED_UTILS_HPP
