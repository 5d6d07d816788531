// ============================================================================
// utils.cpp — SMT-LIB symbol and string utilities
// ============================================================================

#include "smtembed/utils.hpp"

#include <array>
#include <cctype>

namespace smtembed {

namespace {

constexpr std::string_view kSymbolPunctuation = "~!@$%^&*_-+=<>.?/";

// Reserved words of SMT-LIB 2.6 that may not be used as simple symbols.
constexpr std::array<std::string_view, 13> kReservedWords = {
    "!", "_", "as", "BINARY", "DECIMAL", "exists", "HEXADECIMAL",
    "forall", "let", "match", "NUMERAL", "par", "STRING"};

bool is_symbol_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           kSymbolPunctuation.find(c) != std::string_view::npos;
}

}  // namespace

// ── is_simple_symbol ────────────────────────────────────────────────────────

bool is_simple_symbol(std::string_view name) {
    if (name.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(name.front()))) return false;
    for (char c : name) {
        if (!is_symbol_char(c)) return false;
    }
    for (std::string_view word : kReservedWords) {
        if (name == word) return false;
    }
    return true;
}

// ── is_valid_symbol ─────────────────────────────────────────────────────────

bool is_valid_symbol(std::string_view name) {
    if (name.empty()) return false;
    return name.find_first_of("|\\") == std::string_view::npos;
}

// ── quote_symbol ────────────────────────────────────────────────────────────

std::string quote_symbol(const std::string& name) {
    if (is_simple_symbol(name)) {
        return name;
    }
    return "|" + name + "|";
}

// ── join ────────────────────────────────────────────────────────────────────

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace smtembed
