#pragma once
#include <cstdint>
#include <stoich/chem/composition.h>
#include <string>

namespace stoich::chem {

/**
 * A single species of an equation: the formula text as written and the
 * composition parsed from it.
 */
struct Compound {
  /// formula text without any leading coefficient e.g. `"CuSO4·5H2O"`
  std::string formula;
  Composition composition;
  /// coefficient written in front of the formula in the input, if any.
  /// It is never used for balancing.
  std::int64_t annotation{1};

  bool operator==(const Compound &rhs) const {
    return formula == rhs.formula && composition == rhs.composition;
  }
};

/**
 * Parse a chemical formula into its composition.
 *
 * Supports element symbols with counts (`H2O`), nested parentheses and
 * square brackets with multipliers (`K4[Fe(CN)6]`) and hydrate segments
 * separated by `·`, `.` or `*` with their own leading multiplier
 * (`CuSO4·5H2O`). Whitespace between tokens is ignored.
 *
 * \param text the formula, without any leading coefficient
 *
 * \returns the composition, every count at least 1
 *
 * \throws stoich::core::BalanceError describing the first problem found.
 * Positions reported are byte offsets into text.
 */
Composition parse_formula(const std::string &text);

/// Parse a formula and keep its text alongside the composition
Compound parse_compound(const std::string &text);

} // namespace stoich::chem
