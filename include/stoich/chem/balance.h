#pragma once
#include <optional>
#include <stoich/chem/coefficients.h>
#include <stoich/chem/equation.h>
#include <stoich/chem/stoichiometry.h>
#include <stoich/core/errors.h>
#include <string>

namespace stoich::chem {

/**
 * Snapshot of every intermediate value computed while balancing, for
 * "show work" style reporting. Stages that were not reached are empty.
 */
struct BalanceTrace {
  std::string input;
  std::optional<Equation> equation;
  std::optional<StoichiometryMatrix> matrix;
  std::optional<RationalVec> nullspace;
  std::optional<NormalizationTrace> normalization;
  CoefficientVector coefficients;
};

/**
 * Outcome of a balancing request: either the coefficients for the parsed
 * equation, or the error that stopped the pipeline. Both carry the trace.
 */
class BalanceResult {
public:
  static BalanceResult success(BalanceTrace trace);
  static BalanceResult failure(BalanceTrace trace, core::BalanceError error);

  inline bool ok() const { return !m_error.has_value(); }
  explicit operator bool() const { return ok(); }

  /// text the request was made with
  inline const std::string &input() const { return m_trace.input; }
  inline const BalanceTrace &trace() const { return m_trace; }

  /// \throws std::logic_error for a failed result
  const Equation &equation() const;
  /// coefficients of all compounds, reactants then products
  const CoefficientVector &coefficients() const;
  CoefficientVector reactant_coefficients() const;
  CoefficientVector product_coefficients() const;
  /// the equation with coefficients e.g. `"2H2 + O2 -> 2H2O"`
  std::string balanced_equation() const;

  /// \throws std::logic_error for a successful result
  const core::BalanceError &error() const;

private:
  BalanceResult(BalanceTrace trace, std::optional<core::BalanceError> error);

  BalanceTrace m_trace;
  std::optional<core::BalanceError> m_error;
};

/**
 * Balance an equation given as text e.g. `"Fe + O2 = Fe2O3"`.
 *
 * Runs the equation parser, stoichiometry matrix builder, exact null space
 * solver and coefficient normalizer in turn. A BalanceError raised by any
 * stage produces a failed result; the function has no side effects and is
 * safe to call concurrently.
 */
BalanceResult balance(const std::string &text);

} // namespace stoich::chem
