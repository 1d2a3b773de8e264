#include <stdexcept>
#include <stoich/chem/balance.h>
#include <stoich/core/log.h>
#include <stoich/core/nullspace.h>
#include <utility>

namespace stoich::chem {

BalanceResult::BalanceResult(BalanceTrace trace,
                             std::optional<core::BalanceError> error)
    : m_trace(std::move(trace)), m_error(std::move(error)) {}

BalanceResult BalanceResult::success(BalanceTrace trace) {
  return BalanceResult(std::move(trace), std::nullopt);
}

BalanceResult BalanceResult::failure(BalanceTrace trace,
                                     core::BalanceError error) {
  return BalanceResult(std::move(trace), std::move(error));
}

const Equation &BalanceResult::equation() const {
  if (!ok() || !m_trace.equation) {
    throw std::logic_error("no balanced equation in a failed result");
  }
  return *m_trace.equation;
}

const CoefficientVector &BalanceResult::coefficients() const {
  if (!ok()) {
    throw std::logic_error("no coefficients in a failed result");
  }
  return m_trace.coefficients;
}

CoefficientVector BalanceResult::reactant_coefficients() const {
  const auto &c = coefficients();
  const auto n = equation().num_reactants();
  return CoefficientVector(c.begin(), c.begin() + n);
}

CoefficientVector BalanceResult::product_coefficients() const {
  const auto &c = coefficients();
  const auto n = equation().num_reactants();
  return CoefficientVector(c.begin() + n, c.end());
}

std::string BalanceResult::balanced_equation() const {
  return render(equation(), coefficients());
}

const core::BalanceError &BalanceResult::error() const {
  if (ok()) {
    throw std::logic_error("no error in a successful result");
  }
  return *m_error;
}

BalanceResult balance(const std::string &text) {
  BalanceTrace trace;
  trace.input = text;
  try {
    trace.equation = parse_equation(text);
    trace.matrix = build_matrix(*trace.equation);
    trace.nullspace = core::solve_nullspace(trace.matrix->matrix);
    NormalizationTrace normalization;
    try {
      trace.coefficients = normalize(*trace.nullspace, &normalization);
    } catch (const core::BalanceError &) {
      trace.normalization = std::move(normalization);
      throw;
    }
    trace.normalization = std::move(normalization);
  } catch (const core::BalanceError &e) {
    log::debug("Balancing '{}' failed: {} ({})", text, e.what(),
               core::to_string(e.kind()));
    return BalanceResult::failure(std::move(trace), e);
  }

  auto result = BalanceResult::success(std::move(trace));
  log::debug("Balanced '{}' -> '{}'", text, result.balanced_equation());
  return result;
}

} // namespace stoich::chem
