#include <stoich/core/errors.h>
#include <utility>

namespace stoich::core {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::EmptyFormula:
    return "EmptyFormula";
  case ErrorKind::EmptyReactantSide:
    return "EmptyReactantSide";
  case ErrorKind::EmptyProductSide:
    return "EmptyProductSide";
  case ErrorKind::UnknownElement:
    return "UnknownElement";
  case ErrorKind::NumeralInPlaceOfSymbol:
    return "NumeralInPlaceOfSymbol";
  case ErrorKind::InvalidCharacter:
    return "InvalidCharacter";
  case ErrorKind::InvalidMultiplier:
    return "InvalidMultiplier";
  case ErrorKind::UnbalancedBrackets:
    return "UnbalancedBrackets";
  case ErrorKind::MissingSeparator:
    return "MissingSeparator";
  case ErrorKind::NoSolution:
    return "NoSolution";
  case ErrorKind::AmbiguousSolution:
    return "AmbiguousSolution";
  case ErrorKind::DisconnectedSystem:
    return "DisconnectedSystem";
  case ErrorKind::NonPositiveCoefficient:
    return "NonPositiveCoefficient";
  case ErrorKind::CoefficientOutOfRange:
    return "CoefficientOutOfRange";
  }
  return "Unknown";
}

const char *to_string(EquationSide side) {
  switch (side) {
  case EquationSide::Reactants:
    return "reactants";
  case EquationSide::Products:
    return "products";
  default:
    return "none";
  }
}

BalanceError::BalanceError(ErrorKind kind, const std::string &message,
                           std::string fragment, std::size_t position)
    : std::runtime_error(message), m_kind(kind),
      m_fragment(std::move(fragment)), m_position(position) {}

void BalanceError::set_term(EquationSide side, int term_index) {
  m_side = side;
  m_term_index = term_index;
}

void BalanceError::set_suggestion(std::string suggestion) {
  m_suggestion = std::move(suggestion);
}

} // namespace stoich::core
