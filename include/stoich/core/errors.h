#pragma once
#include <cstddef>
#include <fmt/core.h>
#include <stdexcept>
#include <string>

namespace stoich::core {

/// Every distinct way a balancing request can fail.
enum class ErrorKind {
  EmptyFormula,
  EmptyReactantSide,
  EmptyProductSide,
  UnknownElement,
  NumeralInPlaceOfSymbol,
  InvalidCharacter,
  InvalidMultiplier,
  UnbalancedBrackets,
  MissingSeparator,
  NoSolution,
  AmbiguousSolution,
  DisconnectedSystem,
  NonPositiveCoefficient,
  CoefficientOutOfRange,
};

/// Stable identifier for an ErrorKind e.g. `"UnknownElement"`
const char *to_string(ErrorKind kind);

enum class EquationSide { None, Reactants, Products };

const char *to_string(EquationSide side);

/**
 * Exception thrown by every stage of the balancing pipeline.
 *
 * Carries the kind of failure along with the offending fragment of the
 * input and, where known, its position. The equation parser annotates
 * formula errors with the side and 1-based term index they occurred in.
 */
class BalanceError : public std::runtime_error {
public:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  BalanceError(ErrorKind kind, const std::string &message,
               std::string fragment = {}, std::size_t position = npos);

  inline ErrorKind kind() const { return m_kind; }
  inline const std::string &fragment() const { return m_fragment; }
  inline std::size_t position() const { return m_position; }
  inline bool has_position() const { return m_position != npos; }

  inline EquationSide side() const { return m_side; }
  /// 1-based index of the term on its side, 0 if not known
  inline int term_index() const { return m_term_index; }

  /// Corrected formula text for NumeralInPlaceOfSymbol, empty otherwise
  inline const std::string &suggestion() const { return m_suggestion; }

  void set_term(EquationSide side, int term_index);
  void set_suggestion(std::string suggestion);

private:
  ErrorKind m_kind;
  std::string m_fragment;
  std::size_t m_position{npos};
  EquationSide m_side{EquationSide::None};
  int m_term_index{0};
  std::string m_suggestion;
};

} // namespace stoich::core
