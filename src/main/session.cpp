#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <istream>
#include <ostream>
#include <stoich/core/log.h>
#include <stoich/core/util.h>
#include <stoich/io/table.h>
#include <stoich/main/session.h>
#include <vector>

namespace stoich::main {

using core::BalanceError;
using core::EquationSide;
using core::ErrorKind;

namespace {

constexpr const char *catalyst_hint =
    "This usually means the equation is invalid or impossible to balance. "
    "If you have catalyst(s) in the equation, please remove them and try "
    "again.";

constexpr const char *help_text = R"help(Enter a chemical equation to balance, for example:
    H2 + O2 -> H2O
    Al + H2SO4 = Al2(SO4)3 + H2
    CuSO4·5H2O → CuSO4 + H2O

Sides are separated by "->", "→" or "=", terms by "+".
Formulas use element symbols with counts, brackets "()" or "[]" with
multipliers, and hydrate separators "·", "." or "*".
A coefficient written in front of a term is ignored.
A count ending in 0 at the end of a formula is read as a mistyped "O"
(H20); write such counts as a bracket multiplier instead, e.g. (C)60.

Commands:
    show work    show how the last balanced equation was solved
    help         show this message
    q, quit      leave the program)help";

std::string location(const BalanceError &error) {
  if (error.side() == EquationSide::None)
    return "";
  const char *side =
      error.side() == EquationSide::Reactants ? "reactant" : "product";
  return fmt::format(" (in {} term {})", side, error.term_index());
}

std::vector<std::string> unique_labels(const std::vector<std::string> &names) {
  std::vector<std::string> result;
  for (const auto &name : names) {
    std::string label = name;
    while (std::find(result.begin(), result.end(), label) != result.end()) {
      label += "'";
    }
    result.push_back(label);
  }
  return result;
}

} // namespace

std::string error_message(const BalanceError &error) {
  const auto where = location(error);
  switch (error.kind()) {
  case ErrorKind::NumeralInPlaceOfSymbol: {
    auto msg = fmt::format("Input error: {}{}", error.what(), where);
    if (!error.suggestion().empty()) {
      msg += fmt::format("\nDid you mean '{}'?", error.suggestion());
    }
    return msg;
  }
  case ErrorKind::UnknownElement:
    return fmt::format("Input error: '{}' is not a known element symbol{}",
                       error.fragment(), where);
  case ErrorKind::MissingSeparator:
    return "Input error: no \"->\", \"→\" or \"=\" between reactants and "
           "products";
  case ErrorKind::EmptyReactantSide:
    return "Input error: there are no reactants";
  case ErrorKind::EmptyProductSide:
    return "Input error: there are no products";
  case ErrorKind::EmptyFormula:
  case ErrorKind::InvalidCharacter:
  case ErrorKind::InvalidMultiplier:
  case ErrorKind::UnbalancedBrackets:
    return fmt::format("Input error: {}{}", error.what(), where);
  case ErrorKind::NoSolution:
    return fmt::format(
        "Equation cannot be balanced. The nullspace is empty.\n{}",
        catalyst_hint);
  case ErrorKind::AmbiguousSolution:
    return fmt::format("Equation cannot be balanced uniquely: {}",
                       error.what());
  case ErrorKind::DisconnectedSystem:
  case ErrorKind::NonPositiveCoefficient:
  case ErrorKind::CoefficientOutOfRange:
    return fmt::format("Equation cannot be balanced: {}", error.what());
  }
  return error.what();
}

void print_work(std::ostream &out, const chem::BalanceResult &result) {
  const auto &trace = result.trace();
  if (!trace.matrix) {
    out << "Could not parse the equation.\n";
    return;
  }
  const auto &m = *trace.matrix;
  out << fmt::format("\nElements: {}\n", fmt::join(m.elements, ", "));
  out << fmt::format("Species: {}\n", fmt::join(m.species, ", "));
  out << "Matrix:\n";
  io::Table table;
  table.set_column("", m.elements);
  table.set_columns(unique_labels(m.species), m.matrix);
  table.print(out);

  if (!trace.nullspace) {
    out << "No nullspace found - equation cannot be balanced\n";
    return;
  }
  std::vector<core::Rational> vec(trace.nullspace->begin(),
                                  trace.nullspace->end());
  out << fmt::format("Nullspace vector: [{}]\n", fmt::join(vec, ", "));
  if (trace.normalization) {
    const auto &norm = *trace.normalization;
    out << fmt::format("Multiplier: {}\n", norm.multiplier);
    out << fmt::format("Raw coefficients: [{}]\n",
                       fmt::join(norm.scaled, ", "));
    if (norm.divisor != 1) {
      out << fmt::format("Common divisor: {}\n", norm.divisor);
    }
  }
  if (result.ok()) {
    out << fmt::format("Final coefficients: [{}]\n",
                       fmt::join(result.coefficients(), ", "));
  }
}

void Session::print_banner() {
  m_out << "Enter an unbalanced chemical equation (e.g., \"H2 + O2 -> "
           "H2O\"). To quit, enter \"q\"\n\n";
  m_out << "Note: Use letter \"O\" for oxygen, not the number \"0\"\n";
}

void Session::print_separator() {
  m_out << '\n' << std::string(separator_width, '=') << '\n';
}

void Session::balance_and_report(const std::string &line) {
  auto result = chem::balance(line);
  if (result.ok()) {
    m_out << "\nBalanced equation:\n" << result.balanced_equation() << '\n';
    m_out << "To show work, enter \"show work\". To quit, enter \"q\".\n";
    m_last_result = std::move(result);
  } else {
    log::debug("{} error for '{}'", core::to_string(result.error().kind()),
               line);
    m_out << '\n' << error_message(result.error()) << '\n';
    m_last_result.reset();
  }
}

bool Session::handle_line(const std::string &raw_line) {
  const auto line = util::trim_copy(raw_line);
  const auto lower = util::to_lower_copy(line);

  if (lower == "q" || lower == "quit") {
    m_out << "\nGood-bye\n";
    return false;
  }

  if (line.empty()) {
    m_out << "Please enter an unbalanced chemical equation or \"q\" to quit\n";
  } else if (lower == "help") {
    m_out << help_text << '\n';
  } else if (lower == "show work") {
    if (m_last_result) {
      print_work(m_out, *m_last_result);
    } else {
      m_out << "No previous balanced equation to show work for.\n";
    }
  } else {
    balance_and_report(line);
  }
  print_separator();
  return true;
}

void Session::run(std::istream &in) {
  print_banner();
  std::string line;
  while (true) {
    m_out << "\nEnter equation: " << std::flush;
    if (!std::getline(in, line)) {
      m_out << '\n';
      break;
    }
    if (!handle_line(line))
      break;
  }
}

} // namespace stoich::main
