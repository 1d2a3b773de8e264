#include <cctype>
#include <set>
#include <stdexcept>
#include <stoich/chem/equation.h>
#include <stoich/core/errors.h>
#include <stoich/core/log.h>
#include <stoich/core/util.h>
#include <string_view>
#include <utility>

namespace stoich::chem {

using core::BalanceError;
using core::EquationSide;
using core::ErrorKind;

namespace {

constexpr std::string_view arrow_tokens[] = {"->", "\xE2\x86\x92", "="};

struct Separator {
  std::size_t position{std::string::npos};
  std::string_view token;
};

Separator find_separator(const std::string &text) {
  for (std::size_t i = 0; i < text.size(); i++) {
    for (const auto &token : arrow_tokens) {
      if (text.compare(i, token.size(), token) == 0) {
        return {i, token};
      }
    }
  }
  return {};
}

Compound parse_term(const std::string &term) {
  std::size_t digits_end = 0;
  while (digits_end < term.size() &&
         std::isdigit(static_cast<unsigned char>(term[digits_end])))
    digits_end++;

  // a bare number is never a formula, let the formula parser report it
  if (digits_end == 0 || digits_end == term.size()) {
    return parse_compound(term);
  }

  const std::string digits = term.substr(0, digits_end);
  if (digits.find_first_not_of('0') == std::string::npos) {
    throw BalanceError(ErrorKind::InvalidMultiplier,
                       "coefficient must not be zero", digits, 0);
  }
  if (digits.front() == '0' || digits.size() > 9) {
    throw BalanceError(ErrorKind::InvalidMultiplier,
                       fmt::format("malformed coefficient '{}'", digits),
                       digits, 0);
  }

  auto compound =
      parse_compound(stoich::util::trim_copy(term.substr(digits_end)));
  compound.annotation = std::stoll(digits);
  return compound;
}

std::vector<Compound> parse_side(const std::string &side_text,
                                 EquationSide side) {
  std::vector<Compound> result;
  int index = 1;
  for (const auto &field : stoich::util::split(side_text, '+')) {
    auto term = stoich::util::trim_copy(field);
    try {
      if (term.empty()) {
        throw BalanceError(ErrorKind::EmptyFormula,
                           fmt::format("term {} is empty", index), field, 0);
      }
      result.push_back(parse_term(term));
    } catch (BalanceError &err) {
      err.set_term(side, index);
      throw;
    }
    index++;
  }
  return result;
}

std::string join_compounds(const std::vector<std::string> &terms) {
  return stoich::util::join(terms, " + ");
}

} // namespace

Equation::Equation(std::vector<Compound> reactants,
                   std::vector<Compound> products, std::string arrow)
    : m_reactants(std::move(reactants)), m_products(std::move(products)),
      m_arrow(std::move(arrow)) {
  if (m_reactants.empty() || m_products.empty()) {
    throw std::invalid_argument(
        "an equation needs at least one reactant and one product");
  }
}

std::vector<Compound> Equation::compounds() const {
  std::vector<Compound> result(m_reactants);
  result.insert(result.end(), m_products.begin(), m_products.end());
  return result;
}

std::vector<std::string> Equation::elements() const {
  std::set<std::string> symbols;
  for (const auto *side : {&m_reactants, &m_products}) {
    for (const auto &compound : *side) {
      for (const auto &kv : compound.composition) {
        symbols.insert(kv.first);
      }
    }
  }
  return std::vector<std::string>(symbols.begin(), symbols.end());
}

std::string Equation::to_string() const {
  std::vector<std::string> lhs, rhs;
  for (const auto &c : m_reactants)
    lhs.push_back(c.formula);
  for (const auto &c : m_products)
    rhs.push_back(c.formula);
  return fmt::format("{} {} {}", join_compounds(lhs), m_arrow,
                     join_compounds(rhs));
}

Equation parse_equation(const std::string &text) {
  const auto separator = find_separator(text);
  if (separator.position == std::string::npos) {
    throw BalanceError(ErrorKind::MissingSeparator,
                       "no '->', '\xE2\x86\x92' or '=' separating reactants "
                       "from products",
                       text);
  }

  const auto lhs = text.substr(0, separator.position);
  const auto rhs = text.substr(separator.position + separator.token.size());
  if (stoich::util::is_blank(lhs)) {
    throw BalanceError(ErrorKind::EmptyReactantSide, "no reactants given",
                       lhs, 0);
  }
  if (stoich::util::is_blank(rhs)) {
    throw BalanceError(ErrorKind::EmptyProductSide, "no products given", rhs,
                       separator.position + separator.token.size());
  }

  auto reactants = parse_side(lhs, EquationSide::Reactants);
  auto products = parse_side(rhs, EquationSide::Products);
  log::debug("Parsed equation with {} reactant(s) and {} product(s)",
             reactants.size(), products.size());
  return Equation(std::move(reactants), std::move(products),
                  std::string(separator.token));
}

std::string render(const Equation &equation,
                   const std::vector<std::int64_t> &coefficients) {
  if (coefficients.size() != equation.num_compounds()) {
    throw std::invalid_argument(
        fmt::format("{} coefficients given for {} compounds",
                    coefficients.size(), equation.num_compounds()));
  }
  auto format_term = [](std::int64_t coefficient, const Compound &c) {
    if (coefficient == 1)
      return c.formula;
    return fmt::format("{}{}", coefficient, c.formula);
  };

  std::vector<std::string> lhs, rhs;
  std::size_t i = 0;
  for (const auto &c : equation.reactants())
    lhs.push_back(format_term(coefficients[i++], c));
  for (const auto &c : equation.products())
    rhs.push_back(format_term(coefficients[i++], c));
  return fmt::format("{} {} {}", join_compounds(lhs), equation.arrow(),
                     join_compounds(rhs));
}

} // namespace stoich::chem
