#pragma once
#include <cstdint>
#include <stoich/chem/formula.h>
#include <string>
#include <vector>

namespace stoich::chem {

/**
 * A parsed chemical equation: ordered reactants, ordered products and the
 * arrow token that separated them in the input.
 *
 * The order of compounds fixes the column order of the stoichiometry
 * matrix and hence the order coefficients are reported in.
 */
class Equation {
public:
  /// \throws std::invalid_argument if either side has no compounds
  Equation(std::vector<Compound> reactants, std::vector<Compound> products,
           std::string arrow = "->");

  inline const std::vector<Compound> &reactants() const { return m_reactants; }
  inline const std::vector<Compound> &products() const { return m_products; }
  /// one of `"->"`, `"→"` or `"="`
  inline const std::string &arrow() const { return m_arrow; }

  inline std::size_t num_reactants() const { return m_reactants.size(); }
  inline std::size_t num_products() const { return m_products.size(); }
  inline std::size_t num_compounds() const {
    return m_reactants.size() + m_products.size();
  }

  /// reactants followed by products
  std::vector<Compound> compounds() const;

  /// sorted distinct element symbols over all compounds
  std::vector<std::string> elements() const;

  /// the equation as written, without coefficients e.g. `"H2 + O2 -> H2O"`
  std::string to_string() const;

  bool operator==(const Equation &rhs) const {
    return m_reactants == rhs.m_reactants && m_products == rhs.m_products &&
           m_arrow == rhs.m_arrow;
  }

private:
  std::vector<Compound> m_reactants;
  std::vector<Compound> m_products;
  std::string m_arrow{"->"};
};

/**
 * Parse an equation `Term (+ Term)* <arrow> Term (+ Term)*` where the arrow
 * is the first of `->`, `→` or `=` found scanning left to right.
 *
 * Each term is trimmed and may carry a leading integer coefficient
 * (`2H2O`), which is recorded as the compound's annotation and otherwise
 * ignored.
 *
 * \throws stoich::core::BalanceError of kind MissingSeparator,
 * EmptyReactantSide, EmptyProductSide, or the first error raised while
 * parsing a term, annotated with its side and 1-based term index.
 */
Equation parse_equation(const std::string &text);

/**
 * Render the equation with the given coefficients (reactants then
 * products) prefixed to each term. A coefficient of 1 is omitted.
 *
 * \throws std::invalid_argument if the number of coefficients does not match
 * the number of compounds.
 */
std::string render(const Equation &equation,
                   const std::vector<std::int64_t> &coefficients);

} // namespace stoich::chem
