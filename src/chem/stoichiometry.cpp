#include <map>
#include <stoich/chem/stoichiometry.h>
#include <stoich/core/log.h>

namespace stoich::chem {

StoichiometryMatrix build_matrix(const Equation &equation) {
  StoichiometryMatrix result;
  result.elements = equation.elements();

  const auto compounds = equation.compounds();
  for (const auto &c : compounds)
    result.species.push_back(c.formula);

  std::map<std::string, Eigen::Index> row_index;
  for (std::size_t i = 0; i < result.elements.size(); i++)
    row_index[result.elements[i]] = static_cast<Eigen::Index>(i);

  const Eigen::Index num_rows = result.elements.size();
  const Eigen::Index num_cols = compounds.size();
  result.matrix = RationalMat(num_rows, num_cols);

  const std::size_t num_reactants = equation.num_reactants();
  for (Eigen::Index col = 0; col < num_cols; col++) {
    const auto &compound = compounds[col];
    const bool product = static_cast<std::size_t>(col) >= num_reactants;
    for (const auto &[symbol, count] : compound.composition) {
      core::Rational value(static_cast<long>(count));
      if (product)
        value = -value;
      result.matrix(row_index.at(symbol), col) = value;
    }
  }

  log::debug("Stoichiometry matrix: {} element(s) x {} compound(s)", num_rows,
             num_cols);
  return result;
}

} // namespace stoich::chem
