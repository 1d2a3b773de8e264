#pragma once
#include <stoich/chem/equation.h>
#include <stoich/core/linear_algebra.h>
#include <string>
#include <vector>

namespace stoich::chem {

/**
 * Element-by-compound matrix of an equation.
 *
 * Rows are the sorted distinct element symbols, columns the compounds
 * (reactants then products, in input order). Entry (i, j) is the number of
 * atoms of element i in compound j, negated for products, so a vector of
 * coefficients x balances the equation exactly when matrix * x == 0.
 */
struct StoichiometryMatrix {
  std::vector<std::string> elements;
  std::vector<std::string> species;
  RationalMat matrix;

  inline Eigen::Index rows() const { return matrix.rows(); }
  inline Eigen::Index cols() const { return matrix.cols(); }
};

StoichiometryMatrix build_matrix(const Equation &equation);

} // namespace stoich::chem
