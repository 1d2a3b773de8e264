#pragma once
#include <stoich/core/linear_algebra.h>
#include <vector>

namespace stoich::core {

/**
 * Result of exact Gauss-Jordan elimination of a rational matrix.
 *
 * `reduced` is the reduced row-echelon form: every pivot is 1 and is the
 * only non-zero entry in its column, rows without a pivot are zero and sit
 * at the bottom.
 */
struct RowEchelon {
  RationalMat reduced;
  std::vector<Eigen::Index> pivot_columns;
  std::vector<Eigen::Index> free_columns;

  inline Eigen::Index rank() const {
    return static_cast<Eigen::Index>(pivot_columns.size());
  }
};

/// Reduce the matrix to reduced row-echelon form using exact arithmetic.
RowEchelon reduced_row_echelon(const RationalMat &matrix);

/**
 * Compute the basis vector of a one-dimensional null space of the matrix.
 *
 * The single free variable is set to 1 and the pivot variables are found
 * by back-substitution from the reduced row-echelon form.
 *
 * \throws BalanceError of kind NoSolution if the null space is trivial,
 * AmbiguousSolution if it has two or more dimensions and
 * DisconnectedSystem if the basis vector has a zero entry.
 */
RationalVec solve_nullspace(const RationalMat &matrix);

} // namespace stoich::core
