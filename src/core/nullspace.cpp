#include <stoich/core/errors.h>
#include <stoich/core/log.h>
#include <stoich/core/nullspace.h>

namespace stoich::core {

RowEchelon reduced_row_echelon(const RationalMat &matrix) {
  RowEchelon result;
  result.reduced = matrix;
  auto &m = result.reduced;
  const Eigen::Index rows = m.rows();
  const Eigen::Index cols = m.cols();

  Eigen::Index pivot_row = 0;
  for (Eigen::Index col = 0; col < cols; col++) {
    if (pivot_row >= rows) {
      result.free_columns.push_back(col);
      continue;
    }

    // any non-zero entry is an exact pivot, take the first
    Eigen::Index found = -1;
    for (Eigen::Index r = pivot_row; r < rows; r++) {
      if (sgn(m(r, col)) != 0) {
        found = r;
        break;
      }
    }
    if (found < 0) {
      result.free_columns.push_back(col);
      continue;
    }
    if (found != pivot_row) {
      m.row(found).swap(m.row(pivot_row));
    }

    const Rational pivot = m(pivot_row, col);
    for (Eigen::Index c = col; c < cols; c++) {
      m(pivot_row, c) /= pivot;
    }

    for (Eigen::Index r = 0; r < rows; r++) {
      if (r == pivot_row || sgn(m(r, col)) == 0)
        continue;
      const Rational factor = m(r, col);
      for (Eigen::Index c = col; c < cols; c++) {
        m(r, c) -= factor * m(pivot_row, c);
      }
    }

    result.pivot_columns.push_back(col);
    pivot_row++;
  }
  return result;
}

RationalVec solve_nullspace(const RationalMat &matrix) {
  const auto rref = reduced_row_echelon(matrix);
  const Eigen::Index num_free = rref.free_columns.size();
  log::debug("Reduced {}x{} matrix, rank {}, {} free variable(s)",
             matrix.rows(), matrix.cols(), rref.rank(), num_free);

  if (num_free == 0) {
    throw BalanceError(ErrorKind::NoSolution,
                       "the null space is empty, only the trivial solution "
                       "conserves every element");
  }
  if (num_free > 1) {
    throw BalanceError(
        ErrorKind::AmbiguousSolution,
        fmt::format("the null space has {} dimensions, the equation has "
                    "infinitely many independent balancings",
                    num_free));
  }

  const Eigen::Index free_col = rref.free_columns.front();
  RationalVec result(matrix.cols());
  result(free_col) = 1;
  for (Eigen::Index i = 0; i < rref.rank(); i++) {
    result(rref.pivot_columns[i]) = -rref.reduced(i, free_col);
  }

  for (Eigen::Index i = 0; i < result.size(); i++) {
    if (sgn(result(i)) == 0) {
      throw BalanceError(
          ErrorKind::DisconnectedSystem,
          fmt::format("compound {} has a zero coefficient in the only "
                      "solution, it does not take part in the reaction",
                      i + 1),
          std::to_string(i + 1));
    }
  }
  return result;
}

} // namespace stoich::core
