#pragma once
#include <Eigen/Core>
#include <cstdint>
#include <stoich/core/rational.h>
#include <vector>

namespace Eigen {

// mpq_class as an Eigen scalar. Only storage, element access and block
// operations are used with it, never decompositions.
template <> struct NumTraits<mpq_class> : GenericNumTraits<mpq_class> {
  typedef mpq_class Real;
  typedef mpq_class NonInteger;
  typedef mpq_class Literal;
  typedef mpq_class Nested;

  enum {
    IsInteger = 0,
    IsSigned = 1,
    IsComplex = 0,
    RequireInitialization = 1,
    ReadCost = 6,
    AddCost = 150,
    MulCost = 100
  };

  static inline Real epsilon() { return 0; }
  static inline Real dummy_precision() { return 0; }
  static inline int digits10() { return 0; }
  static inline int max_digits10() { return 0; }
};

} // namespace Eigen

namespace stoich {

using RationalMat = Eigen::Matrix<core::Rational, Eigen::Dynamic,
                                  Eigen::Dynamic, Eigen::RowMajor>;
using RationalVec = Eigen::Matrix<core::Rational, Eigen::Dynamic, 1>;

namespace core {

/// least common multiple of every denominator in v (1 for an empty vector)
Integer denominator_lcm(const RationalVec &v);

/// greatest common divisor of the absolute values in v (0 if all zero)
Integer gcd(const std::vector<Integer> &v);

} // namespace core
} // namespace stoich
