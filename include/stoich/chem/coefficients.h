#pragma once
#include <cstdint>
#include <stoich/core/linear_algebra.h>
#include <vector>

namespace stoich::chem {

using CoefficientVector = std::vector<std::int64_t>;

/// Intermediate values of the conversion to integer coefficients
struct NormalizationTrace {
  /// least common multiple of the denominators
  core::Integer multiplier{1};
  /// integer vector after multiplying by the multiplier
  std::vector<core::Integer> scaled;
  /// greatest common divisor removed from the scaled vector
  core::Integer divisor{1};
};

/**
 * Scale a rational null space vector to the smallest vector of positive
 * integers with the same direction.
 *
 * Entries are multiplied by the LCM of their denominators, divided by the
 * GCD of the result and, if every entry came out non-positive, negated.
 * Order of entries is preserved.
 *
 * \throws stoich::core::BalanceError of kind NonPositiveCoefficient when
 * the vector is empty, zero or has entries of both signs, and
 * CoefficientOutOfRange when a coefficient does not fit 64 bits.
 */
CoefficientVector normalize(const RationalVec &vector,
                            NormalizationTrace *trace = nullptr);

} // namespace stoich::chem
