#include <algorithm>
#include <stoich/chem/coefficients.h>
#include <stoich/core/errors.h>
#include <stoich/core/log.h>
#include <string>

namespace stoich::chem {

using core::BalanceError;
using core::ErrorKind;
using core::Integer;

CoefficientVector normalize(const RationalVec &vector,
                            NormalizationTrace *trace) {
  if (vector.size() == 0) {
    throw BalanceError(ErrorKind::NonPositiveCoefficient,
                       "no coefficients to normalize");
  }

  const Integer multiplier = core::denominator_lcm(vector);
  std::vector<Integer> scaled(vector.size());
  for (Eigen::Index i = 0; i < vector.size(); i++) {
    const auto &q = vector(i);
    scaled[i] = q.get_num() * (multiplier / q.get_den());
  }

  const Integer divisor = core::gcd(scaled);
  if (trace) {
    trace->multiplier = multiplier;
    trace->scaled = scaled;
    trace->divisor = divisor;
  }
  if (divisor == 0) {
    throw BalanceError(ErrorKind::NonPositiveCoefficient,
                       "every coefficient is zero");
  }

  std::vector<Integer> reduced(scaled.size());
  for (std::size_t i = 0; i < scaled.size(); i++) {
    mpz_divexact(reduced[i].get_mpz_t(), scaled[i].get_mpz_t(),
                 divisor.get_mpz_t());
  }

  const bool all_non_positive = std::all_of(
      reduced.begin(), reduced.end(), [](const Integer &x) { return x <= 0; });
  if (all_non_positive) {
    for (auto &x : reduced)
      x = -x;
  }

  CoefficientVector result;
  result.reserve(reduced.size());
  for (std::size_t i = 0; i < reduced.size(); i++) {
    const auto &x = reduced[i];
    if (x <= 0) {
      throw BalanceError(
          ErrorKind::NonPositiveCoefficient,
          fmt::format("coefficient {} is {} after normalization, no "
                      "all-positive solution exists",
                      i + 1, x.get_str()),
          std::to_string(i + 1));
    }
    if (!x.fits_slong_p()) {
      throw BalanceError(ErrorKind::CoefficientOutOfRange,
                         fmt::format("coefficient {} ({}) does not fit a "
                                     "64-bit integer",
                                     i + 1, x.get_str()),
                         x.get_str());
    }
    result.push_back(x.get_si());
  }
  log::debug("Normalized coefficients: multiplier {}, divisor {}",
             multiplier.get_str(), divisor.get_str());
  return result;
}

} // namespace stoich::chem
