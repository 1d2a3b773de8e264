#include <stoich/core/linear_algebra.h>

namespace stoich::core {

Integer denominator_lcm(const RationalVec &v) {
  Integer result{1};
  for (Eigen::Index i = 0; i < v.size(); i++) {
    mpz_lcm(result.get_mpz_t(), result.get_mpz_t(),
            v(i).get_den().get_mpz_t());
  }
  return result;
}

Integer gcd(const std::vector<Integer> &v) {
  Integer result{0};
  for (const auto &x : v) {
    mpz_gcd(result.get_mpz_t(), result.get_mpz_t(), x.get_mpz_t());
  }
  return result;
}

} // namespace stoich::core
