#pragma once
#include <fmt/core.h>
#include <gmpxx.h>
#include <string>
#include <string_view>

namespace stoich::core {

/**
 * Exact rational number with arbitrary precision numerator and
 * denominator.
 *
 * All arithmetic in the balancing pipeline is performed with this type so
 * that no rounding can creep into the stoichiometric ratios. Values are
 * always kept in canonical form (lowest terms, positive denominator).
 */
using Rational = mpq_class;

/// Arbitrary precision integer
using Integer = mpz_class;

/**
 * Parse an expression like `"3/4"`, `"-2"` or `" 10/4 "` into a Rational.
 *
 * The result is canonicalized i.e. `"10/4"` becomes 5/2.
 *
 * \throws std::invalid_argument for malformed input or a zero denominator.
 */
Rational rational_from_string(const std::string &expr);

/// represent this rational as a string, `"5/2"`, or `"-3"` when integral
std::string to_string(const Rational &);

/// represent this integer as a string
std::string to_string(const Integer &);

/// true if the rational has denominator 1
inline bool is_integer(const Rational &q) { return q.get_den() == 1; }

} // namespace stoich::core

template <>
struct fmt::formatter<mpq_class> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const mpq_class &q, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(stoich::core::to_string(q),
                                                    ctx);
  }
};

template <>
struct fmt::formatter<mpz_class> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const mpz_class &z, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(stoich::core::to_string(z),
                                                    ctx);
  }
};
