#include <stdexcept>
#include <stoich/core/rational.h>
#include <stoich/core/util.h>

namespace stoich::core {

Rational rational_from_string(const std::string &expr) {
  auto trimmed = stoich::util::trim_copy(expr);
  if (trimmed.empty()) {
    throw std::invalid_argument("empty rational expression");
  }

  Integer numerator, denominator{1};
  auto slash = trimmed.find('/');
  try {
    if (slash == std::string::npos) {
      numerator = Integer(trimmed);
    } else {
      numerator = Integer(stoich::util::trim_copy(trimmed.substr(0, slash)));
      denominator =
          Integer(stoich::util::trim_copy(trimmed.substr(slash + 1)));
    }
  } catch (const std::invalid_argument &) {
    throw std::invalid_argument(
        fmt::format("could not parse rational from '{}'", expr));
  }
  if (denominator == 0) {
    throw std::invalid_argument(
        fmt::format("zero denominator in rational '{}'", expr));
  }
  Rational result(numerator, denominator);
  result.canonicalize();
  return result;
}

std::string to_string(const Rational &q) {
  if (is_integer(q))
    return q.get_num().get_str();
  return q.get_str();
}

std::string to_string(const Integer &z) { return z.get_str(); }

} // namespace stoich::core
