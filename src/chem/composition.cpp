#include <fmt/core.h>
#include <stdexcept>
#include <stoich/chem/composition.h>

namespace stoich::chem {

Composition::Count Composition::count(const std::string &symbol) const {
  auto loc = m_counts.find(symbol);
  if (loc == m_counts.end())
    return 0;
  return loc->second;
}

void Composition::add(const std::string &symbol, Count n) {
  if (n < 1) {
    throw std::invalid_argument(
        fmt::format("element counts must be positive, got {} for {}", n,
                    symbol));
  }
  Count total;
  if (__builtin_add_overflow(count(symbol), n, &total)) {
    throw std::overflow_error(
        fmt::format("count of {} exceeds the representable range", symbol));
  }
  m_counts[symbol] = total;
}

void Composition::merge(const Composition &other) {
  for (const auto &[symbol, n] : other) {
    add(symbol, n);
  }
}

Composition Composition::scaled(Count factor) const {
  if (factor < 1) {
    throw std::invalid_argument(
        fmt::format("composition scale factor must be positive, got {}",
                    factor));
  }
  Composition result;
  for (const auto &[symbol, n] : m_counts) {
    Count product;
    if (__builtin_mul_overflow(n, factor, &product)) {
      throw std::overflow_error(
          fmt::format("count of {} exceeds the representable range", symbol));
    }
    result.m_counts[symbol] = product;
  }
  return result;
}

std::vector<std::string> Composition::elements() const {
  std::vector<std::string> result;
  result.reserve(m_counts.size());
  for (const auto &kv : m_counts) {
    result.push_back(kv.first);
  }
  return result;
}

Composition::Count Composition::total_atoms() const {
  Count total = 0;
  for (const auto &kv : m_counts) {
    total += kv.second;
  }
  return total;
}

std::string Composition::to_string() const {
  std::string result;
  for (const auto &[symbol, n] : m_counts) {
    result += symbol;
    if (n > 1)
      result += std::to_string(n);
  }
  return result;
}

} // namespace stoich::chem
