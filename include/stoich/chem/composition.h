#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stoich::chem {

/**
 * The atomic makeup of a single compound: how many atoms of each element
 * one formula unit contains, after expanding every bracketed group and
 * hydrate multiplier.
 *
 * Keys are validated element symbols and are kept in sorted order. Every
 * stored count is at least 1, an element that is not stored has an
 * implicit count of zero.
 */
class Composition {
public:
  using Count = std::int64_t;
  using Storage = std::map<std::string, Count>;
  using const_iterator = Storage::const_iterator;

  Composition() = default;

  /// Number of atoms of symbol, 0 if absent
  Count count(const std::string &symbol) const;

  /// Add n (>= 1) atoms of the element to this composition
  void add(const std::string &symbol, Count n);

  /// Sum all counts of other into this composition
  void merge(const Composition &other);

  /// A copy of this composition with every count multiplied by factor
  Composition scaled(Count factor) const;

  /// Sorted element symbols present in this composition
  std::vector<std::string> elements() const;

  /// Total number of atoms in one formula unit
  Count total_atoms() const;

  inline bool empty() const { return m_counts.empty(); }
  inline std::size_t size() const { return m_counts.size(); }
  inline const_iterator begin() const { return m_counts.begin(); }
  inline const_iterator end() const { return m_counts.end(); }

  /// Flat formula with elements in sorted order e.g. `"H2O"`, `"CuH10O9S"`
  std::string to_string() const;

  bool operator==(const Composition &rhs) const {
    return m_counts == rhs.m_counts;
  }
  bool operator!=(const Composition &rhs) const { return !(*this == rhs); }

private:
  Storage m_counts;
};

} // namespace stoich::chem
