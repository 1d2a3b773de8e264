#include <ankerl/unordered_dense.h>
#include <stdexcept>
#include <stoich/core/element.h>
#include <stoich/core/errors.h>
#include <string>

namespace stoich::core {

namespace {

using SymbolIndex = ankerl::unordered_dense::map<std::string_view, int>;

const SymbolIndex &symbol_index() {
  static const SymbolIndex index = [] {
    SymbolIndex result;
    for (int i = 1; i <= STOICH_ELEMENT_MAX; i++) {
      result.emplace(ELEMENTDATA_TABLE[i].symbol, i);
    }
    return result;
  }();
  return index;
}

} // namespace

Element::Element(std::string_view symbol) {
  const auto &index = symbol_index();
  auto loc = index.find(symbol);
  if (loc == index.end()) {
    throw BalanceError(ErrorKind::UnknownElement,
                       fmt::format("unknown element symbol '{}'", symbol),
                       std::string(symbol));
  }
  m_data = &ELEMENTDATA_TABLE[loc->second];
}

Element::Element(int num) {
  if (num < 1 || num > STOICH_ELEMENT_MAX) {
    throw std::out_of_range(
        fmt::format("atomic number {} outside [1, {}]", num,
                    STOICH_ELEMENT_MAX));
  }
  m_data = &ELEMENTDATA_TABLE[num];
}

bool is_element_symbol(std::string_view symbol) {
  return symbol_index().contains(symbol);
}

std::vector<Element> all_elements() {
  std::vector<Element> result;
  result.reserve(STOICH_ELEMENT_MAX);
  for (int i = 1; i <= STOICH_ELEMENT_MAX; i++) {
    result.emplace_back(i);
  }
  return result;
}

} // namespace stoich::core
