#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <stoich/io/table.h>
#include <utility>

namespace stoich::io {

void Table::add_column(const std::string &name, std::vector<std::string> cells,
                       ColumnConfiguration config) {
  // a zero width would be read as the zero padding flag
  std::size_t cell_width = std::max<std::size_t>(1, name.size());
  for (const auto &cell : cells) {
    cell_width = std::max(cell_width, cell.size());
  }
  config.width = cell_width;
  if (m_columns.find(name) == m_columns.end()) {
    m_column_order.push_back(name);
  }
  m_columns[name] = std::move(cells);
  m_column_config[name] = config;
}

std::size_t Table::num_cols() const { return m_columns.size(); }

std::size_t Table::num_rows() const {
  std::size_t n = 0;
  for (const auto &kv : m_columns) {
    n = std::max(n, kv.second.size());
  }
  return n;
}

std::size_t Table::width() const {
  std::size_t w = 0;
  for (const auto &key : m_column_order) {
    w += m_column_config.at(key).column_width();
  }
  return w;
}

std::string Table::to_string() const {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  for (const auto &key : m_column_order) {
    std::string fs = m_column_config.at(key).format_string();
    fmt::format_to(out, fmt::runtime(fs), key);
  }
  fmt::format_to(out, "\n");
  for (std::size_t row = 0; row < num_rows(); row++) {
    for (const std::string &key : m_column_order) {
      const auto &c = m_columns.at(key);
      const auto &config = m_column_config.at(key);
      fmt::format_to(out, fmt::runtime(config.format_string()),
                     (row < c.size()) ? c[row] : config.fill_value);
    }
    fmt::format_to(out, "\n");
  }
  return fmt::to_string(buf);
}

void Table::print(std::ostream &os) const { os << to_string(); }

} // namespace stoich::io
