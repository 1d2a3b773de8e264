#pragma once
#include <ankerl/unordered_dense.h>
#include <fmt/core.h>
#include <ostream>
#include <stoich/core/linear_algebra.h>
#include <string>
#include <type_traits>
#include <vector>

namespace stoich::io {

struct ColumnConfiguration {
  struct Border {
    std::string left{""};
    std::string right{" "};
  };
  enum class Alignment : char {
    left = '<',
    right = '>',
    center = '^',
  };

  std::size_t width{12};
  Alignment alignment{Alignment::left};
  Border border;
  std::string fill_value{""};

  std::string format_string() const {
    return fmt::format("{0}{{:{1}{2}s}}{3}", border.left,
                       static_cast<char>(alignment), width, border.right);
  }
  std::size_t column_width() const {
    return width + border.left.size() + border.right.size();
  }
};

/**
 * Plain text table, built column by column and printed with a header row.
 *
 * Columns of numbers (arithmetic types and exact rationals) are right
 * aligned, everything else left aligned. Each column is as wide as its
 * widest cell or header.
 */
class Table {
public:
  Table() = default;

  template <typename T>
  std::size_t set_column(const std::string &name, const std::vector<T> &column,
                         const std::string &fmt_string = "{}") {
    ColumnConfiguration config;
    if constexpr (std::is_arithmetic<T>::value ||
                  std::is_same<T, core::Rational>::value ||
                  std::is_same<T, core::Integer>::value)
      config.alignment = ColumnConfiguration::Alignment::right;
    std::vector<std::string> cells;
    cells.reserve(column.size());
    for (const auto &val : column) {
      cells.push_back(fmt::format(fmt::runtime(fmt_string), val));
    }
    add_column(name, std::move(cells), config);
    return column.size();
  }

  /// one column per matrix column, named by names
  template <typename TA>
  std::size_t set_columns(const std::vector<std::string> &names,
                          const Eigen::DenseBase<TA> &a,
                          const std::string &fmt_string = "{}") {
    for (Eigen::Index c = 0; c < a.cols(); c++) {
      ColumnConfiguration config;
      config.alignment = ColumnConfiguration::Alignment::right;
      std::vector<std::string> cells;
      cells.reserve(a.rows());
      for (Eigen::Index r = 0; r < a.rows(); r++) {
        cells.push_back(fmt::format(fmt::runtime(fmt_string), a(r, c)));
      }
      const auto name = static_cast<std::size_t>(c) < names.size()
                            ? names[c]
                            : fmt::format("{}", c);
      add_column(name, std::move(cells), config);
    }
    return a.rows();
  }

  std::size_t num_rows() const;
  std::size_t num_cols() const;

  /// total characters per line
  std::size_t width() const;

  std::string to_string() const;
  void print(std::ostream &os) const;

private:
  void add_column(const std::string &name, std::vector<std::string> cells,
                  ColumnConfiguration config);

  std::vector<std::string> m_column_order;
  ankerl::unordered_dense::map<std::string, std::vector<std::string>>
      m_columns;
  ankerl::unordered_dense::map<std::string, ColumnConfiguration>
      m_column_config;
};

} // namespace stoich::io
