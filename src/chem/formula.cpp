#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <stoich/chem/formula.h>
#include <stoich/core/element.h>
#include <stoich/core/errors.h>
#include <stoich/core/log.h>
#include <stoich/core/util.h>
#include <string_view>
#include <utility>
#include <vector>

namespace stoich::chem {

using core::BalanceError;
using core::ErrorKind;

namespace {

constexpr std::string_view middle_dot{"\xC2\xB7"};
// multipliers are limited to 9 digits so they always fit a 32-bit count
constexpr std::size_t max_multiplier_digits{9};

inline bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c));
}
inline bool is_upper(char c) {
  return std::isupper(static_cast<unsigned char>(c));
}
inline bool is_lower(char c) {
  return std::islower(static_cast<unsigned char>(c));
}
inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c));
}

inline char matching_bracket(char open) { return open == '(' ? ')' : ']'; }

class FormulaParser {
public:
  explicit FormulaParser(std::string_view text) : m_text(text) {}

  Composition parse() {
    if (stoich::util::is_blank(m_text)) {
      throw BalanceError(ErrorKind::EmptyFormula, "empty formula",
                         std::string(m_text), 0);
    }

    Composition total;
    bool first_segment = true;
    while (true) {
      skip_whitespace();
      const std::size_t segment_start = m_pos;
      Composition::Count multiplier = 1;
      if (!first_segment && m_pos < m_text.size() && is_digit(m_text[m_pos])) {
        multiplier = read_multiplier("hydrate multiplier");
        skip_whitespace();
      }

      Composition segment = parse_segment();
      if (segment.empty()) {
        throw BalanceError(ErrorKind::EmptyFormula,
                           first_segment ? "formula has no elements before "
                                           "the hydrate separator"
                                         : "empty hydrate segment",
                           std::string(m_text.substr(segment_start,
                                                     m_pos - segment_start)),
                           segment_start);
      }
      merge_scaled(total, segment, multiplier, segment_start);

      if (m_pos >= m_text.size())
        break;
      // parse_segment only stops early on a hydrate separator
      m_pos += separator_length(m_pos);
      first_segment = false;
    }
    return total;
  }

private:
  struct Frame {
    Composition counts;
    char open{'\0'};
    std::size_t position{0};
  };

  std::string_view m_text;
  std::size_t m_pos{0};
  std::vector<Frame> m_stack;

  std::size_t separator_length(std::size_t pos) const {
    if (pos >= m_text.size())
      return 0;
    const char c = m_text[pos];
    if (c == '.' || c == '*')
      return 1;
    if (m_text.compare(pos, middle_dot.size(), middle_dot) == 0)
      return middle_dot.size();
    return 0;
  }

  void skip_whitespace() {
    while (m_pos < m_text.size() && is_space(m_text[m_pos]))
      m_pos++;
  }

  // true if only whitespace remains before the end of the formula or the
  // next hydrate separator
  bool at_segment_end(std::size_t pos) const {
    while (pos < m_text.size() && is_space(m_text[pos]))
      pos++;
    return pos >= m_text.size() || separator_length(pos) > 0;
  }

  std::string with_letter_for_digit(std::size_t pos) const {
    std::string result(m_text);
    result[pos] = (result[pos] == '1') ? 'I' : 'O';
    return result;
  }

  [[noreturn]] void numeral_in_place_of_symbol(std::string_view digits,
                                               std::size_t digit_pos,
                                               std::size_t run_pos) const {
    BalanceError err(
        ErrorKind::NumeralInPlaceOfSymbol,
        fmt::format("numeral '{}' used where an element symbol was expected",
                    m_text[digit_pos]),
        std::string(digits), run_pos);
    if (m_text[digit_pos] == '0' || m_text[digit_pos] == '1') {
      err.set_suggestion(with_letter_for_digit(digit_pos));
    }
    throw err;
  }

  Composition::Count parse_digits(std::string_view digits, std::size_t pos,
                                  const char *what) const {
    if (digits.find_first_not_of('0') == std::string_view::npos) {
      throw BalanceError(ErrorKind::InvalidMultiplier,
                         fmt::format("{} must not be zero", what),
                         std::string(digits), pos);
    }
    if (digits.size() > max_multiplier_digits) {
      throw BalanceError(ErrorKind::InvalidMultiplier,
                         fmt::format("{} '{}' is too large", what, digits),
                         std::string(digits), pos);
    }
    Composition::Count value = 0;
    for (char c : digits) {
      value = value * 10 + (c - '0');
    }
    return value;
  }

  std::string_view read_digit_run() {
    const std::size_t start = m_pos;
    while (m_pos < m_text.size() && is_digit(m_text[m_pos]))
      m_pos++;
    return m_text.substr(start, m_pos - start);
  }

  // multiplier after a closing bracket or in front of a hydrate segment
  Composition::Count read_multiplier(const char *what) {
    const std::size_t start = m_pos;
    auto digits = read_digit_run();
    if (digits.empty())
      return 1;
    if (digits.size() > 1 && digits.front() == '0' &&
        digits.find_first_not_of('0') != std::string_view::npos) {
      throw BalanceError(
          ErrorKind::InvalidMultiplier,
          fmt::format("{} '{}' has a leading zero", what, digits),
          std::string(digits), start);
    }
    return parse_digits(digits, start, what);
  }

  // count directly following an element symbol
  Composition::Count read_element_count(const std::string &symbol) {
    const std::size_t start = m_pos;
    auto digits = read_digit_run();
    if (digits.empty())
      return 1;
    if (digits.find_first_not_of('0') == std::string_view::npos) {
      return parse_digits(digits, start, "element count");
    }
    // H02: the zero stands in for the letter O
    if (digits.front() == '0') {
      numeral_in_place_of_symbol(digits, start, start);
    }
    // H20 at the end of a formula: H2 followed by 0 in place of O
    if (digits.size() > 1 && digits.back() == '0' && at_segment_end(m_pos)) {
      numeral_in_place_of_symbol(digits, m_pos - 1, start);
    }
    log::trace("element {} count {} at {}", symbol, digits, start);
    return parse_digits(digits, start, "element count");
  }

  void merge_scaled(Composition &target, const Composition &source,
                    Composition::Count multiplier, std::size_t pos) const {
    try {
      target.merge(source.scaled(multiplier));
    } catch (const std::overflow_error &e) {
      throw BalanceError(ErrorKind::InvalidMultiplier, e.what(),
                         std::string(m_text), pos);
    }
  }

  [[noreturn]] void unbalanced(const std::string &message, char bracket,
                                std::size_t pos) const {
    throw BalanceError(ErrorKind::UnbalancedBrackets, message,
                       std::string(1, bracket), pos);
  }

  Composition parse_segment() {
    m_stack.clear();
    m_stack.push_back(Frame{});

    while (m_pos < m_text.size()) {
      const char c = m_text[m_pos];
      if (is_space(c)) {
        m_pos++;
        continue;
      }
      if (separator_length(m_pos) > 0) {
        if (m_stack.size() > 1) {
          const auto &open = m_stack.back();
          unbalanced("hydrate separator inside an unclosed bracket group",
                     open.open, open.position);
        }
        break;
      }

      if (is_upper(c)) {
        const std::size_t start = m_pos++;
        while (m_pos < m_text.size() && is_lower(m_text[m_pos]))
          m_pos++;
        std::string symbol(m_text.substr(start, m_pos - start));
        if (!core::is_element_symbol(symbol)) {
          throw BalanceError(ErrorKind::UnknownElement,
                             fmt::format("unknown element '{}'", symbol),
                             symbol, start);
        }
        const auto n = read_element_count(symbol);
        try {
          m_stack.back().counts.add(symbol, n);
        } catch (const std::overflow_error &e) {
          throw BalanceError(ErrorKind::InvalidMultiplier, e.what(), symbol,
                             start);
        }
      } else if (is_lower(c)) {
        const std::size_t start = m_pos;
        while (m_pos < m_text.size() && is_lower(m_text[m_pos]))
          m_pos++;
        std::string symbol(m_text.substr(start, m_pos - start));
        throw BalanceError(
            ErrorKind::UnknownElement,
            fmt::format("unknown element '{}', symbols start with an "
                        "uppercase letter",
                        symbol),
            symbol, start);
      } else if (c == '(' || c == '[') {
        m_stack.push_back(Frame{Composition{}, c, m_pos});
        m_pos++;
      } else if (c == ')' || c == ']') {
        if (m_stack.size() < 2) {
          unbalanced(fmt::format("'{}' without a matching opening bracket", c),
                     c, m_pos);
        }
        if (matching_bracket(m_stack.back().open) != c) {
          unbalanced(fmt::format("'{}' closes '{}' opened at {}", c,
                                 m_stack.back().open,
                                 m_stack.back().position),
                     c, m_pos);
        }
        m_pos++;
        const auto multiplier = read_multiplier("group multiplier");
        Frame group = std::move(m_stack.back());
        m_stack.pop_back();
        if (group.counts.empty()) {
          throw BalanceError(
              ErrorKind::EmptyFormula, "empty bracket group",
              std::string(
                  m_text.substr(group.position, m_pos - group.position)),
              group.position);
        }
        merge_scaled(m_stack.back().counts, group.counts, multiplier,
                     group.position);
      } else if (is_digit(c)) {
        const std::size_t start = m_pos;
        auto digits = read_digit_run();
        numeral_in_place_of_symbol(digits, start, start);
      } else {
        const auto len = std::min(
            stoich::util::utf8_sequence_length(static_cast<unsigned char>(c)),
            m_text.size() - m_pos);
        std::string fragment(m_text.substr(m_pos, len));
        throw BalanceError(ErrorKind::InvalidCharacter,
                           fmt::format("invalid character '{}'", fragment),
                           fragment, m_pos);
      }
    }

    if (m_stack.size() > 1) {
      const auto &open = m_stack.back();
      unbalanced(fmt::format("'{}' is never closed", open.open), open.open,
                 open.position);
    }
    return std::move(m_stack.front().counts);
  }
};

} // namespace

Composition parse_formula(const std::string &text) {
  FormulaParser parser(text);
  auto result = parser.parse();
  log::trace("Parsed formula '{}' -> {}", text, result.to_string());
  return result;
}

Compound parse_compound(const std::string &text) {
  return Compound{text, parse_formula(text), 1};
}

} // namespace stoich::chem
