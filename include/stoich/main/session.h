#pragma once
#include <iosfwd>
#include <optional>
#include <stoich/chem/balance.h>
#include <string>

namespace stoich::main {

inline constexpr int separator_width = 50;

/**
 * Interactive read-balance-print session.
 *
 * Lines are handled one at a time and every response is written to the
 * output stream given on construction. The only state kept between lines
 * is the result of the last successful balance, used by `show work`.
 */
class Session {
public:
  explicit Session(std::ostream &out) : m_out(out) {}

  void print_banner();

  /// Handle one line of input. Returns false once the user has quit.
  bool handle_line(const std::string &line);

  /// Prompt for and handle lines from in until quit or end of input
  void run(std::istream &in);

  inline const std::optional<chem::BalanceResult> &last_result() const {
    return m_last_result;
  }

private:
  void balance_and_report(const std::string &line);
  void print_separator();

  std::ostream &m_out;
  std::optional<chem::BalanceResult> m_last_result;
};

/// User-facing explanation of a balancing failure, may span several lines
std::string error_message(const core::BalanceError &error);

/// Matrix, null space and coefficient derivation for a balance result
void print_work(std::ostream &out, const chem::BalanceResult &result);

} // namespace stoich::main
