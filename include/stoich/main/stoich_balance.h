#pragma once
#include <CLI/App.hpp>
#include <stoich/chem/balance.h>
#include <string>
#include <vector>

namespace stoich::main {

struct BalanceConfig {
  std::vector<std::string> equations{};
  std::string input_filename{""};
  std::string json_filename{""};
  bool show_work{false};
};

/// Equations from the command line followed by those in the input file.
/// Blank lines and lines starting with '#' in the file are skipped.
std::vector<std::string> collect_equations(const BalanceConfig &config);

/// Balance every equation on parallel::get_num_threads() workers, results
/// are returned in input order.
std::vector<chem::BalanceResult>
balance_all(const std::vector<std::string> &equations);

CLI::App *add_balance_subcommand(CLI::App &app);
/// \returns the number of equations that could not be balanced
int run_balance_subcommand(BalanceConfig const &);

} // namespace stoich::main
