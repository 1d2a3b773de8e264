#include <cstdio>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <stoich/core/log.h>
#include <stoich/core/parallel.h>
#include <stoich/core/util.h>
#include <stoich/io/balance_json.h>
#include <stoich/main/session.h>
#include <stoich/main/stoich_balance.h>

namespace stoich::main {

std::vector<std::string> collect_equations(const BalanceConfig &config) {
  std::vector<std::string> equations = config.equations;
  if (config.input_filename.empty())
    return equations;

  std::ifstream file(config.input_filename);
  if (!file) {
    throw std::runtime_error(
        fmt::format("Could not open input file: {}", config.input_filename));
  }
  std::string line;
  size_t num_read = 0;
  while (std::getline(file, line)) {
    util::trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    equations.push_back(line);
    num_read++;
  }
  log::debug("Read {} equations from {}", num_read, config.input_filename);
  return equations;
}

std::vector<chem::BalanceResult>
balance_all(const std::vector<std::string> &equations) {
  const size_t n = equations.size();
  std::vector<std::optional<chem::BalanceResult>> slots(n);

  auto lambda = [&](int thread_id) {
    const size_t stride = parallel::get_num_threads();
    for (size_t i = thread_id; i < n; i += stride) {
      slots[i] = chem::balance(equations[i]);
    }
  };
  parallel::parallel_do(lambda);

  // OpenMP may run fewer threads than requested, leaving slots unvisited
  std::vector<chem::BalanceResult> results;
  results.reserve(n);
  for (size_t i = 0; i < n; i++) {
    if (!slots[i])
      slots[i] = chem::balance(equations[i]);
    results.push_back(std::move(*slots[i]));
  }
  return results;
}

CLI::App *add_balance_subcommand(CLI::App &app) {
  CLI::App *bal = app.add_subcommand("balance", "balance chemical equations");
  auto config = std::make_shared<BalanceConfig>();

  bal->add_option("equations", config->equations,
                  "equations to balance e.g. \"H2 + O2 -> H2O\"");
  bal->add_option("-i,--input", config->input_filename,
                  "file with one equation per line")
      ->check(CLI::ExistingFile);
  bal->add_option("--json", config->json_filename,
                  "write results as JSON to this file");
  bal->add_flag("--show-work", config->show_work,
                "print the matrix and null space for each equation");

  bal->fallthrough();
  bal->callback([config]() {
    if (run_balance_subcommand(*config) > 0)
      throw CLI::RuntimeError(1);
  });
  return bal;
}

int run_balance_subcommand(BalanceConfig const &config) {
  const auto equations = collect_equations(config);
  if (equations.empty()) {
    log::warn("No equations given");
    return 0;
  }
  log::debug("Balancing {} equations using {} threads", equations.size(),
             parallel::get_num_threads());

  const auto results = balance_all(equations);

  int num_failed = 0;
  for (const auto &result : results) {
    if (result.ok()) {
      fmt::print("{}\n", result.balanced_equation());
    } else {
      fmt::print("error: {}\n", result.error().what());
      num_failed++;
    }
    if (config.show_work) {
      std::fflush(stdout);
      print_work(std::cout, result);
      std::cout << std::string(separator_width, '=') << '\n' << std::flush;
    }
  }

  if (!config.json_filename.empty()) {
    nlohmann::json j = results;
    std::ofstream dest(config.json_filename);
    if (!dest) {
      throw std::runtime_error(
          fmt::format("Could not open {} for writing", config.json_filename));
    }
    dest << j.dump(2) << '\n';
    log::info("Wrote {} results to {}", results.size(), config.json_filename);
  }

  if (num_failed > 0) {
    log::warn("{} of {} equations could not be balanced", num_failed,
              results.size());
  }
  return num_failed;
}

} // namespace stoich::main
