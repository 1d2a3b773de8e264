#include <iostream>
#include <stoich/core/element.h>
#include <stoich/main/stoich_elements.h>

namespace stoich::main {

io::Table element_table() {
  std::vector<int> numbers;
  std::vector<std::string> symbols, names;
  std::vector<double> masses;
  for (const auto &el : core::all_elements()) {
    numbers.push_back(el.atomic_number());
    symbols.push_back(el.symbol());
    names.push_back(el.name());
    masses.push_back(el.mass());
  }
  io::Table table;
  table.set_column("Z", numbers);
  table.set_column("symbol", symbols);
  table.set_column("name", names);
  table.set_column("mass", masses, "{:.4f}");
  return table;
}

CLI::App *add_elements_subcommand(CLI::App &app) {
  CLI::App *elements =
      app.add_subcommand("elements", "list the accepted element symbols");
  elements->fallthrough();
  elements->callback([]() { run_elements_subcommand(); });
  return elements;
}

void run_elements_subcommand() { element_table().print(std::cout); }

} // namespace stoich::main
