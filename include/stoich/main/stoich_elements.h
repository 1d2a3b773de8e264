#pragma once
#include <CLI/App.hpp>
#include <stoich/io/table.h>

namespace stoich::main {

/// atomic number, symbol, name and mass of every accepted element
io::Table element_table();

CLI::App *add_elements_subcommand(CLI::App &app);
void run_elements_subcommand();

} // namespace stoich::main
