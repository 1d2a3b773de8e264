#pragma once
#include <CLI/App.hpp>

namespace stoich::main {

CLI::App *add_interactive_subcommand(CLI::App &app);
void run_interactive_subcommand();

} // namespace stoich::main
