#include <iostream>
#include <stoich/main/session.h>
#include <stoich/main/stoich_interactive.h>

namespace stoich::main {

CLI::App *add_interactive_subcommand(CLI::App &app) {
  CLI::App *interactive = app.add_subcommand(
      "interactive", "balance equations typed at a prompt (default)");
  interactive->fallthrough();
  interactive->callback([]() { run_interactive_subcommand(); });
  return interactive;
}

void run_interactive_subcommand() {
  Session session(std::cout);
  session.run(std::cin);
}

} // namespace stoich::main
