#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <algorithm>
#include <cstdio>
#include <stoich/core/log.h>
#include <stoich/core/parallel.h>
#include <stoich/main/stoich_balance.h>
#include <stoich/main/stoich_elements.h>
#include <stoich/main/stoich_interactive.h>
#include <stoich/main/version.h>

int main(int argc, char *argv[]) {
  stoich::log::set_log_level(2);

  CLI::App app("stoich - A program for balancing chemical equations");
  app.allow_config_extras(CLI::config_extras_mode::error);
  app.set_config("--config", "stoich.toml",
                 "Read configuration from an ini or TOML file", false);

  app.set_help_all_flag("--help-all", "Show help for all sub commands");

  auto *threads_option = app.add_flag_function(
      "--threads{1}",
      [](int num_threads) {
        stoich::parallel::set_num_threads(std::max(1, num_threads));
      },
      "number of threads");
  threads_option->default_val(1);
  threads_option->run_callback_for_default();
  threads_option->force_callback();

  // logging verbosity
  auto *verbosity_option = app.add_flag_function(
      "--verbosity{2}",
      [](int verbosity) { stoich::log::set_log_level(verbosity); },
      "logging verbosity {0=silent,1=minimal,2=normal,3=verbose,4=debug}");
  verbosity_option->default_val(2);
  verbosity_option->run_callback_for_default();
  verbosity_option->force_callback();

  app.add_option_function<std::string>(
      "--log-file",
      [](const std::string &filename) { stoich::log::set_log_file(filename); },
      "write log messages to this file instead of the console");

  app.add_flag_callback(
      "--version",
      []() {
        stoich::main::print_header();
        throw CLI::Success();
      },
      "print version information and exit");

  stoich::main::add_balance_subcommand(app);
  stoich::main::add_interactive_subcommand(app);
  stoich::main::add_elements_subcommand(app);

  // no subcommand means an interactive session
  app.require_subcommand(0, 1);

  constexpr auto *error_format = "exception:\n    {}\nterminating program.\n";
  try {
    CLI11_PARSE(app, argc, argv);
    if (app.get_subcommands().empty()) {
      stoich::main::run_interactive_subcommand();
    }
  } catch (const char *ex) {
    stoich::log::error(error_format, ex);
    spdlog::dump_backtrace();
    return 1;
  } catch (std::string &ex) {
    stoich::log::error(error_format, ex);
    spdlog::dump_backtrace();
    return 1;
  } catch (std::exception &ex) {
    stoich::log::error(error_format, ex.what());
    spdlog::dump_backtrace();
    return 1;
  } catch (...) {
    stoich::log::error("Exception:\n- Unknown...\n");
    spdlog::dump_backtrace();
    return 1;
  }

  stoich::log::flush();
  // flush all FILE* streams before closing
  std::fflush(nullptr);
  return 0;
}
