/**
 * @mainpage stoich
 *
 * \section welcome Welcome
 *
 * API documentation for stoich, a chemical equation balancer that works
 * with exact rational arithmetic throughout.
 *
 * This is the documentation for the code, not for the `stoich` program.
 * Run `stoich --help-all` for the command line options.
 *
 * \section example Balancing an equation
 *
 * \code
 *
 * #include <stoich/chem/balance.h>
 * #include <fmt/core.h>
 *
 * int main(int argc, char **argv) {
 *    auto result = stoich::chem::balance("Al + H2SO4 -> Al2(SO4)3 + H2");
 *    if (result) {
 *        // 2Al + 3H2SO4 -> Al2(SO4)3 + 3H2
 *        fmt::print("{}\n", result.balanced_equation());
 *    } else {
 *        fmt::print("{}\n", result.error().what());
 *    }
 * }
 *
 * \endcode
 *
 */

/**
 * @namespace stoich::core
 * @brief elements, errors, exact rationals and the null space solver
 * @details No dependencies on other modules in stoich
 */

/**
 * @namespace stoich::chem
 * @brief formulas, equations, the stoichiometry matrix and balancing
 * @details depends on stoich::core
 */

/**
 * @namespace stoich::io
 * @brief text tables and JSON output of balance results
 * @details depends on stoich::chem and the nlohmann::json library
 */

/**
 * @namespace stoich::main
 * @brief the interactive session and command line subcommands
 * @details depends on all other modules and the CLI11 library
 */
