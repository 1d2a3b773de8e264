#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <limits>
#include <map>
#include <numeric>
#include <stoich/chem/balance.h>
#include <stoich/chem/coefficients.h>
#include <stoich/chem/composition.h>
#include <stoich/chem/equation.h>
#include <stoich/chem/formula.h>
#include <stoich/chem/stoichiometry.h>
#include <stoich/core/errors.h>
#include <stoich/io/balance_json.h>

using stoich::RationalVec;
using stoich::chem::balance;
using stoich::chem::Composition;
using stoich::chem::normalize;
using stoich::chem::parse_equation;
using stoich::chem::parse_formula;
using stoich::core::BalanceError;
using stoich::core::EquationSide;
using stoich::core::ErrorKind;
using stoich::core::Rational;

namespace {

BalanceError formula_error(const std::string &formula) {
  try {
    parse_formula(formula);
  } catch (const BalanceError &e) {
    return e;
  }
  FAIL("expected '" << formula << "' to fail");
  throw std::logic_error("unreachable");
}

BalanceError equation_error(const std::string &equation) {
  try {
    parse_equation(equation);
  } catch (const BalanceError &e) {
    return e;
  }
  FAIL("expected '" << equation << "' to fail");
  throw std::logic_error("unreachable");
}

ErrorKind balance_error_kind(const std::string &equation) {
  auto result = balance(equation);
  REQUIRE(!result.ok());
  return result.error().kind();
}

Composition
composition(std::initializer_list<std::pair<const char *, long>> counts) {
  Composition result;
  for (const auto &[symbol, n] : counts) {
    result.add(symbol, n);
  }
  return result;
}

} // namespace

/* Composition tests */

TEST_CASE("Composition counts", "[composition]") {
  Composition c;
  REQUIRE(c.empty());
  c.add("O", 1);
  c.add("H", 2);
  c.add("O", 1);
  REQUIRE(c.count("H") == 2);
  REQUIRE(c.count("O") == 2);
  REQUIRE(c.count("N") == 0);
  REQUIRE(c.size() == 2);
  REQUIRE(c.total_atoms() == 4);
  REQUIRE(c.elements() == std::vector<std::string>{"H", "O"});
  REQUIRE(c.to_string() == "H2O2");
  REQUIRE_THROWS_AS(c.add("H", 0), std::invalid_argument);
}

TEST_CASE("Composition scaling", "[composition]") {
  auto water = composition({{"H", 2}, {"O", 1}});
  auto five = water.scaled(5);
  REQUIRE(five.count("H") == 10);
  REQUIRE(five.count("O") == 5);
  REQUIRE(water.count("H") == 2);

  Composition huge;
  huge.add("C", std::numeric_limits<Composition::Count>::max() / 2 + 1);
  REQUIRE_THROWS_AS(huge.scaled(2), std::overflow_error);
  REQUIRE_THROWS_AS(huge.merge(huge), std::overflow_error);
  // a failed add leaves the count unchanged
  REQUIRE_THROWS_AS(huge.add("C", huge.count("C")), std::overflow_error);
  REQUIRE(huge.count("C") ==
          std::numeric_limits<Composition::Count>::max() / 2 + 1);
}

/* Formula parser tests */

TEST_CASE("Parse simple formulas", "[formula]") {
  REQUIRE(parse_formula("H2O") == composition({{"H", 2}, {"O", 1}}));
  REQUIRE(parse_formula("NaCl") == composition({{"Na", 1}, {"Cl", 1}}));
  REQUIRE(parse_formula("C6H12O6") ==
          composition({{"C", 6}, {"H", 12}, {"O", 6}}));
  // repeated symbols accumulate
  REQUIRE(parse_formula("CH3COOH") ==
          composition({{"C", 2}, {"H", 4}, {"O", 2}}));
  REQUIRE(parse_formula("C10H8") == composition({{"C", 10}, {"H", 8}}));
  REQUIRE(parse_formula(" H2 O ") == composition({{"H", 2}, {"O", 1}}));
}

TEST_CASE("Parse bracket groups", "[formula]") {
  REQUIRE(parse_formula("Al2(SO4)3") ==
          composition({{"Al", 2}, {"S", 3}, {"O", 12}}));
  REQUIRE(parse_formula("Ca(OH)2") ==
          composition({{"Ca", 1}, {"O", 2}, {"H", 2}}));
  REQUIRE(parse_formula("K4[Fe(CN)6]") ==
          composition({{"K", 4}, {"Fe", 1}, {"C", 6}, {"N", 6}}));
  REQUIRE(parse_formula("(NH4)2SO4") ==
          composition({{"N", 2}, {"H", 8}, {"S", 1}, {"O", 4}}));
  // a bracket multiplier may end in zero
  REQUIRE(parse_formula("(C)60") == composition({{"C", 60}}));
}

TEST_CASE("Parse hydrates", "[formula]") {
  auto expected = composition({{"Cu", 1}, {"S", 1}, {"O", 9}, {"H", 10}});
  REQUIRE(parse_formula("CuSO4\xC2\xB7" "5H2O") == expected);
  REQUIRE(parse_formula("CuSO4.5H2O") == expected);
  REQUIRE(parse_formula("CuSO4*5H2O") == expected);
  REQUIRE(parse_formula("Na2CO3.10H2O") ==
          composition({{"Na", 2}, {"C", 1}, {"O", 13}, {"H", 20}}));
}

TEST_CASE("Formula errors", "[formula]") {
  SECTION("empty") {
    REQUIRE(formula_error("").kind() == ErrorKind::EmptyFormula);
    REQUIRE(formula_error("   ").kind() == ErrorKind::EmptyFormula);
    REQUIRE(formula_error("Ca()").kind() == ErrorKind::EmptyFormula);
    REQUIRE(formula_error("CuSO4.").kind() == ErrorKind::EmptyFormula);
  }
  SECTION("unknown element") {
    auto e = formula_error("HXz");
    REQUIRE(e.kind() == ErrorKind::UnknownElement);
    REQUIRE(e.fragment() == "Xz");
    REQUIRE(e.position() == 1);
    REQUIRE(formula_error("h2o").kind() == ErrorKind::UnknownElement);
  }
  SECTION("invalid character") {
    auto e = formula_error("H2$O");
    REQUIRE(e.kind() == ErrorKind::InvalidCharacter);
    REQUIRE(e.fragment() == "$");
    REQUIRE(e.position() == 2);
    // multi byte characters are reported whole
    auto e2 = formula_error("H2\xE2\x82\x82");
    REQUIRE(e2.fragment() == "\xE2\x82\x82");
  }
  SECTION("invalid multiplier") {
    REQUIRE(formula_error("H0").kind() == ErrorKind::InvalidMultiplier);
    REQUIRE(formula_error("(OH)0").kind() == ErrorKind::InvalidMultiplier);
    REQUIRE(formula_error("(OH)02").kind() == ErrorKind::InvalidMultiplier);
    REQUIRE(formula_error("(OH)1234567890").kind() ==
            ErrorKind::InvalidMultiplier);
    REQUIRE(formula_error("CuSO4.0H2O").kind() ==
            ErrorKind::InvalidMultiplier);
    REQUIRE(formula_error("CuSO4.05H2O").kind() ==
            ErrorKind::InvalidMultiplier);
  }
  SECTION("unbalanced brackets") {
    REQUIRE(formula_error("Ca(OH").kind() == ErrorKind::UnbalancedBrackets);
    REQUIRE(formula_error("CaOH)2").kind() == ErrorKind::UnbalancedBrackets);
    REQUIRE(formula_error("K4[Fe(CN]6)").kind() ==
            ErrorKind::UnbalancedBrackets);
    REQUIRE(formula_error("(CuSO4.5H2O)").kind() ==
            ErrorKind::UnbalancedBrackets);
  }
}

TEST_CASE("Numeral in place of symbol", "[formula]") {
  SECTION("trailing zero") {
    auto e = formula_error("H20");
    REQUIRE(e.kind() == ErrorKind::NumeralInPlaceOfSymbol);
    REQUIRE(e.suggestion() == "H2O");
  }
  SECTION("leading zero") {
    auto e = formula_error("H02");
    REQUIRE(e.kind() == ErrorKind::NumeralInPlaceOfSymbol);
    REQUIRE(e.suggestion() == "HO2");
  }
  SECTION("digits where a symbol is expected") {
    auto e = formula_error("0H");
    REQUIRE(e.kind() == ErrorKind::NumeralInPlaceOfSymbol);
    REQUIRE(e.position() == 0);
    REQUIRE(e.suggestion() == "OH");
  }
}

/* Equation parser tests */

TEST_CASE("Parse equation separators", "[equation]") {
  auto eq = parse_equation("H2 + O2 -> H2O");
  REQUIRE(eq.num_reactants() == 2);
  REQUIRE(eq.num_products() == 1);
  REQUIRE(eq.arrow() == "->");
  REQUIRE(eq.reactants()[1].formula == "O2");
  REQUIRE(eq.elements() == std::vector<std::string>{"H", "O"});

  REQUIRE(parse_equation("Fe + O2 = Fe2O3").arrow() == "=");
  REQUIRE(parse_equation("Na + Cl2 \xE2\x86\x92 NaCl").arrow() ==
          "\xE2\x86\x92");
  REQUIRE(parse_equation("H2+O2->H2O").to_string() == "H2 + O2 -> H2O");
}

TEST_CASE("Leading coefficients are annotations", "[equation]") {
  auto eq = parse_equation("2H2 + O2 -> 2 H2O");
  REQUIRE(eq.reactants()[0].formula == "H2");
  REQUIRE(eq.reactants()[0].annotation == 2);
  REQUIRE(eq.products()[0].formula == "H2O");
  REQUIRE(eq.products()[0].annotation == 2);
  REQUIRE(eq.reactants()[1].annotation == 1);
}

TEST_CASE("Equation errors", "[equation]") {
  REQUIRE(equation_error("H2 + O2").kind() == ErrorKind::MissingSeparator);
  REQUIRE(equation_error(" -> H2O").kind() == ErrorKind::EmptyReactantSide);
  REQUIRE(equation_error("H2 + O2 ->  ").kind() ==
          ErrorKind::EmptyProductSide);
  REQUIRE(equation_error("0H2 + O2 -> H2O").kind() ==
          ErrorKind::InvalidMultiplier);
  REQUIRE(equation_error("02H2 + O2 -> H2O").kind() ==
          ErrorKind::InvalidMultiplier);
  REQUIRE(equation_error("H2 + 2 -> H2O").kind() ==
          ErrorKind::NumeralInPlaceOfSymbol);
  REQUIRE(balance_error_kind("CuSO4.05H2O -> CuSO4 + H2O") ==
          ErrorKind::InvalidMultiplier);
  // a second separator is not part of any formula
  REQUIRE(equation_error("H2 -> O2 -> H2O").kind() ==
          ErrorKind::InvalidCharacter);
  REQUIRE(equation_error("H2 -> H2O = O2").kind() ==
          ErrorKind::InvalidCharacter);

  auto e = equation_error("H2 + + O2 -> H2O");
  REQUIRE(e.kind() == ErrorKind::EmptyFormula);
  REQUIRE(e.side() == EquationSide::Reactants);
  REQUIRE(e.term_index() == 2);

  auto e2 = equation_error("H2 + O2 -> H2O + Qq");
  REQUIRE(e2.kind() == ErrorKind::UnknownElement);
  REQUIRE(e2.side() == EquationSide::Products);
  REQUIRE(e2.term_index() == 2);
  REQUIRE(e2.position() == 0);
}

TEST_CASE("Render equation", "[equation]") {
  auto eq = parse_equation("H2 + O2 -> H2O");
  REQUIRE(stoich::chem::render(eq, {2, 1, 2}) == "2H2 + O2 -> 2H2O");
  REQUIRE_THROWS_AS(stoich::chem::render(eq, {2, 1}), std::invalid_argument);
}

/* Stoichiometry matrix tests */

TEST_CASE("Stoichiometry matrix", "[stoichiometry]") {
  auto m = stoich::chem::build_matrix(parse_equation("H2 + O2 -> H2O"));
  REQUIRE(m.elements == std::vector<std::string>{"H", "O"});
  REQUIRE(m.species == std::vector<std::string>{"H2", "O2", "H2O"});
  REQUIRE(m.rows() == 2);
  REQUIRE(m.cols() == 3);
  REQUIRE(m.matrix(0, 0) == 2);
  REQUIRE(m.matrix(0, 1) == 0);
  REQUIRE(m.matrix(0, 2) == -2);
  REQUIRE(m.matrix(1, 1) == 2);
  REQUIRE(m.matrix(1, 2) == -1);
}

/* Normalizer tests */

TEST_CASE("Normalize rational vector", "[coefficients]") {
  RationalVec v(3);
  v << Rational(1), Rational(1, 2), Rational(1);
  stoich::chem::NormalizationTrace trace;
  REQUIRE(normalize(v, &trace) == stoich::chem::CoefficientVector{2, 1, 2});
  REQUIRE(trace.multiplier == 2);
  REQUIRE(trace.divisor == 1);

  RationalVec negative(3);
  negative << Rational(-2), Rational(-4), Rational(-6);
  REQUIRE(normalize(negative) == stoich::chem::CoefficientVector{1, 2, 3});
}

TEST_CASE("Normalize failures", "[coefficients]") {
  auto kind_of = [](const RationalVec &v) {
    try {
      normalize(v);
    } catch (const BalanceError &e) {
      return e.kind();
    }
    FAIL("expected normalize to fail");
    return ErrorKind::NoSolution;
  };
  RationalVec mixed(2);
  mixed << Rational(1), Rational(-1);
  REQUIRE(kind_of(mixed) == ErrorKind::NonPositiveCoefficient);

  RationalVec zeros(2);
  zeros << Rational(0), Rational(0);
  REQUIRE(kind_of(zeros) == ErrorKind::NonPositiveCoefficient);

  RationalVec empty;
  REQUIRE(kind_of(empty) == ErrorKind::NonPositiveCoefficient);

  RationalVec huge(2);
  huge << stoich::core::rational_from_string("1/1180591620717411303424"),
      Rational(1);
  REQUIRE(kind_of(huge) == ErrorKind::CoefficientOutOfRange);
}

/* End to end tests */

TEST_CASE("Balance scenarios", "[balance]") {
  auto [input, expected] = GENERATE(table<std::string, std::string>({
      {"H2 + O2 -> H2O", "2H2 + O2 -> 2H2O"},
      {"Fe + O2 = Fe2O3", "4Fe + 3O2 = 2Fe2O3"},
      {"Al + H2SO4 \xE2\x86\x92 Al2(SO4)3 + H2",
       "2Al + 3H2SO4 \xE2\x86\x92 Al2(SO4)3 + 3H2"},
      {"CuSO4\xC2\xB7" "5H2O -> CuSO4 + H2O",
       "CuSO4\xC2\xB7" "5H2O -> CuSO4 + 5H2O"},
      {"C3H8 + O2 -> CO2 + H2O", "C3H8 + 5O2 -> 3CO2 + 4H2O"},
      {"KMnO4 + HCl -> KCl + MnCl2 + H2O + Cl2",
       "2KMnO4 + 16HCl -> 2KCl + 2MnCl2 + 8H2O + 5Cl2"},
      {"2H2 + 2O2 -> 3H2O", "2H2 + O2 -> 2H2O"},
  }));
  auto result = balance(input);
  INFO(input);
  REQUIRE(result.ok());
  REQUIRE(result.balanced_equation() == expected);
}

TEST_CASE("Balance result coefficients", "[balance]") {
  auto result = balance("Al + H2SO4 -> Al2(SO4)3 + H2");
  REQUIRE(result.ok());
  REQUIRE(result.reactant_coefficients() ==
          stoich::chem::CoefficientVector{2, 3});
  REQUIRE(result.product_coefficients() ==
          stoich::chem::CoefficientVector{1, 3});
  REQUIRE_THROWS_AS(result.error(), std::logic_error);
}

TEST_CASE("Balance failures", "[balance]") {
  REQUIRE(balance_error_kind("H20 -> H2O") ==
          ErrorKind::NumeralInPlaceOfSymbol);
  REQUIRE(balance_error_kind("Na -> Cl") == ErrorKind::NoSolution);
  REQUIRE(balance_error_kind("H2 + O2 -> H2O + H2O2") ==
          ErrorKind::AmbiguousSolution);
  REQUIRE(balance_error_kind("H2 + O2 + C -> H2O") ==
          ErrorKind::DisconnectedSystem);
  REQUIRE(balance_error_kind("H2O + O2 -> H2") ==
          ErrorKind::NonPositiveCoefficient);
  REQUIRE(balance_error_kind("H2 + O2") == ErrorKind::MissingSeparator);

  auto failed = balance("Na -> Cl");
  REQUIRE_THROWS_AS(failed.coefficients(), std::logic_error);
  REQUIRE_THROWS_AS(failed.balanced_equation(), std::logic_error);
  // stages reached before the failure are kept
  REQUIRE(failed.trace().matrix.has_value());
  REQUIRE(!failed.trace().nullspace.has_value());
}

/* Properties */

TEST_CASE("Balanced equations conserve atoms", "[balance][properties]") {
  auto input = GENERATE(as<std::string>{}, "H2 + O2 -> H2O",
                        "Fe + O2 = Fe2O3",
                        "Al + H2SO4 -> Al2(SO4)3 + H2",
                        "CuSO4.5H2O -> CuSO4 + H2O",
                        "K4[Fe(CN)6] + H2SO4 + H2O -> K2SO4 + FeSO4 + "
                        "(NH4)2SO4 + CO",
                        "C6H12O6 + O2 -> CO2 + H2O");
  INFO(input);
  auto result = balance(input);
  REQUIRE(result.ok());
  const auto &eq = result.equation();
  const auto &c = result.coefficients();

  // conservation
  std::map<std::string, std::int64_t> net;
  std::size_t i = 0;
  for (const auto &compound : eq.reactants()) {
    for (const auto &[symbol, n] : compound.composition)
      net[symbol] += c[i] * n;
    i++;
  }
  for (const auto &compound : eq.products()) {
    for (const auto &[symbol, n] : compound.composition)
      net[symbol] -= c[i] * n;
    i++;
  }
  for (const auto &[symbol, total] : net) {
    INFO(symbol);
    REQUIRE(total == 0);
  }

  // positivity and minimality
  std::int64_t divisor = 0;
  for (auto x : c) {
    REQUIRE(x > 0);
    divisor = std::gcd(divisor, x);
  }
  REQUIRE(divisor == 1);

  // determinism
  REQUIRE(balance(input).coefficients() == c);

  // the rendered result parses back to the same compounds
  auto reparsed = parse_equation(result.balanced_equation());
  REQUIRE(reparsed == eq);
}

/* JSON export */

TEST_CASE("Balance result as JSON", "[json]") {
  nlohmann::json j = balance("H2 + O2 -> H2O");
  REQUIRE(j["balanced"] == "2H2 + O2 -> 2H2O");
  REQUIRE(j["coefficients"]["reactants"] == nlohmann::json::array({2, 1}));
  REQUIRE(j["coefficients"]["products"] == nlohmann::json::array({2}));
  REQUIRE(j["reactants"][0]["composition"]["H"] == 2);
  REQUIRE(j["trace"]["species"][2] == "H2O");
  REQUIRE(j["trace"]["nullspace"][1] == "1/2");
  REQUIRE(j["trace"]["multiplier"] == "2");

  nlohmann::json failed = balance("H20 -> H2O");
  REQUIRE(!failed.contains("balanced"));
  REQUIRE(failed["error"]["kind"] == "NumeralInPlaceOfSymbol");
  REQUIRE(failed["error"]["side"] == "reactants");
  REQUIRE(failed["error"]["term"] == 1);
  REQUIRE(failed["error"]["suggestion"] == "H2O");
}
