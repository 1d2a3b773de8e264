#include <stoich/core/rational.h>
#include <stoich/io/balance_json.h>

namespace stoich::core {

void to_json(nlohmann::json &j, const BalanceError &error) {
  j["kind"] = to_string(error.kind());
  j["message"] = error.what();
  if (!error.fragment().empty()) {
    j["fragment"] = error.fragment();
  }
  if (error.has_position()) {
    j["position"] = error.position();
  }
  if (error.side() != EquationSide::None) {
    j["side"] = to_string(error.side());
    j["term"] = error.term_index();
  }
  if (!error.suggestion().empty()) {
    j["suggestion"] = error.suggestion();
  }
}

} // namespace stoich::core

namespace stoich::chem {

namespace {
// rationals and big integers are written as strings, they may not fit a
// json number
nlohmann::json rational_array(const RationalVec &v) {
  nlohmann::json result = nlohmann::json::array();
  for (Eigen::Index i = 0; i < v.size(); i++) {
    result.push_back(core::to_string(v(i)));
  }
  return result;
}

nlohmann::json trace_json(const BalanceTrace &trace) {
  nlohmann::json j = nlohmann::json::object();
  if (trace.matrix) {
    nlohmann::json m = *trace.matrix;
    j.update(m);
  }
  if (trace.nullspace) {
    j["nullspace"] = rational_array(*trace.nullspace);
  }
  if (trace.normalization) {
    const auto &norm = *trace.normalization;
    j["multiplier"] = core::to_string(norm.multiplier);
    nlohmann::json raw = nlohmann::json::array();
    for (const auto &x : norm.scaled) {
      raw.push_back(core::to_string(x));
    }
    j["raw"] = raw;
    j["divisor"] = core::to_string(norm.divisor);
  }
  return j;
}
} // namespace

void to_json(nlohmann::json &j, const Composition &composition) {
  j = nlohmann::json::object();
  for (const auto &[symbol, count] : composition) {
    j[symbol] = count;
  }
}

void to_json(nlohmann::json &j, const StoichiometryMatrix &m) {
  j["elements"] = m.elements;
  j["species"] = m.species;
  nlohmann::json rows = nlohmann::json::array();
  for (Eigen::Index r = 0; r < m.rows(); r++) {
    RationalVec row = m.matrix.row(r).transpose();
    rows.push_back(rational_array(row));
  }
  j["matrix"] = rows;
}

void to_json(nlohmann::json &j, const BalanceResult &result) {
  j["input"] = result.input();
  if (result.ok()) {
    const auto &eq = result.equation();
    j["balanced"] = result.balanced_equation();
    nlohmann::json reactants = nlohmann::json::array();
    for (const auto &c : eq.reactants()) {
      reactants.push_back(
          {{"formula", c.formula}, {"composition", c.composition}});
    }
    nlohmann::json products = nlohmann::json::array();
    for (const auto &c : eq.products()) {
      products.push_back(
          {{"formula", c.formula}, {"composition", c.composition}});
    }
    j["reactants"] = reactants;
    j["products"] = products;
    j["coefficients"] = {{"reactants", result.reactant_coefficients()},
                         {"products", result.product_coefficients()}};
  } else {
    j["error"] = result.error();
  }
  auto trace = trace_json(result.trace());
  if (!trace.empty()) {
    j["trace"] = trace;
  }
}

} // namespace stoich::chem
