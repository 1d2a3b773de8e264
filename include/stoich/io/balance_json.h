#pragma once
#include <nlohmann/json.hpp>
#include <stoich/chem/balance.h>

namespace stoich::core {

void to_json(nlohmann::json &j, const BalanceError &);

} // namespace stoich::core

namespace stoich::chem {

void to_json(nlohmann::json &j, const Composition &);
void to_json(nlohmann::json &j, const StoichiometryMatrix &);
void to_json(nlohmann::json &j, const BalanceResult &);

} // namespace stoich::chem
