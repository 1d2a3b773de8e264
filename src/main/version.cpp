#include <Eigen/Core>
#include <fmt/core.h>
#include <gmp.h>
#include <spdlog/version.h>
#include <stoich/core/log.h>
#include <stoich/main/version.h>

namespace stoich::main {

void print_header() {
  const auto eigen_version_string =
      fmt::format("{}.{}.{}", EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION,
                  EIGEN_MINOR_VERSION);
  const int fmt_major = FMT_VERSION / 10000;
  const int fmt_minor = (FMT_VERSION % 10000) / 100;
  const int fmt_patch = (FMT_VERSION % 100);
  const std::string fmt_version_string =
      fmt::format("{}.{}.{}", fmt_major, fmt_minor, fmt_patch);
  const std::string spdlog_version_string = fmt::format(
      "{}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
  const std::string gmp_version_string{gmp_version};

  log::info(R"(
stoich - balance chemical equations with exact arithmetic

this version of stoich makes use of the following third party libraries:

CLI11                command line argument parser
eigen3               Matrix storage (v {})
fmt                  String formatting (v {})
GMP                  Arbitrary precision rationals (v {})
nlohmann::json       JSON output
unordered_dense      Fast hashmap implementation
spdlog               Logging (v {})
)",
            eigen_version_string, fmt_version_string, gmp_version_string,
            spdlog_version_string);
}

} // namespace stoich::main
