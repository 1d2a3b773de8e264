#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <stoich/core/log.h>
#include <stoich/core/util.h>
#include <vector>

namespace stoich::log {
namespace {
std::shared_ptr<spdlog::logger> current_logger = spdlog::default_logger();

spdlog::level::level_enum verbosity_to_level(const std::string &verbosity) {
  std::string level_lower = stoich::util::to_lower_copy(verbosity);
  if (level_lower == "debug")
    return spdlog::level::trace;
  if (level_lower == "verbose")
    return spdlog::level::debug;
  if (level_lower == "minimal")
    return spdlog::level::warn;
  if (level_lower == "silent")
    return spdlog::level::critical;
  return spdlog::level::info; // default for "normal" and unknown values
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
  switch (verbosity) {
  case 4:
    return spdlog::level::trace;
  case 3:
    return spdlog::level::debug;
  case 1:
    return spdlog::level::warn;
  case 0:
    return spdlog::level::critical;
  default:
    return spdlog::level::info;
  }
}
} // namespace

void set_log_level(spdlog::level::level_enum level) {
  current_logger->set_level(level);
  spdlog::set_pattern("%v");
  spdlog::enable_backtrace(32);
}

void set_log_level(const std::string &verbosity) {
  set_log_level(verbosity_to_level(verbosity));
}

void set_log_level(int verbosity) {
  set_log_level(verbosity_to_level(verbosity));
}

void set_log_file(const std::string &filename) {
  try {
    auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
    std::vector<spdlog::sink_ptr> sinks{file_sink};
    auto file_logger = std::make_shared<spdlog::logger>(
        "stoich_logger", sinks.begin(), sinks.end());
    file_logger->set_level(current_logger->level());

    current_logger = file_logger;
    spdlog::set_default_logger(current_logger);
  } catch (const spdlog::spdlog_ex &ex) {
    spdlog::warn(
        "Failed to create file logger: {}. Using existing logger instead.",
        ex.what());
  }
  spdlog::set_pattern("%v");
  spdlog::enable_backtrace(32);
}

} // namespace stoich::log
