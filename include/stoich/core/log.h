#pragma once
#include <spdlog/spdlog.h>
#include <string>

namespace stoich::log {
using spdlog::critical;
using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::trace;
using spdlog::warn;

/// verbosity by name: silent, minimal, normal, verbose or debug
void set_log_level(const std::string &verbosity);
void set_log_level(spdlog::level::level_enum level);
/// verbosity 0=silent, 1=minimal, 2=normal, 3=verbose, 4=debug
void set_log_level(int verbosity);

/// Send all log output to filename (truncated) instead of the console
void set_log_file(const std::string &filename);

inline void flush() { spdlog::default_logger()->flush(); }

} // namespace stoich::log
