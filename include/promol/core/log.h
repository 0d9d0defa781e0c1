#pragma once
#include <spdlog/spdlog.h>
#include <string>

namespace promol::log {
using spdlog::critical;
using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::trace;
using spdlog::warn;

namespace level {
using spdlog::level::critical;
using spdlog::level::debug;
using spdlog::level::err;
using spdlog::level::info;
using spdlog::level::trace;
using spdlog::level::warn;
} // namespace level

/// verbosity as a name: silent, minimal, normal, verbose or debug
void set_log_level(const std::string &verbosity);
void set_log_level(spdlog::level::level_enum level);
/// verbosity 0 (silent) to 4 (debug)
void set_log_level(int verbosity);

/// Send all further output to filename instead of the console.
void set_log_file(const std::string &filename);

inline void flush() { spdlog::default_logger()->flush(); }

inline void flush_on(spdlog::level::level_enum level) {
  spdlog::flush_on(level);
}

} // namespace promol::log
