#include <array>
#include <memory>
#include <promol/core/log.h>
#include <promol/core/util.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>
#include <vector>

namespace promol::log {
namespace {

constexpr std::array<std::pair<const char *, spdlog::level::level_enum>, 5>
    named_levels{{{"silent", spdlog::level::critical},
                  {"minimal", spdlog::level::warn},
                  {"normal", spdlog::level::info},
                  {"verbose", spdlog::level::debug},
                  {"debug", spdlog::level::trace}}};

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
  auto logger =
      std::make_shared<spdlog::logger>("promol", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("%v");
  logger->enable_backtrace(32);
  spdlog::set_default_logger(logger);
  return logger;
}

// all output goes through the default logger, created on first use
std::shared_ptr<spdlog::logger> &promol_logger() {
  static std::shared_ptr<spdlog::logger> logger = make_logger(
      {std::make_shared<spdlog::sinks::stdout_color_sink_mt>()},
      spdlog::level::info);
  return logger;
}

} // namespace

void set_log_level(spdlog::level::level_enum level) {
  promol_logger()->set_level(level);
}

// unknown names fall back to normal
void set_log_level(const std::string &verbosity) {
  const std::string name = promol::util::to_lower_copy(verbosity);
  for (const auto &[key, level] : named_levels) {
    if (name == key) {
      set_log_level(level);
      return;
    }
  }
  set_log_level(spdlog::level::info);
}

// 0 = silent ... 4 = debug, anything else is normal
void set_log_level(int verbosity) {
  if (verbosity < 0 || verbosity >= static_cast<int>(named_levels.size())) {
    set_log_level(spdlog::level::info);
    return;
  }
  set_log_level(named_levels[verbosity].second);
}

void set_log_file(const std::string &filename) {
  auto &logger = promol_logger();
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
  try {
    file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
  } catch (const spdlog::spdlog_ex &ex) {
    logger->warn("Could not open log file '{}': {}", filename, ex.what());
    return;
  }
  const auto flush_level = logger->flush_level();
  logger = make_logger({file_sink}, logger->level());
  logger->flush_on(flush_level);
}

} // namespace promol::log
