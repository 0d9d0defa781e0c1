#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <algorithm>
#include <cstdio>
#include <promol/core/log.h>
#include <promol/core/parallel.h>
#include <promol/core/timings.h>
#include <promol/main/promol_evaluate.h>
#include <promol/main/promol_radii.h>
#include <string>

namespace {

// options shared by every subcommand, applied while parsing
void add_process_options(CLI::App &app) {
  app.add_flag_function(
         "--threads{1}",
         [](int n) { promol::parallel::set_num_threads(std::max(1, n)); },
         "number of threads")
      ->default_val(1)
      ->run_callback_for_default()
      ->force_callback();

  app.add_flag_function(
         "--verbosity{2}",
         [](int level) { promol::log::set_log_level(level); },
         "logging verbosity {0=silent,1=minimal,2=normal,3=verbose,4=debug}")
      ->default_val(2)
      ->run_callback_for_default()
      ->force_callback();

  app.add_option_function<std::string>(
      "--log-file",
      [](const std::string &filename) { promol::log::set_log_file(filename); },
      "write log output to this file instead of the console");
}

} // namespace

int main(int argc, char *argv[]) {
  promol::timing::start(promol::timing::global);
  promol::log::set_log_level(2);
  promol::log::flush_on(promol::log::level::warn);

  CLI::App app("promol - promolecule densities, stockholder weights and "
               "isosurface radii");
  app.set_help_all_flag("--help-all", "Show help for all sub commands");
  add_process_options(app);

  promol::main::add_radii_subcommand(app);
  promol::main::add_evaluate_subcommand(app);
  app.require_subcommand(1);

  try {
    CLI11_PARSE(app, argc, argv);
  } catch (const std::exception &ex) {
    promol::log::error("promol failed:\n    {}", ex.what());
    spdlog::dump_backtrace();
    promol::log::flush();
    return 1;
  }

  promol::timing::stop(promol::timing::global);
  promol::timing::print_timings();
  promol::log::flush();
  std::fflush(nullptr);
  return 0;
}
