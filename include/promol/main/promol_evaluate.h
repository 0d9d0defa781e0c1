#pragma once
#include <CLI/App.hpp>
#include <string>

namespace promol::main {

struct EvaluateConfig {
  std::string input_filename{""};
  std::string tables_filename{"promolecule_tables.json"};
  std::string output_filename{"values.json"};
  double background_density{0.0};
};

CLI::App *add_evaluate_subcommand(CLI::App &app);
void run_evaluate_subcommand(EvaluateConfig);

} // namespace promol::main
