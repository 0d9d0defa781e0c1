#pragma once
#include <CLI/App.hpp>
#include <optional>
#include <promol/surface/sphere_radii.h>
#include <string>
#include <vector>

namespace promol::main {

struct RadiiConfig {
  std::string input_filename{""};
  std::string tables_filename{"promolecule_tables.json"};
  std::string output_filename{"radii.json"};
  std::string kind{"stockholder"};
  size_t lmax{17};
  std::vector<size_t> equiangular{};
  std::optional<double> lower;
  std::optional<double> upper;
  std::optional<double> isovalue;
  double tolerance{1e-7};
  size_t max_iterations{30};
  double background_density{0.0};

  bool is_promolecule() const;
  surface::RayBracket bracket() const;
  double target_isovalue() const;
  Mat2N grid() const;
};

CLI::App *add_radii_subcommand(CLI::App &app);
void run_radii_subcommand(RadiiConfig);

} // namespace promol::main
