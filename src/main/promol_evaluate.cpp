#include <memory>
#include <nlohmann/json.hpp>
#include <promol/core/log.h>
#include <promol/core/timings.h>
#include <promol/io/element_tables.h>
#include <promol/io/system_json.h>
#include <promol/main/promol_evaluate.h>
#include <stdexcept>

using promol::density::PromoleculeDensity;
using promol::density::StockholderWeight;

namespace promol::main {

CLI::App *add_evaluate_subcommand(CLI::App &app) {
  CLI::App *evaluate = app.add_subcommand(
      "evaluate", "evaluate promolecule density or stockholder weight at points");
  auto config = std::make_shared<EvaluateConfig>();

  evaluate->add_option("input", config->input_filename,
                       "input system file with 'points' (json)")
      ->required();
  evaluate->add_option("--tables", config->tables_filename,
                       "radial density tables (json)");
  evaluate->add_option("-o,--output", config->output_filename,
                       "output file for values (json)");
  evaluate->add_option("--background-density", config->background_density,
                       "add background density to the exterior");

  evaluate->fallthrough();
  evaluate->callback([config]() { run_evaluate_subcommand(*config); });
  return evaluate;
}

void run_evaluate_subcommand(EvaluateConfig config) {
  timing::start(timing::io);
  auto input = io::load_system_input(config.input_filename);
  timing::stop(timing::io);
  if (input.points.cols() == 0) {
    throw std::runtime_error(
        "No 'points' to evaluate in " + config.input_filename);
  }

  timing::start(timing::tables);
  auto tables = io::ElementTables::load(config.tables_filename);
  timing::stop(timing::tables);

  auto interior = std::make_shared<const PromoleculeDensity>(
      tables.promolecule(input.interior.atomic_numbers,
                         input.interior.positions));

  FVec values;
  if (input.exterior) {
    auto exterior = std::make_shared<const PromoleculeDensity>(
        tables.promolecule(input.exterior->atomic_numbers,
                           input.exterior->positions));
    StockholderWeight weight(interior, exterior);
    weight.set_background_density(
        static_cast<float>(config.background_density));
    log::info("Evaluating stockholder weight at {} points",
              input.points.cols());
    timing::start(timing::weight);
    values = weight.batch(input.points);
    timing::stop(timing::weight);
  } else {
    log::info("Evaluating promolecule density at {} points",
              input.points.cols());
    timing::start(timing::density);
    values = interior->batch(input.points);
    timing::stop(timing::density);
  }

  nlohmann::json j;
  j["points"] = nlohmann::json::array();
  j["values"] = nlohmann::json::array();
  for (Eigen::Index i = 0; i < input.points.cols(); i++) {
    j["points"].push_back(
        {input.points(0, i), input.points(1, i), input.points(2, i)});
    j["values"].push_back(values(i));
  }
  timing::start(timing::io);
  io::write_json(config.output_filename, j);
  timing::stop(timing::io);
}

} // namespace promol::main
