#include <fmt/core.h>
#include <memory>
#include <promol/core/linear_algebra.h>
#include <promol/core/log.h>
#include <promol/core/parallel.h>
#include <promol/core/timings.h>
#include <promol/core/util.h>
#include <promol/io/element_tables.h>
#include <promol/io/system_json.h>
#include <promol/main/promol_radii.h>
#include <promol/sht/grid.h>
#include <stdexcept>

using promol::density::PromoleculeDensity;
using promol::density::StockholderWeight;
using promol::io::ElementTables;
using promol::io::SystemInput;
using promol::surface::RayBracket;
using promol::surface::SphereRadii;

namespace promol::main {

bool RadiiConfig::is_promolecule() const {
  auto k = util::to_lower_copy(kind);
  if (k == "promolecule" || k == "promolecule_density")
    return true;
  if (k == "stockholder" || k == "stockholder_weight" || k == "hirshfeld")
    return false;
  throw std::invalid_argument(fmt::format("Unknown radii kind: '{}'", kind));
}

RayBracket RadiiConfig::bracket() const {
  RayBracket result =
      is_promolecule() ? surface::promolecule_bracket() : RayBracket{};
  if (lower)
    result.lower = *lower;
  if (upper)
    result.upper = *upper;
  result.tolerance = tolerance;
  result.max_iterations = max_iterations;
  result.validate();
  return result;
}

double RadiiConfig::target_isovalue() const {
  if (isovalue)
    return *isovalue;
  return is_promolecule() ? 0.0002 : 0.5;
}

Mat2N RadiiConfig::grid() const {
  timing::start(timing::grid);
  Mat2N result;
  if (!equiangular.empty()) {
    if (equiangular.size() != 2) {
      timing::stop(timing::grid);
      throw std::invalid_argument(
          "--equiangular requires two values: azimuthal and polar counts");
    }
    result = sht::equiangular_grid(equiangular[0], equiangular[1]);
  } else {
    result = sht::spherical_grid(lmax);
  }
  timing::stop(timing::grid);
  return result;
}

CLI::App *add_radii_subcommand(CLI::App &app) {
  CLI::App *radii = app.add_subcommand(
      "radii", "compute isosurface radii over a sphere of directions");
  auto config = std::make_shared<RadiiConfig>();

  radii->add_option("input", config->input_filename,
                    "input system file (json)")
      ->required();
  radii->add_option("--tables", config->tables_filename,
                    "radial density tables (json)");
  radii->add_option("-o,--output", config->output_filename,
                    "output file for radii (json)");
  radii->add_option("--kind", config->kind,
                    "surface kind (stockholder|promolecule)");
  radii->add_option("--lmax", config->lmax,
                    "band limit of the spherical grid");
  radii->add_option("--equiangular", config->equiangular,
                    "equiangular grid: azimuthal and polar point counts")
      ->expected(2);
  radii->add_option("--lower", config->lower,
                    "lower end of search interval (Angstrom)");
  radii->add_option("--upper", config->upper,
                    "upper end of search interval (Angstrom)");
  radii->add_option("--tolerance", config->tolerance,
                    "root finding tolerance (Angstrom)");
  radii->add_option("--max-iterations", config->max_iterations,
                    "maximum root finding iterations per direction");
  radii->add_option("--isovalue", config->isovalue, "target isovalue");
  radii->add_option("--background-density", config->background_density,
                    "add background density to the exterior");

  radii->fallthrough();
  radii->callback([config]() { run_radii_subcommand(*config); });
  return radii;
}

void run_radii_subcommand(RadiiConfig config) {
  const bool promolecule = config.is_promolecule();
  const RayBracket bracket = config.bracket();
  const double isovalue = config.target_isovalue();

  timing::start(timing::io);
  SystemInput input = io::load_system_input(config.input_filename);
  timing::stop(timing::io);

  timing::start(timing::tables);
  ElementTables tables = ElementTables::load(config.tables_filename);
  timing::stop(timing::tables);
  log::info("Loaded {} element tables from '{}'", tables.size(),
            config.tables_filename);

  auto interior = std::make_shared<const PromoleculeDensity>(
      tables.promolecule(input.interior.atomic_numbers,
                         input.interior.positions));

  Vec3 origin = input.origin ? *input.origin
                             : Vec3(interior->centroid().cast<double>());
  Mat2N grid = config.grid();

  log::info("Surface kind: {}", promolecule ? "promolecule density"
                                            : "stockholder weight");
  log::info("Origin (Angstrom): {}", format_matrix(origin, "{:.6f}"));
  log::info("Grid: {} directions", grid.cols());
  log::info("Search interval: [{}, {}], tolerance {}, max iterations {}",
            bracket.lower, bracket.upper, bracket.tolerance,
            bracket.max_iterations);
  log::info("Isovalue: {}", isovalue);
  log::info("Threads: {}", parallel::get_num_threads());

  SphereRadii radii;
  timing::start(timing::sampling);
  if (promolecule) {
    radii = surface::sphere_promolecule_radii_detailed(*interior, origin, grid,
                                                       bracket, isovalue);
  } else {
    if (!input.exterior) {
      throw std::runtime_error(
          "Stockholder radii require an 'exterior' fragment in the input");
    }
    auto exterior = std::make_shared<const PromoleculeDensity>(
        tables.promolecule(input.exterior->atomic_numbers,
                           input.exterior->positions));
    StockholderWeight weight(interior, exterior);
    weight.set_background_density(
        static_cast<float>(config.background_density));
    radii = surface::sphere_stockholder_radii_detailed(weight, origin, grid,
                                                       bracket, isovalue);
  }
  timing::stop(timing::sampling);

  if (radii.size() > 0) {
    log::info("Radii: min {:.6f} max {:.6f} mean {:.6f} (Angstrom)",
              radii.radii.minCoeff(), radii.radii.maxCoeff(),
              radii.radii.mean());
  }
  timing::start(timing::io);
  io::write_json(config.output_filename,
                 io::radii_to_json(grid, radii, origin));
  timing::stop(timing::io);
}

} // namespace promol::main
