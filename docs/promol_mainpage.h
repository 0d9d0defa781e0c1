/**
 * @mainpage promol
 *
 * \section welcome Welcome
 *
 * API documentation for promol: promolecule densities built from tabulated
 * spherical atoms, stockholder (Hirshfeld) weights between two fragments,
 * and the radius of an isosurface of either along every direction of a
 * spherical grid.
 *
 * \section example Stockholder radii of a molecule in its environment
 *
 * \code
 *
 * #include <promol/io/element_tables.h>
 * #include <promol/sht/grid.h>
 * #include <promol/surface/sphere_radii.h>
 *
 * int main(int argc, char *argv[]) {
 *    using promol::density::PromoleculeDensity;
 *    using promol::density::StockholderWeight;
 *
 *    // radial density tables keyed by atomic number
 *    auto tables = promol::io::ElementTables::load("promolecule_tables.json");
 *
 *    auto inside = std::make_shared<const PromoleculeDensity>(
 *        tables.promolecule(molecule_numbers, molecule_positions));
 *    auto outside = std::make_shared<const PromoleculeDensity>(
 *        tables.promolecule(neighbour_numbers, neighbour_positions));
 *    StockholderWeight weight(inside, outside);
 *
 *    // one radius per (theta, phi) grid point, where weight = 0.5
 *    auto grid = promol::sht::spherical_grid(17);
 *    promol::Vec radii = promol::surface::sphere_stockholder_radii(
 *        weight, inside->centroid().cast<double>(), grid);
 *    return 0;
 * }
 *
 * \endcode
 *
 */

/**
 * @namespace promol::core
 * @brief log-space interpolation and root finding
 * @details No dependencies on other modules in promol
 */

/**
 * @namespace promol::units
 * @brief unit conversions and constants
 * @details part of promol::core module
 */

/**
 * @namespace promol::log
 * @brief logging via spdlog
 * @details part of promol::core module
 */

/**
 * @namespace promol::parallel
 * @brief thread count and parallel loops via TBB
 * @details part of promol::core module
 */

/**
 * @namespace promol::timing
 * @brief wall clock timers by category
 * @details part of promol::core module
 */

/**
 * @namespace promol::density
 * @brief promolecule density and stockholder weight fields
 * @details Depends on promol::core
 */

/**
 * @namespace promol::sht
 * @brief angular grids and Gauss-Legendre quadrature
 * @details Depends on promol::core
 */

/**
 * @namespace promol::surface
 * @brief isosurface radii along rays and over spherical grids
 * @details Depends on promol::core, promol::density and promol::sht
 */

/**
 * @namespace promol::io
 * @brief json element tables, system input and radii output
 * @details Depends on promol::density and promol::surface
 */

/**
 * @namespace promol::main
 * @brief command line subcommands
 */
