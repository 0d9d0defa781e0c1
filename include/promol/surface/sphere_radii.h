#pragma once
#include <promol/core/linear_algebra.h>
#include <promol/core/optimize.h>
#include <promol/density/promolecule.h>
#include <promol/density/stockholder_weight.h>

namespace promol::surface {

using promol::core::opt::RootResult;

/**
 * Search interval along a ray (Angstrom) and the root finder settings
 * used for every direction.
 */
struct RayBracket {
  double lower{0.1};
  double upper{20.0};
  double tolerance{1e-7};
  size_t max_iterations{30};

  /// Throws std::invalid_argument unless lower < upper (both finite),
  /// tolerance > 0 and max_iterations > 0.
  void validate() const;
};

/// Default bracket for promolecule density isosurfaces.
inline RayBracket promolecule_bracket() { return RayBracket{0.4, 20.0, 1e-7, 30}; }

struct SphereRadii {
  Vec radii;
  MaskArray converged;

  inline Eigen::Index size() const { return radii.size(); }
  inline Eigen::Index num_unconverged() const {
    return (!converged).count();
  }
};

/*
 * Single ray searches. The find_* variants report convergence; the
 * *_radius variants return only the distance, which is bracket.upper if
 * the search did not converge within bracket.max_iterations.
 */
RootResult find_stockholder_root(const density::StockholderWeight &weight,
                                 const Vec3 &origin, const Vec3 &direction,
                                 const RayBracket &bracket,
                                 double isovalue = 0.5);

double stockholder_radius(const density::StockholderWeight &weight,
                          const Vec3 &origin, const Vec3 &direction,
                          const RayBracket &bracket, double isovalue = 0.5);

RootResult find_promolecule_root(const density::PromoleculeDensity &rho,
                                 const Vec3 &origin, const Vec3 &direction,
                                 const RayBracket &bracket,
                                 double isovalue = 0.0002);

double promolecule_radius(const density::PromoleculeDensity &rho,
                          const Vec3 &origin, const Vec3 &direction,
                          const RayBracket &bracket, double isovalue = 0.0002);

/*
 * Radii for every (theta, phi) column of grid, seen from origin. Each
 * direction is independent, so the result does not depend on the grid
 * order or the number of threads.
 */
SphereRadii sphere_stockholder_radii_detailed(
    const density::StockholderWeight &weight, const Vec3 &origin,
    Eigen::Ref<const Mat2N> grid, const RayBracket &bracket = {},
    double isovalue = 0.5);

Vec sphere_stockholder_radii(const density::StockholderWeight &weight,
                             const Vec3 &origin, Eigen::Ref<const Mat2N> grid,
                             const RayBracket &bracket = {},
                             double isovalue = 0.5);

Vec sphere_stockholder_radii(const density::StockholderWeight &weight,
                             const Vec3 &origin, Eigen::Ref<const Mat2N> grid,
                             double lower, double upper, double tolerance,
                             size_t max_iterations);

SphereRadii sphere_promolecule_radii_detailed(
    const density::PromoleculeDensity &rho, const Vec3 &origin,
    Eigen::Ref<const Mat2N> grid, const RayBracket &bracket = promolecule_bracket(),
    double isovalue = 0.0002);

Vec sphere_promolecule_radii(const density::PromoleculeDensity &rho,
                             const Vec3 &origin, Eigen::Ref<const Mat2N> grid,
                             const RayBracket &bracket = promolecule_bracket(),
                             double isovalue = 0.0002);

} // namespace promol::surface
