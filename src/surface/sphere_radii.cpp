#include <cmath>
#include <fmt/core.h>
#include <promol/core/log.h>
#include <promol/core/parallel.h>
#include <promol/sht/grid.h>
#include <promol/surface/sphere_radii.h>
#include <stdexcept>

namespace promol::surface {

using promol::density::PromoleculeDensity;
using promol::density::StockholderWeight;

void RayBracket::validate() const {
  if (!std::isfinite(lower) || !std::isfinite(upper) || !(upper > lower)) {
    throw std::invalid_argument(fmt::format(
        "Invalid ray bracket [{}, {}]: require finite lower < upper", lower,
        upper));
  }
  if (!(tolerance > 0.0)) {
    throw std::invalid_argument(
        fmt::format("Root finding tolerance must be positive, found {}",
                    tolerance));
  }
  if (max_iterations == 0) {
    throw std::invalid_argument(
        "Root finding requires at least one iteration");
  }
}

namespace impl {

// f(t) = field(origin + t * direction) - isovalue
template <typename Field>
RootResult find_root_along_ray(const Field &field, const Vec3 &origin,
                               const Vec3 &direction, const RayBracket &bracket,
                               double isovalue) {
  auto func = [&](double t) -> double {
    const FVec3 pos = (origin + t * direction).cast<float>();
    return static_cast<double>(field(pos)) - isovalue;
  };
  promol::core::opt::BrentRoot<decltype(func)> brent(
      func, bracket.tolerance, bracket.max_iterations);
  brent.set_left(bracket.lower);
  brent.set_right(bracket.upper);
  return brent.result();
}

template <typename Field>
SphereRadii sample_sphere(const Field &field, const Vec3 &origin,
                          Eigen::Ref<const Mat2N> grid,
                          const RayBracket &bracket, double isovalue) {
  bracket.validate();
  const size_t num_directions = grid.cols();
  SphereRadii result{Vec(num_directions), MaskArray(num_directions)};

  promol::log::debug("Sampling {} directions from [{:.5f}, {:.5f}, {:.5f}], "
                     "bracket [{}, {}], isovalue {}, {} threads",
                     num_directions, origin(0), origin(1), origin(2),
                     bracket.lower, bracket.upper, isovalue,
                     promol::parallel::get_num_threads());

  promol::parallel::parallel_for(0, num_directions, [&](size_t l, size_t u) {
    for (size_t i = l; i < u; i++) {
      const Vec3 dir = promol::sht::direction(grid(0, i), grid(1, i));
      RootResult root =
          find_root_along_ray(field, origin, dir, bracket, isovalue);
      result.radii(i) = root.x;
      result.converged(i) = root.converged;
    }
  });

  const auto num_unconverged = result.num_unconverged();
  if (num_unconverged > 0) {
    promol::log::warn("{} of {} directions did not converge within [{}, {}]",
                      num_unconverged, num_directions, bracket.lower,
                      bracket.upper);
  }
  return result;
}

} // namespace impl

RootResult find_stockholder_root(const StockholderWeight &weight,
                                 const Vec3 &origin, const Vec3 &direction,
                                 const RayBracket &bracket, double isovalue) {
  bracket.validate();
  return impl::find_root_along_ray(weight, origin, direction, bracket,
                                   isovalue);
}

double stockholder_radius(const StockholderWeight &weight, const Vec3 &origin,
                          const Vec3 &direction, const RayBracket &bracket,
                          double isovalue) {
  return find_stockholder_root(weight, origin, direction, bracket, isovalue).x;
}

RootResult find_promolecule_root(const PromoleculeDensity &rho,
                                 const Vec3 &origin, const Vec3 &direction,
                                 const RayBracket &bracket, double isovalue) {
  bracket.validate();
  return impl::find_root_along_ray(rho, origin, direction, bracket, isovalue);
}

double promolecule_radius(const PromoleculeDensity &rho, const Vec3 &origin,
                          const Vec3 &direction, const RayBracket &bracket,
                          double isovalue) {
  return find_promolecule_root(rho, origin, direction, bracket, isovalue).x;
}

SphereRadii sphere_stockholder_radii_detailed(const StockholderWeight &weight,
                                              const Vec3 &origin,
                                              Eigen::Ref<const Mat2N> grid,
                                              const RayBracket &bracket,
                                              double isovalue) {
  return impl::sample_sphere(weight, origin, grid, bracket, isovalue);
}

Vec sphere_stockholder_radii(const StockholderWeight &weight,
                             const Vec3 &origin, Eigen::Ref<const Mat2N> grid,
                             const RayBracket &bracket, double isovalue) {
  return impl::sample_sphere(weight, origin, grid, bracket, isovalue).radii;
}

Vec sphere_stockholder_radii(const StockholderWeight &weight,
                             const Vec3 &origin, Eigen::Ref<const Mat2N> grid,
                             double lower, double upper, double tolerance,
                             size_t max_iterations) {
  return sphere_stockholder_radii(
      weight, origin, grid, RayBracket{lower, upper, tolerance, max_iterations});
}

SphereRadii sphere_promolecule_radii_detailed(const PromoleculeDensity &rho,
                                              const Vec3 &origin,
                                              Eigen::Ref<const Mat2N> grid,
                                              const RayBracket &bracket,
                                              double isovalue) {
  return impl::sample_sphere(rho, origin, grid, bracket, isovalue);
}

Vec sphere_promolecule_radii(const PromoleculeDensity &rho, const Vec3 &origin,
                             Eigen::Ref<const Mat2N> grid,
                             const RayBracket &bracket, double isovalue) {
  return impl::sample_sphere(rho, origin, grid, bracket, isovalue).radii;
}

} // namespace promol::surface
