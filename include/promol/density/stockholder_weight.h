#pragma once
#include <memory>
#include <promol/density/promolecule.h>

namespace promol::density {

/**
 * Stockholder (Hirshfeld) weight of an interior density relative to an
 * exterior one: rho_in / (rho_in + rho_out + background).
 *
 * Both densities are shared, not copied, and must not be modified while
 * the weight is in use. The ratio is not clamped, and where both densities
 * vanish the result is NaN.
 */
class StockholderWeight {
public:
  using DensityPtr = std::shared_ptr<const PromoleculeDensity>;

  StockholderWeight(DensityPtr inside, DensityPtr outside);

  void set_background_density(float value);
  inline float background_density() const { return m_background_density; }

  PROMOL_ALWAYS_INLINE float operator()(const FVec3 &pos) const {
    float total_inside = (*m_inside)(pos);
    float total_outside = (*m_outside)(pos) + m_background_density;
    return total_inside / (total_inside + total_outside);
  }

  FVec batch(Eigen::Ref<const FMat3N> points) const;
  void batch(Eigen::Ref<const FMat3N> points, Eigen::Ref<FVec> dest) const;

  inline const PromoleculeDensity &inside() const { return *m_inside; }
  inline const PromoleculeDensity &outside() const { return *m_outside; }

private:
  float m_background_density{0.0f};
  DensityPtr m_inside;
  DensityPtr m_outside;
};

} // namespace promol::density
