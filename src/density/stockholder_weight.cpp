#include <fmt/core.h>
#include <promol/core/log.h>
#include <promol/density/stockholder_weight.h>
#include <stdexcept>

namespace promol::density {

StockholderWeight::StockholderWeight(DensityPtr inside, DensityPtr outside)
    : m_inside(std::move(inside)), m_outside(std::move(outside)) {
  if (!m_inside || !m_outside) {
    throw std::invalid_argument(
        "Stockholder weight requires both interior and exterior densities");
  }
  promol::log::debug("Stockholder weight: {} interior, {} exterior atoms",
                     m_inside->size(), m_outside->size());
}

void StockholderWeight::set_background_density(float rho) {
  m_background_density = rho;
}

void StockholderWeight::batch(Eigen::Ref<const FMat3N> points,
                              Eigen::Ref<FVec> dest) const {
  if (dest.size() != points.cols()) {
    throw std::invalid_argument(
        fmt::format("Output size {} does not match number of points {}",
                    dest.size(), points.cols()));
  }
  FVec rho_outside = m_outside->batch(points);
  m_inside->batch(points, dest);
  dest.array() =
      dest.array() / (dest.array() + rho_outside.array() + m_background_density);
}

FVec StockholderWeight::batch(Eigen::Ref<const FMat3N> points) const {
  FVec result(points.cols());
  batch(points, result);
  return result;
}

} // namespace promol::density
