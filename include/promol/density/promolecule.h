#pragma once
#include <memory>
#include <promol/core/interpolator.h>
#include <promol/core/linear_algebra.h>
#include <promol/core/macros.h>
#include <promol/core/units.h>
#include <vector>

namespace promol::density {

/// Radial density table for one element, domain in bohr.
using RadialTable = promol::core::LogInterpolator<float>;
using RadialTablePtr = std::shared_ptr<const RadialTable>;

RadialTablePtr make_radial_table(const FVec &domain, const FVec &values);

struct Atom {
  FVec3 position;
  RadialTablePtr table;
};

/**
 * Sum of spherical atomic densities centred on atomic positions.
 *
 * Positions are in Angstrom; distances are converted to bohr before the
 * table lookup. Each atom references a (possibly shared) RadialTable, and
 * the atom order fixes the order of summation.
 */
class PromoleculeDensity {
public:
  explicit PromoleculeDensity(const std::vector<Atom> &atoms);
  PromoleculeDensity(Eigen::Ref<const FMat3N> positions,
                     const std::vector<RadialTablePtr> &tables);

  /// All atoms use the one table (domain, values).
  static PromoleculeDensity from_shared_table(Eigen::Ref<const FMat3N> positions,
                                              const FVec &domain,
                                              const FVec &values);

  /// Column i of values is the table for atom i over the shared domain.
  static PromoleculeDensity from_tables(Eigen::Ref<const FMat3N> positions,
                                        const FVec &domain,
                                        const FMat &values);

  PROMOL_ALWAYS_INLINE float operator()(const FVec3 &pos) const {
    constexpr float bohr_per_angstrom =
        static_cast<float>(promol::units::BOHR_TO_ANGSTROM);
    float result{0.0f};
    for (Eigen::Index i = 0; i < m_positions.cols(); i++) {
      float r = (m_positions.col(i) - pos).norm() / bohr_per_angstrom;
      result += (*m_tables[i])(r);
    }
    return result;
  }

  /// Density at each column of points.
  FVec batch(Eigen::Ref<const FMat3N> points) const;

  /// Density at each column of points, written to dest (same length).
  void batch(Eigen::Ref<const FMat3N> points, Eigen::Ref<FVec> dest) const;

  inline Eigen::Index size() const { return m_positions.cols(); }
  inline const FMat3N &positions() const { return m_positions; }
  inline const std::vector<RadialTablePtr> &tables() const { return m_tables; }
  std::vector<Atom> atoms() const;

  /// Mean atomic position, the default sampling origin.
  FVec3 centroid() const;

private:
  void accumulate_block(Eigen::Ref<const FMat3N> points,
                        Eigen::Ref<FVec> dest) const;

  FMat3N m_positions;
  std::vector<RadialTablePtr> m_tables;
};

} // namespace promol::density
