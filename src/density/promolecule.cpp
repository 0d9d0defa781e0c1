#include <fmt/core.h>
#include <promol/core/log.h>
#include <promol/core/parallel.h>
#include <promol/density/promolecule.h>
#include <stdexcept>

namespace promol::density {

RadialTablePtr make_radial_table(const FVec &domain, const FVec &values) {
  return std::make_shared<const RadialTable>(domain, values);
}

PromoleculeDensity::PromoleculeDensity(const std::vector<Atom> &atoms)
    : m_positions(3, atoms.size()) {
  m_tables.reserve(atoms.size());
  for (size_t i = 0; i < atoms.size(); i++) {
    if (!atoms[i].table) {
      throw std::invalid_argument(
          fmt::format("Atom {} has no radial table", i));
    }
    m_positions.col(i) = atoms[i].position;
    m_tables.push_back(atoms[i].table);
  }
  promol::log::debug("Promolecule density with {} atoms", size());
}

PromoleculeDensity::PromoleculeDensity(
    Eigen::Ref<const FMat3N> positions,
    const std::vector<RadialTablePtr> &tables)
    : m_positions(positions), m_tables(tables) {
  if (static_cast<size_t>(m_positions.cols()) != m_tables.size()) {
    throw std::invalid_argument(
        fmt::format("Number of positions ({}) does not match number of "
                    "radial tables ({})",
                    m_positions.cols(), m_tables.size()));
  }
  for (size_t i = 0; i < m_tables.size(); i++) {
    if (!m_tables[i]) {
      throw std::invalid_argument(
          fmt::format("Atom {} has no radial table", i));
    }
  }
  promol::log::debug("Promolecule density with {} atoms", size());
}

PromoleculeDensity
PromoleculeDensity::from_shared_table(Eigen::Ref<const FMat3N> positions,
                                      const FVec &domain, const FVec &values) {
  auto table = make_radial_table(domain, values);
  std::vector<RadialTablePtr> tables(positions.cols(), table);
  return PromoleculeDensity(positions, tables);
}

PromoleculeDensity
PromoleculeDensity::from_tables(Eigen::Ref<const FMat3N> positions,
                                const FVec &domain, const FMat &values) {
  if (values.cols() != positions.cols()) {
    throw std::invalid_argument(
        fmt::format("Number of positions ({}) does not match number of "
                    "value columns ({})",
                    positions.cols(), values.cols()));
  }
  std::vector<RadialTablePtr> tables;
  tables.reserve(values.cols());
  for (Eigen::Index i = 0; i < values.cols(); i++) {
    FVec column = values.col(i);
    tables.push_back(make_radial_table(domain, column));
  }
  return PromoleculeDensity(positions, tables);
}

std::vector<Atom> PromoleculeDensity::atoms() const {
  std::vector<Atom> result;
  result.reserve(m_tables.size());
  for (Eigen::Index i = 0; i < m_positions.cols(); i++) {
    result.push_back({m_positions.col(i), m_tables[i]});
  }
  return result;
}

FVec3 PromoleculeDensity::centroid() const {
  if (m_positions.cols() == 0)
    return FVec3::Zero();
  return m_positions.rowwise().mean();
}

void PromoleculeDensity::accumulate_block(Eigen::Ref<const FMat3N> points,
                                          Eigen::Ref<FVec> dest) const {
  constexpr float bohr_per_angstrom =
      static_cast<float>(promol::units::BOHR_TO_ANGSTROM);
  FVec r(points.cols());
  // atoms outer, points inner: one table stays hot in cache
  for (Eigen::Index i = 0; i < m_positions.cols(); i++) {
    r = (points.colwise() - m_positions.col(i)).colwise().norm().transpose() /
        bohr_per_angstrom;
    m_tables[i]->accumulate(r, dest);
  }
}

void PromoleculeDensity::batch(Eigen::Ref<const FMat3N> points,
                               Eigen::Ref<FVec> dest) const {
  if (dest.size() != points.cols()) {
    throw std::invalid_argument(
        fmt::format("Output size {} does not match number of points {}",
                    dest.size(), points.cols()));
  }
  dest.setZero();
  promol::parallel::parallel_for(
      0, static_cast<size_t>(points.cols()), [&](size_t l, size_t u) {
        const Eigen::Index npt = static_cast<Eigen::Index>(u - l);
        accumulate_block(points.middleCols(l, npt), dest.segment(l, npt));
      });
}

FVec PromoleculeDensity::batch(Eigen::Ref<const FMat3N> points) const {
  FVec result(points.cols());
  batch(points, result);
  return result;
}

} // namespace promol::density
