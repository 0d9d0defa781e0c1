#pragma once
#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>
#include <promol/density/promolecule.h>
#include <string>

namespace promol::io {

/**
 * Radial density tables keyed by atomic number.
 *
 * Atoms of the same element share one table. Tables are validated on
 * insertion, so a PromoleculeDensity built from here never sees a malformed
 * table.
 */
class ElementTables {
public:
  ElementTables() = default;

  void insert(int atomic_number, density::RadialTablePtr table);
  bool contains(int atomic_number) const;
  const density::RadialTablePtr &at(int atomic_number) const;
  inline size_t size() const { return m_tables.size(); }

  density::PromoleculeDensity
  promolecule(Eigen::Ref<const IVec> atomic_numbers,
              Eigen::Ref<const FMat3N> positions) const;

  /*
   * {"domain": [...], "tables": {"1": [...], "6": [...]}}
   * with the domain in bohr shared by all elements.
   */
  static ElementTables from_json(const nlohmann::json &j);

  /// Reads filename, falling back to $PROMOL_DATA_PATH/filename.
  static ElementTables load(const std::string &filename);

private:
  ankerl::unordered_dense::map<int, density::RadialTablePtr> m_tables;
};

} // namespace promol::io
