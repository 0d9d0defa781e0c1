#pragma once
#include <cmath>

namespace promol::units {
// Length conversion used for all radial table lookups
constexpr double BOHR_TO_ANGSTROM = 0.5291772108;
constexpr double ANGSTROM_TO_BOHR = 1.0 / BOHR_TO_ANGSTROM;

constexpr double PI = 3.14159265358979323846;

template <typename T> constexpr auto radians(T x) { return x * PI / 180; }

template <typename T> constexpr auto degrees(T x) { return x * 180 / PI; }

template <typename T> constexpr auto angstroms(T x) {
  return BOHR_TO_ANGSTROM * x;
}

template <typename T> constexpr auto bohr(T x) { return x / BOHR_TO_ANGSTROM; }

} // namespace promol::units
