#pragma once
#include <promol/core/linear_algebra.h>
#include <utility>

namespace promol::sht {

std::pair<Vec, Vec> gauss_legendre_quadrature(int N);
void gauss_legendre_quadrature(Vec &roots, Vec &weights, int N);

} // namespace promol::sht
