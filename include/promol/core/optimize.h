#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace promol::core::opt {

struct RootResult {
  double x{0.0};
  double fx{0.0};
  size_t iterations{0};
  size_t num_calls{0};
  bool converged{false};
  bool bracketed{false};
};

/**
 * Brent's method for a root of a scalar function on [left, right].
 *
 * Combines inverse quadratic interpolation, the secant method and bisection.
 * Iteration stops once the bracket is narrower than the tolerance, returning
 * the most recent estimate. If max_iter is reached first, root() is right()
 * and converged() is false.
 *
 * The sign change over [left, right] is recorded in bracketed() but not
 * enforced: an unbracketed interval is still iterated and the result flagged
 * as not converged.
 */
template <class Function> class BrentRoot {
public:
  BrentRoot(Function &func, double tol = 1e-7, size_t maxiter = 30)
      : m_func(func), m_tolerance(tol), m_max_iter(maxiter) {}

  void set_left(double x) {
    m_left = x;
    m_solved = false;
  }
  double left() const { return m_left; }

  void set_right(double x) {
    m_right = x;
    m_solved = false;
  }
  double right() const { return m_right; }

  double root() { return result().x; }
  double f_root() { return result().fx; }
  bool converged() { return result().converged; }
  bool bracketed() { return result().bracketed; }
  size_t num_calls() { return result().num_calls; }
  size_t iterations() { return result().iterations; }

  const RootResult &result() {
    if (!m_solved)
      solve();
    return m_result;
  }

private:
  void solve() {
    double a = m_left, b = m_right;
    double fa = m_func(a);
    double fb = m_func(b);
    const double f_right = fb;
    size_t num_calls = 2;

    m_result = RootResult{};
    m_result.bracketed = (fa * fb) <= 0.0;

    double c = a, fc = fa;
    double d = 0.0;
    double s = b, fs = fb;
    bool mflag = true;

    for (size_t iter = 0; iter < m_max_iter; iter++) {
      if (std::abs(b - a) < m_tolerance) {
        m_result.x = s;
        m_result.fx = fs;
        m_result.iterations = iter;
        m_result.num_calls = num_calls;
        m_result.converged = m_result.bracketed;
        m_solved = true;
        return;
      }

      if ((fa != fc) && (fb != fc)) {
        // inverse quadratic interpolation
        s = a * fb * fc / ((fa - fb) * (fa - fc)) +
            b * fa * fc / ((fb - fa) * (fb - fc)) +
            c * fa * fb / ((fc - fa) * (fc - fb));
      } else {
        // secant
        s = b - fb * (b - a) / (fb - fa);
      }

      const double q = (3 * a + b) / 4;
      const double lo = std::min(q, b), hi = std::max(q, b);
      // written so that a NaN candidate falls through to bisection
      const bool outside = !((s > lo) && (s < hi));
      const bool reject =
          outside ||
          (mflag && (std::abs(s - b) >= std::abs(b - c) / 2)) ||
          (!mflag && (std::abs(s - b) >= std::abs(c - d) / 2)) ||
          (mflag && (std::abs(b - c) < m_tolerance)) ||
          (!mflag && (std::abs(c - d) < m_tolerance));

      if (reject) {
        s = (a + b) / 2;
        mflag = true;
      } else {
        mflag = false;
      }

      fs = m_func(s);
      num_calls++;
      d = c;
      c = b;
      fc = fb;

      if (fa * fs < 0) {
        b = s;
        fb = fs;
      } else {
        a = s;
        fa = fs;
      }

      if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
      }
    }

    m_result.x = m_right;
    m_result.fx = f_right;
    m_result.iterations = m_max_iter;
    m_result.num_calls = num_calls;
    m_result.converged = false;
    m_solved = true;
  }

  Function &m_func;
  double m_tolerance{1e-7};
  size_t m_max_iter{30};
  double m_left{0.0};
  double m_right{1.0};
  bool m_solved{false};
  RootResult m_result;
};

} // namespace promol::core::opt
