#pragma once
#include <cmath>
#include <fmt/core.h>
#include <promol/core/linear_algebra.h>
#include <promol/core/macros.h>
#include <stdexcept>

namespace promol::core {

/**
 * Check that (domain, values) describe a usable log-space table.
 *
 * Throws std::invalid_argument if there are fewer than two points, the
 * sizes differ, or the domain is not strictly increasing and positive.
 */
template <typename DerivedX, typename DerivedY>
void validate_log_table(const Eigen::DenseBase<DerivedX> &domain,
                        const Eigen::DenseBase<DerivedY> &values) {
  const Eigen::Index n = domain.size();
  if (n < 2) {
    throw std::invalid_argument(fmt::format(
        "Interpolation table requires at least 2 points, found {}", n));
  }
  if (values.size() != n) {
    throw std::invalid_argument(
        fmt::format("Interpolation table size mismatch: {} domain points, {} "
                    "values",
                    n, values.size()));
  }
  if (!(domain.derived()(0) > 0)) {
    throw std::invalid_argument(fmt::format(
        "Interpolation domain must be positive, found x[0] = {}",
        domain.derived()(0)));
  }
  for (Eigen::Index i = 1; i < n; i++) {
    if (!(domain.derived()(i) > domain.derived()(i - 1))) {
      throw std::invalid_argument(fmt::format(
          "Interpolation domain must be strictly increasing: x[{}] = {} <= "
          "x[{}] = {}",
          i, domain.derived()(i), i - 1, domain.derived()(i - 1)));
    }
  }
}

/**
 * Interpolate in a table whose nodes are roughly evenly spaced in log(x).
 *
 * \param x the query value, expected > 0
 * \param xs pointer to the n domain values (strictly increasing)
 * \param ys pointer to the n range values
 * \param n number of nodes
 * \param l_domain log(xs[0])
 * \param dx n / (log(xs[n-1]) - log(xs[0]))
 *
 * The bucket is guessed from log(x), then a forward linear scan finds the
 * first node >= x and the value is linearly interpolated in x (not log x)
 * over that segment. Queries that land in the first bucket or past the last
 * return ys[0] and ys[n-1] respectively. There is no bounds check inside the
 * scan; the table must already satisfy validate_log_table.
 */
template <typename T>
PROMOL_ALWAYS_INLINE T log_interp(T x, const T *xs, const T *ys,
                                  Eigen::Index n, T l_domain, T dx) {
  const T guess = (std::log(x) - l_domain) * dx;
  // floor(guess) <= 0, also catches log(0) and NaN
  if (!(guess >= 1))
    return ys[0];
  if (guess >= static_cast<T>(n - 1))
    return ys[n - 1];
  Eigen::Index j = static_cast<Eigen::Index>(guess);
  while (xs[j] < x)
    j++;
  T slope = (ys[j] - ys[j - 1]) / (xs[j] - xs[j - 1]);
  return ys[j - 1] + (x - xs[j - 1]) * slope;
}

/**
 * Immutable log-space interpolation table.
 *
 * Stores the domain and range along with the precomputed log-space bucket
 * parameters so that repeated lookups in a hot loop only cost a log and a
 * short scan.
 */
template <typename T> class LogInterpolator {
public:
  using Array = Eigen::Array<T, Eigen::Dynamic, 1>;
  using Vector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

  /**
   * Construct from tabulated values.
   *
   * \param domain strictly increasing, positive x values (at least 2)
   * \param range the y values, same length as domain
   *
   * Throws std::invalid_argument if the table is malformed.
   */
  template <typename DerivedX, typename DerivedY>
  LogInterpolator(const Eigen::DenseBase<DerivedX> &domain,
                  const Eigen::DenseBase<DerivedY> &range) {
    validate_log_table(domain, range);
    m_domain = domain.derived().array().template cast<T>();
    m_range = range.derived().array().template cast<T>();
    const Eigen::Index n = m_domain.size();
    l_domain = std::log(m_domain(0));
    u_domain = std::log(m_domain(n - 1));
    m_dx = static_cast<T>(n) / (u_domain - l_domain);
  }

  /**
   * Construct by sampling f at N points evenly spaced in log(x) over
   * [left, right].
   */
  template <typename F>
  static LogInterpolator from_function(const F &f, T left, T right, size_t N) {
    Array domain(N), range(N);
    const T l_mapped = std::log(left);
    const T u_mapped = std::log(right);
    for (size_t i = 0; i < N; i++) {
      T x = std::exp(l_mapped + i * (u_mapped - l_mapped) / (N - 1));
      domain(i) = x;
      range(i) = f(x);
    }
    return LogInterpolator(domain, range);
  }

  PROMOL_ALWAYS_INLINE T operator()(T x) const {
    return log_interp(x, m_domain.data(), m_range.data(), m_domain.size(),
                      l_domain, m_dx);
  }

  /// Evaluate at every entry of xs, writing into dest (same length).
  void evaluate(Eigen::Ref<const Vector> xs, Eigen::Ref<Vector> dest) const {
    const T *px = m_domain.data();
    const T *py = m_range.data();
    const Eigen::Index n = m_domain.size();
    for (Eigen::Index i = 0; i < xs.size(); i++) {
      dest(i) = log_interp(xs(i), px, py, n, l_domain, m_dx);
    }
  }

  /// As evaluate, but adds into dest.
  void accumulate(Eigen::Ref<const Vector> xs, Eigen::Ref<Vector> dest) const {
    const T *px = m_domain.data();
    const T *py = m_range.data();
    const Eigen::Index n = m_domain.size();
    for (Eigen::Index i = 0; i < xs.size(); i++) {
      dest(i) += log_interp(xs(i), px, py, n, l_domain, m_dx);
    }
  }

  Vector operator()(Eigen::Ref<const Vector> xs) const {
    Vector result(xs.size());
    evaluate(xs, result);
    return result;
  }

  inline Eigen::Index size() const { return m_domain.size(); }
  inline const Array &domain() const { return m_domain; }
  inline const Array &range() const { return m_range; }
  inline T left_fill() const { return m_range(0); }
  inline T right_fill() const { return m_range(m_range.size() - 1); }

private:
  T l_domain{0}, u_domain{0};
  T m_dx{0};
  Array m_domain, m_range;
};

/**
 * Standalone log-space interpolation of query values against a raw
 * (domain, values) table. Validates the table.
 */
template <typename T>
Eigen::Matrix<T, Eigen::Dynamic, 1>
log_interp(const Eigen::Matrix<T, Eigen::Dynamic, 1> &query,
           const Eigen::Matrix<T, Eigen::Dynamic, 1> &domain,
           const Eigen::Matrix<T, Eigen::Dynamic, 1> &values) {
  LogInterpolator<T> interp(domain, values);
  return interp(query);
}

template <typename T>
T log_interp(T query, const Eigen::Matrix<T, Eigen::Dynamic, 1> &domain,
             const Eigen::Matrix<T, Eigen::Dynamic, 1> &values) {
  LogInterpolator<T> interp(domain, values);
  return interp(query);
}

/**
 * Adds the interpolated values for query into dest. Validates the table and
 * that dest is the same length as query.
 */
template <typename T>
void log_interp_accumulate(const Eigen::Matrix<T, Eigen::Dynamic, 1> &query,
                           const Eigen::Matrix<T, Eigen::Dynamic, 1> &domain,
                           const Eigen::Matrix<T, Eigen::Dynamic, 1> &values,
                           Eigen::Matrix<T, Eigen::Dynamic, 1> &dest) {
  if (dest.size() != query.size()) {
    throw std::invalid_argument(
        fmt::format("Output size {} does not match number of queries {}",
                    dest.size(), query.size()));
  }
  LogInterpolator<T> interp(domain, values);
  interp.accumulate(query, dest);
}

} // namespace promol::core
