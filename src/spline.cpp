#include <lapsim/spline.hpp>
#include <algorithm>
#include <cmath>
#include <lapsim/errors.hpp>

namespace lapsim {

static std::vector<double> solve_tridiagonal_(const std::vector<double>& lower,
                                              const std::vector<double>& diag,
                                              const std::vector<double>& upper,
                                              const std::vector<double>& rhs) {
  const std::size_t n = diag.size();
  std::vector<double> c(n, 0.0), d(n, 0.0), x(n, 0.0);
  c[0] = upper[0] / diag[0];
  d[0] = rhs[0] / diag[0];
  for (std::size_t i = 1; i < n; ++i) {
    const double m = diag[i] - lower[i] * c[i-1];
    c[i] = upper[i] / m;
    d[i] = (rhs[i] - lower[i] * d[i-1]) / m;
  }
  x[n-1] = d[n-1];
  for (std::size_t i = n - 1; i-- > 0;) {
    x[i] = d[i] - c[i] * x[i+1];
  }
  return x;
}

std::vector<double> solve_cyclic_tridiagonal(const std::vector<double>& lower,
                                             const std::vector<double>& diag,
                                             const std::vector<double>& upper,
                                             const std::vector<double>& rhs) {
  const std::size_t n = diag.size();
  if (n < 3 || lower.size() != n || upper.size() != n || rhs.size() != n) {
    throw GeometryError("cyclic tridiagonal system needs at least 3 equations of equal size");
  }

  // Corner entries: row 0 couples to x[n-1], row n-1 couples to x[0].
  const double top_right   = lower[0];
  const double bottom_left = upper[n-1];
  const double gamma = -diag[0];

  std::vector<double> bb = diag;
  bb[0]   -= gamma;
  bb[n-1] -= bottom_left * top_right / gamma;

  std::vector<double> x = solve_tridiagonal_(lower, bb, upper, rhs);

  std::vector<double> u(n, 0.0);
  u[0]   = gamma;
  u[n-1] = bottom_left;
  const std::vector<double> z = solve_tridiagonal_(lower, bb, upper, u);

  const double fact = (x[0] + top_right * x[n-1] / gamma)
                    / (1.0 + z[0] + top_right * z[n-1] / gamma);
  for (std::size_t i = 0; i < n; ++i) x[i] -= fact * z[i];
  return x;
}

PeriodicCubicSpline::PeriodicCubicSpline(std::vector<double> knots, std::vector<double> values)
  : knots_(std::move(knots)), values_(std::move(values)) {
  if (knots_.size() != values_.size() || knots_.size() < 4) {
    throw GeometryError("periodic spline needs at least 3 points plus the closing knot");
  }
  for (std::size_t i = 1; i < knots_.size(); ++i) {
    if (!(knots_[i] > knots_[i-1])) {
      throw GeometryError("spline knots must be strictly increasing");
    }
  }
  values_.back() = values_.front();
  solve_second_derivatives_();
}

void PeriodicCubicSpline::solve_second_derivatives_() {
  const std::size_t n = knots_.size() - 1; // unknowns; m[n] == m[0]
  std::vector<double> h(n);
  for (std::size_t i = 0; i < n; ++i) h[i] = knots_[i+1] - knots_[i];

  std::vector<double> lower(n), diag(n), upper(n), rhs(n);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t ip = (i + n - 1) % n;
    const double h_prev = h[ip];
    const double y_prev = values_[ip];
    const double y_next = values_[i+1];
    lower[i] = h_prev;
    diag[i]  = 2.0 * (h_prev + h[i]);
    upper[i] = h[i];
    rhs[i]   = 6.0 * ((y_next - values_[i]) / h[i] - (values_[i] - y_prev) / h_prev);
  }

  m_ = solve_cyclic_tridiagonal(lower, diag, upper, rhs);
  m_.push_back(m_.front());
}

double PeriodicCubicSpline::operator()(double t) const {
  if (empty()) return 0.0;
  const double t0 = knots_.front();
  const double t1 = knots_.back();
  if (t < t0 || t > t1) {
    const double p = t1 - t0;
    t = t0 + std::fmod(t - t0, p);
    if (t < t0) t += p;
  }

  auto it = std::upper_bound(knots_.begin(), knots_.end(), t);
  std::size_t i = static_cast<std::size_t>(std::distance(knots_.begin(), it));
  i = std::clamp<std::size_t>(i, 1, knots_.size() - 1) - 1;

  const double h = knots_[i+1] - knots_[i];
  const double a = (knots_[i+1] - t) / h;
  const double b = (t - knots_[i]) / h;
  return a * values_[i] + b * values_[i+1]
       + ((a*a*a - a) * m_[i] + (b*b*b - b) * m_[i+1]) * (h * h) / 6.0;
}

} // namespace lapsim
