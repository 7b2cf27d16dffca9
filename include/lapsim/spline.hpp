#pragma once
#include <cstddef>
#include <vector>

namespace lapsim {

// Periodic cubic spline through (knots[i], values[i]).
// knots must be strictly increasing; the last value is taken to equal the
// first (closed curve), so values.size() == knots.size() and
// values.back() == values.front() is enforced by the constructor.
class PeriodicCubicSpline {
public:
  PeriodicCubicSpline() = default;
  PeriodicCubicSpline(std::vector<double> knots, std::vector<double> values);

  // Evaluate at t. Values outside [knots.front(), knots.back()] wrap around
  // the period; t == knots.back() returns the closing value.
  double operator()(double t) const;

  double period() const { return knots_.empty() ? 0.0 : knots_.back() - knots_.front(); }
  bool empty() const { return knots_.size() < 4; }

private:
  void solve_second_derivatives_();

  std::vector<double> knots_;
  std::vector<double> values_;
  std::vector<double> m_;   // second derivative at each knot
};

// Solves a cyclic tridiagonal system
//   lower[i]*x[i-1] + diag[i]*x[i] + upper[i]*x[i+1] = rhs[i]  (indices mod n)
// with the Sherman-Morrison correction on top of the Thomas algorithm.
std::vector<double> solve_cyclic_tridiagonal(const std::vector<double>& lower,
                                             const std::vector<double>& diag,
                                             const std::vector<double>& upper,
                                             const std::vector<double>& rhs);

} // namespace lapsim
