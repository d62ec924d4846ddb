#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace arena {
namespace math {

// -----------------------------------------------------------------------------
// Numeric helpers shared by the analytics components
// -----------------------------------------------------------------------------
//
// @brief  Rounding, averaging and dispersion helpers used by every scoring
//         table in the engine.
//
// @details
// All published metrics are rounded half-up (ties toward +infinity) so that
// scores computed here are reproducible against historical benchmark data.
// std::round() rounds ties away from zero, which differs for negative
// values (-2.5 -> -3 instead of -2).
//
// Empty inputs never produce NaN: mean() and populationStdDev() return 0.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

inline double roundHalfUp(double value) { return std::floor(value + 0.5); }

// Rounds to the given number of decimal places (half-up).
inline double roundTo(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::floor(value * scale + 0.5) / scale;
}

inline double round1(double value) { return roundTo(value, 1); }
inline double round2(double value) { return roundTo(value, 2); }
inline double round3(double value) { return roundTo(value, 3); }

inline double sum(const std::vector<double>& values) {
  double total = 0.0;
  for (double v : values) {
    total += v;
  }
  return total;
}

inline double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return sum(values) / static_cast<double>(values.size());
}

// Population variance (divides by n).
inline double populationVariance(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const double avg = mean(values);
  double acc = 0.0;
  for (double v : values) {
    acc += (v - avg) * (v - avg);
  }
  return acc / static_cast<double>(values.size());
}

inline double populationStdDev(const std::vector<double>& values) {
  return std::sqrt(populationVariance(values));
}

// -------------------------------------------------------------------------
// linearTrend(values)
// -------------------------------------------------------------------------
// @brief  Least-squares slope of values against their index, divided by
//         the mean of the values.
//
// @return Relative trend. Positive means the series is rising. Returns 0
//         for fewer than 3 points, a zero mean, or zero x-variance.
// -------------------------------------------------------------------------
inline double linearTrend(const std::vector<double>& values) {
  const std::size_t n = values.size();
  if (n < 3) {
    return 0.0;
  }

  const double avg = mean(values);
  if (avg == 0.0) {
    return 0.0;
  }

  const double x_mean = static_cast<double>(n - 1) / 2.0;
  double sum_xy = 0.0;
  double sum_xx = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = static_cast<double>(i) - x_mean;
    sum_xy += dx * (values[i] - avg);
    sum_xx += dx * dx;
  }

  if (sum_xx == 0.0) {
    return 0.0;
  }
  return (sum_xy / sum_xx) / avg;
}

// Fixed-point text for human-readable descriptions ("12.5", "0.07").
inline std::string toFixed(double value, int digits) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", digits, value);
  return std::string(buffer);
}

}  // namespace math
}  // namespace arena
