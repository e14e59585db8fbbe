#pragma once

#include <cmath>
#include <numeric>
#include <vector>

namespace pulse {

inline double Mean(const std::vector<double> &values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

// Sample standard deviation (n - 1). Zero for fewer than two values.
inline double SampleStdDev(const std::vector<double> &values) {
  if (values.size() < 2) {
    return 0.0;
  }
  const double mean = Mean(values);
  double sum_of_squares = 0.0;
  for (const auto value : values) {
    sum_of_squares += (value - mean) * (value - mean);
  }
  return std::sqrt(sum_of_squares / static_cast<double>(values.size() - 1));
}

inline double Percent(std::size_t numerator, std::size_t denominator) {
  if (denominator == 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(numerator) /
         static_cast<double>(denominator);
}

} // namespace pulse
