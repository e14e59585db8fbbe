#pragma once

#include <pulse/logging.h>
#include <pulse/models.h>

#include <memory>
#include <optional>
#include <vector>

namespace pulse {

struct HoltFit {
  double alpha = 0.0;
  double beta = 0.0;
  double level = 0.0;
  double trend = 0.0;
  double sum_squared_error = 0.0;

  double Forecast() const { return level + trend; }
};

// Runs Holt's linear (level + trend) smoothing over the series with fixed
// parameters. The series must hold at least two values.
HoltFit RunHolt(const std::vector<double> &series, double alpha, double beta);

// Grid search over alpha and beta in [0.05, 0.95] minimising one-step-ahead
// squared error. Ties keep the smallest parameters.
HoltFit FitHolt(const std::vector<double> &series);

Confidence ConfidenceForHistory(std::size_t history_length);

std::vector<double> ExtractSeries(const std::vector<PeriodMetrics> &history,
                                  ForecastMetric metric);

class Forecaster {
public:
  explicit Forecaster(ForecastConfig config = {},
                      std::shared_ptr<Logger> logger = nullptr);

  // history is ordered oldest first and ends with the just-computed Period.
  ForecastResult Forecast(ForecastMetric metric,
                          const std::vector<PeriodMetrics> &history) const;

  ForecastResult ForecastValues(ForecastMetric metric,
                                std::vector<double> series,
                                const Period &target_period) const;

private:
  TrendDirection DirectionFor(double prediction, double last) const;

  ForecastConfig config_;
  std::shared_ptr<Logger> logger_;
};

} // namespace pulse
