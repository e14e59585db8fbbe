#include <pulse/event_model.h>
#include <pulse/forecaster.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace pulse {
namespace {

constexpr int kGridSteps = 19;
constexpr double kGridStep = 0.05;

} // namespace

HoltFit RunHolt(const std::vector<double> &series, double alpha,
                double beta) {
  if (series.size() < 2) {
    throw std::invalid_argument("Holt smoothing needs at least two values");
  }
  HoltFit fit;
  fit.alpha = alpha;
  fit.beta = beta;
  fit.level = series[0];
  fit.trend = series[1] - series[0];
  for (std::size_t t = 1; t < series.size(); ++t) {
    const double predicted = fit.level + fit.trend;
    const double error = series[t] - predicted;
    fit.sum_squared_error += error * error;
    const double previous_level = fit.level;
    fit.level = alpha * series[t] + (1.0 - alpha) * predicted;
    fit.trend = beta * (fit.level - previous_level) + (1.0 - beta) * fit.trend;
  }
  return fit;
}

HoltFit FitHolt(const std::vector<double> &series) {
  HoltFit best;
  bool have_best = false;
  for (int a = 1; a <= kGridSteps; ++a) {
    for (int b = 1; b <= kGridSteps; ++b) {
      const auto candidate = RunHolt(series, a * kGridStep, b * kGridStep);
      if (!have_best || candidate.sum_squared_error < best.sum_squared_error) {
        best = candidate;
        have_best = true;
      }
    }
  }
  return best;
}

Confidence ConfidenceForHistory(std::size_t history_length) {
  if (history_length >= 8) {
    return Confidence::kHigh;
  }
  if (history_length >= 4) {
    return Confidence::kMedium;
  }
  return Confidence::kLow;
}

std::vector<double> ExtractSeries(const std::vector<PeriodMetrics> &history,
                                  ForecastMetric metric) {
  std::vector<double> series;
  series.reserve(history.size());
  for (const auto &metrics : history) {
    if (metric == ForecastMetric::kChurn) {
      series.push_back(static_cast<double>(metrics.total_churn));
    } else if (metrics.lead_time_hours) {
      series.push_back(*metrics.lead_time_hours);
    }
  }
  return series;
}

Forecaster::Forecaster(ForecastConfig config, std::shared_ptr<Logger> logger)
    : config_(config), logger_(EnsureLogger(std::move(logger))) {}

TrendDirection Forecaster::DirectionFor(double prediction, double last) const {
  const double band = config_.flat_band * std::fabs(last);
  if (prediction > last + band && prediction > last) {
    return TrendDirection::kIncreasing;
  }
  if (prediction < last - band && prediction < last) {
    return TrendDirection::kDecreasing;
  }
  return TrendDirection::kFlat;
}

ForecastResult
Forecaster::Forecast(ForecastMetric metric,
                     const std::vector<PeriodMetrics> &history) const {
  Period target;
  if (!history.empty()) {
    target = NextPeriod(history.back().period);
  }
  return ForecastValues(metric, ExtractSeries(history, metric), target);
}

ForecastResult Forecaster::ForecastValues(ForecastMetric metric,
                                          std::vector<double> series,
                                          const Period &target_period) const {
  if (series.size() > config_.max_history) {
    series.erase(series.begin(),
                 series.end() -
                     static_cast<std::ptrdiff_t>(config_.max_history));
  }

  ForecastResult result;
  result.metric = metric;
  result.target_period = target_period;
  result.history_length = series.size();
  result.direction = TrendDirection::kFlat;
  result.confidence = Confidence::kLow;

  // A single point means no prior Period has been observed.
  if (series.size() < 2) {
    result.status = ForecastStatus::kInsufficientData;
    if (!series.empty()) {
      result.last_observed = series.back();
    }
    logger_->Log(LogLevel::kDebug, "forecast.insufficient_data",
                 {{"metric", ToString(metric)},
                  {"history", std::to_string(series.size())}});
    return result;
  }

  result.last_observed = series.back();
  if (series.size() < std::max<std::size_t>(config_.min_history, 2)) {
    result.status = ForecastStatus::kNaive;
    result.prediction = series.back();
    return result;
  }

  const auto fit = FitHolt(series);
  const double prediction = std::max(0.0, fit.Forecast());
  result.status = ForecastStatus::kFitted;
  result.prediction = prediction;
  result.alpha = fit.alpha;
  result.beta = fit.beta;
  result.rmse = std::sqrt(fit.sum_squared_error /
                          static_cast<double>(series.size() - 1));
  result.direction = DirectionFor(prediction, series.back());
  result.confidence = ConfidenceForHistory(series.size());

  logger_->Log(LogLevel::kDebug, "forecast.fitted",
               {{"metric", ToString(metric)},
                {"history", std::to_string(series.size())},
                {"alpha", std::to_string(fit.alpha)},
                {"beta", std::to_string(fit.beta)},
                {"prediction", std::to_string(prediction)}});
  return result;
}

} // namespace pulse
