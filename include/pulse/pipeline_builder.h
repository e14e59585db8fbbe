#pragma once

#include <pulse/forecaster.h>
#include <pulse/logging.h>
#include <pulse/metrics_engine.h>
#include <pulse/models.h>
#include <pulse/risk_detector.h>

#include <memory>

namespace pulse {

class ReportPipeline;

struct PipelineComponents {
  HarvestOptions harvest;
  MetricsConfig metrics;
  RiskConfig risk;
  ForecastConfig forecast;
  std::shared_ptr<Logger> logger;
};

class PipelineBuilder {
public:
  // Also sets the metrics engine's UTC offset so weekday bucketing and
  // after-hours derivation agree.
  PipelineBuilder &WithHarvestOptions(HarvestOptions options);
  PipelineBuilder &WithRiskConfig(RiskConfig config);
  PipelineBuilder &WithForecastConfig(ForecastConfig config);
  PipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);

  ReportPipeline Build();

  static PipelineBuilder WithDefaults();

private:
  PipelineComponents components_;
};

} // namespace pulse
