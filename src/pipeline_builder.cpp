#include <pulse/pipeline_builder.h>

#include <pulse/report_pipeline.h>

#include <utility>

namespace pulse {

PipelineBuilder PipelineBuilder::WithDefaults() {
  PipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>());
  return builder;
}

PipelineBuilder &PipelineBuilder::WithHarvestOptions(HarvestOptions options) {
  components_.metrics.utc_offset_minutes = options.utc_offset_minutes;
  components_.harvest = options;
  return *this;
}

PipelineBuilder &PipelineBuilder::WithRiskConfig(RiskConfig config) {
  components_.risk = config;
  return *this;
}

PipelineBuilder &PipelineBuilder::WithForecastConfig(ForecastConfig config) {
  components_.forecast = config;
  return *this;
}

PipelineBuilder &PipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

ReportPipeline PipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  return ReportPipeline(components_);
}

} // namespace pulse
