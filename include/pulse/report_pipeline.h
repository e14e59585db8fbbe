#pragma once

#include <pulse/forecaster.h>
#include <pulse/interfaces.h>
#include <pulse/metrics_engine.h>
#include <pulse/pipeline_builder.h>
#include <pulse/pipeline_state.h>
#include <pulse/risk_detector.h>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pulse {

// Accumulator threaded through the stages of a single run. Owned by exactly
// one run; never share it between runs.
struct PipelineContext {
  Period period;
  PipelineState state = PipelineState::kIdle;
  std::optional<EventSet> events;
  HarvestSummary harvest;
  std::optional<MetricsResult> metrics;
  std::optional<RiskAssessment> risk;
  std::vector<ForecastResult> forecasts;
  std::optional<Report> report;
};

struct PipelineError {
  PipelineStage stage = PipelineStage::kHarvest;
  std::string detail;
};

struct PipelineResult {
  std::variant<Report, PipelineError> outcome;
  std::vector<PipelineState> states;

  bool Succeeded() const { return std::holds_alternative<Report>(outcome); }
  const Report &report() const { return std::get<Report>(outcome); }
  const PipelineError &error() const {
    return std::get<PipelineError>(outcome);
  }
};

void HarvestStage(PipelineContext &context, EventSource &source,
                  const HarvestOptions &options, Logger &logger);
void AnalyzeStage(PipelineContext &context, const MetricsEngine &metrics,
                  const RiskDetector &risk,
                  const std::optional<PeriodMetrics> &prior);
void SummarizeStage(PipelineContext &context, const Forecaster &forecaster,
                    const std::vector<PeriodMetrics> &history);

// Harvest -> Analyze -> Summarize. Stage failures end the run in kFailed
// with the failing stage named; nothing is retried.
class ReportPipeline {
public:
  explicit ReportPipeline(PipelineComponents components);

  PipelineResult Run(const Period &period, EventSource &source,
                     const std::vector<PeriodMetrics> &history = {}) const;

  // Drives an existing context from its current state to a terminal one.
  PipelineResult Execute(PipelineContext &context, EventSource &source,
                         const std::vector<PeriodMetrics> &history) const;

private:
  void RunStage(PipelineStage stage, PipelineContext &context,
                EventSource &source,
                const std::vector<PeriodMetrics> &history) const;

  HarvestOptions harvest_;
  MetricsEngine metrics_;
  RiskDetector risk_;
  Forecaster forecaster_;
  std::shared_ptr<Logger> logger_;
};

} // namespace pulse
