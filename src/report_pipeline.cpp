#include <pulse/event_model.h>
#include <pulse/report_assembler.h>
#include <pulse/report_pipeline.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace pulse {
namespace {

void RequireState(const PipelineContext &context, PipelineState expected) {
  if (context.state != expected) {
    throw std::logic_error(std::string("Stage requires state ") +
                           ToString(expected) + " but pipeline is " +
                           ToString(context.state));
  }
}

std::optional<PeriodMetrics>
PriorMetrics(const std::vector<PeriodMetrics> &history) {
  if (history.empty()) {
    return std::nullopt;
  }
  return history.back();
}

void Transition(PipelineContext &context, PipelineResult &result,
                PipelineEvent event) {
  context.state = NextState(context.state, event);
  result.states.push_back(context.state);
}

} // namespace

void HarvestStage(PipelineContext &context, EventSource &source,
                  const HarvestOptions &options, Logger &logger) {
  RequireState(context, PipelineState::kHarvesting);
  if (context.period.end <= context.period.start) {
    throw std::invalid_argument("Period end must be after its start");
  }

  const auto batch = source.Fetch(context.period);
  auto harvested = IngestEvents(context.period, batch, options);
  if (harvested.summary.TotalDropped() > 0) {
    const auto &summary = harvested.summary;
    logger.Log(LogLevel::kWarn, "harvest.dropped",
               {{"malformed_commits", std::to_string(summary.malformed_commits)},
                {"malformed_pull_requests",
                 std::to_string(summary.malformed_pull_requests)},
                {"out_of_range_commits",
                 std::to_string(summary.out_of_range_commits)},
                {"out_of_range_pull_requests",
                 std::to_string(summary.out_of_range_pull_requests)}});
  }
  context.harvest = harvested.summary;
  context.events = std::move(harvested.events);
}

void AnalyzeStage(PipelineContext &context, const MetricsEngine &metrics,
                  const RiskDetector &risk,
                  const std::optional<PeriodMetrics> &prior) {
  RequireState(context, PipelineState::kAnalyzing);
  if (!context.events) {
    throw std::logic_error("Analyze stage requires harvested events");
  }

  auto computed = metrics.Compute(*context.events, context.period, prior);
  auto assessment = risk.Detect(*context.events, computed.author_stats);
  computed.author_stats = AttachRiskCounts(computed.author_stats, assessment);
  context.metrics = std::move(computed);
  context.risk = std::move(assessment);
}

void SummarizeStage(PipelineContext &context, const Forecaster &forecaster,
                    const std::vector<PeriodMetrics> &history) {
  RequireState(context, PipelineState::kSummarizing);
  if (!context.metrics || !context.risk) {
    throw std::logic_error("Summarize stage requires analysis results");
  }

  auto series = history;
  series.push_back(context.metrics->period_metrics);
  context.forecasts = {forecaster.Forecast(ForecastMetric::kChurn, series),
                       forecaster.Forecast(ForecastMetric::kLeadTime, series)};

  ReportParts parts;
  parts.period = context.period;
  parts.author_stats = context.metrics->author_stats;
  parts.period_metrics = context.metrics->period_metrics;
  parts.risk = *context.risk;
  parts.forecasts = context.forecasts;
  parts.deltas = context.metrics->deltas;
  parts.harvest = context.harvest;
  context.report = AssembleReport(std::move(parts));
}

ReportPipeline::ReportPipeline(PipelineComponents components)
    : harvest_(components.harvest),
      metrics_(components.metrics, components.logger),
      risk_(components.risk, components.logger),
      forecaster_(components.forecast, components.logger),
      logger_(EnsureLogger(std::move(components.logger))) {}

void ReportPipeline::RunStage(PipelineStage stage, PipelineContext &context,
                              EventSource &source,
                              const std::vector<PeriodMetrics> &history) const {
  switch (stage) {
  case PipelineStage::kHarvest:
    HarvestStage(context, source, harvest_, *logger_);
    return;
  case PipelineStage::kAnalyze:
    AnalyzeStage(context, metrics_, risk_, PriorMetrics(history));
    return;
  case PipelineStage::kSummarize:
    SummarizeStage(context, forecaster_, history);
    return;
  }
}

PipelineResult
ReportPipeline::Run(const Period &period, EventSource &source,
                    const std::vector<PeriodMetrics> &history) const {
  PipelineContext context;
  context.period = period;
  return Execute(context, source, history);
}

PipelineResult
ReportPipeline::Execute(PipelineContext &context, EventSource &source,
                        const std::vector<PeriodMetrics> &history) const {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"period_start", FormatTimestamp(context.period.start)},
                {"period_end", FormatTimestamp(context.period.end)},
                {"granularity", ToString(context.period.granularity)},
                {"history", std::to_string(history.size())}});

  PipelineResult result;
  result.states.push_back(context.state);
  if (context.state == PipelineState::kIdle) {
    Transition(context, result, PipelineEvent::kStart);
  }

  const auto pipeline_start = std::chrono::steady_clock::now();
  while (!IsTerminal(context.state)) {
    const auto stage = StageFor(context.state);
    try {
      RunStage(stage, context, source, history);
    } catch (const std::exception &error) {
      logger_->Log(LogLevel::kError, "pipeline.stage.failed",
                   {{"stage", ToString(stage)}, {"error", error.what()}});
      result.outcome = PipelineError{stage, error.what()};
      Transition(context, result, PipelineEvent::kStageFailed);
      return result;
    }
    logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                 {{"stage", ToString(stage)}});
    Transition(context, result, PipelineEvent::kStageSucceeded);
  }

  if (context.state != PipelineState::kDone || !context.report) {
    result.outcome = PipelineError{PipelineStage::kSummarize,
                                   "Pipeline finished without a report"};
    return result;
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"commits", std::to_string(
                                context.report->period_metrics.total_commits)},
                {"flags", std::to_string(context.report->risk.flags.size())}});
  result.outcome = *context.report;
  return result;
}

} // namespace pulse
