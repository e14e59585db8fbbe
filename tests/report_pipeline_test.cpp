#include <pulse/event_model.h>
#include <pulse/logging.h>
#include <pulse/metrics_engine.h>
#include <pulse/pipeline_builder.h>
#include <pulse/report_pipeline.h>

#include <sstream>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/event_builders.h"

namespace pulse {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using test::At;
using test::ReportWeek;

std::vector<PeriodMetrics> PriorWeeks(const std::vector<long long> &churn) {
  std::vector<PeriodMetrics> history;
  auto period = MakePeriod(Granularity::kWeekly,
                           At("2024-03-04") - std::chrono::hours(24 * 7 *
                                                                 static_cast<int>(churn.size())));
  for (const auto value : churn) {
    PeriodMetrics metrics;
    metrics.period = period;
    metrics.total_churn = value;
    metrics.total_commits = 10;
    metrics.lead_time_hours = 12.0;
    history.push_back(metrics);
    period = NextPeriod(period);
  }
  return history;
}

TEST(ReportPipelineTest, ProducesReportAndVisitsEveryState) {
  test::StaticEventSource source(test::ScenarioABatch());
  const auto pipeline = PipelineBuilder::WithDefaults().Build();

  const auto result = pipeline.Run(ReportWeek(), source);

  ASSERT_TRUE(result.Succeeded()) << result.error().detail;
  EXPECT_THAT(result.states,
              ElementsAre(PipelineState::kIdle, PipelineState::kHarvesting,
                          PipelineState::kAnalyzing,
                          PipelineState::kSummarizing, PipelineState::kDone));
  EXPECT_EQ(source.fetch_count(), 1);

  const auto &report = result.report();
  EXPECT_EQ(report.period_metrics.total_commits, 20);
  EXPECT_EQ(report.author_stats.at("alice").risky_commit_count, 1);
  EXPECT_THAT(report.risk.risky_commits, ElementsAre("c0"));
  ASSERT_EQ(report.forecasts.size(), 2u);
  EXPECT_EQ(report.forecasts[0].metric, ForecastMetric::kChurn);
  EXPECT_EQ(report.forecasts[0].status, ForecastStatus::kInsufficientData);
  EXPECT_EQ(report.forecasts[1].metric, ForecastMetric::kLeadTime);
  EXPECT_TRUE(report.deltas.empty());
  EXPECT_EQ(report.harvest.commits_ingested, 20u);
}

TEST(ReportPipelineTest, UsesHistoryForForecastsAndDeltas) {
  test::StaticEventSource source(test::ScenarioABatch());
  const auto pipeline = PipelineBuilder::WithDefaults().Build();
  const auto history = PriorWeeks({700, 760, 810, 790, 820, 800, 850});

  const auto result = pipeline.Run(ReportWeek(), source, history);

  ASSERT_TRUE(result.Succeeded());
  const auto &churn = result.report().forecasts[0];
  EXPECT_EQ(churn.status, ForecastStatus::kFitted);
  EXPECT_EQ(churn.history_length, 8u);
  EXPECT_EQ(churn.confidence, Confidence::kHigh);
  EXPECT_EQ(churn.target_period.start, At("2024-03-11"));
  EXPECT_FALSE(result.report().deltas.empty());
  EXPECT_EQ(result.report().deltas.front().metric, "total_commits");
  EXPECT_DOUBLE_EQ(result.report().deltas.front().Change(), 10.0);
}

TEST(ReportPipelineTest, HarvestFailureStopsTheRun) {
  test::FailingEventSource source;
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kDebug, "pulse"}, log);
  auto builder = PipelineBuilder::WithDefaults();
  builder.WithLogger(logger);
  const auto pipeline = builder.Build();

  const auto result = pipeline.Run(ReportWeek(), source);

  ASSERT_FALSE(result.Succeeded());
  EXPECT_EQ(result.error().stage, PipelineStage::kHarvest);
  EXPECT_THAT(result.error().detail, HasSubstr("unreachable"));
  EXPECT_THAT(result.states,
              ElementsAre(PipelineState::kIdle, PipelineState::kHarvesting,
                          PipelineState::kFailed));
  EXPECT_THAT(log.str(), HasSubstr("pipeline.stage.failed"));
  EXPECT_THAT(log.str(), HasSubstr("\"stage\": \"harvest\""));
  EXPECT_THAT(log.str(), ::testing::Not(HasSubstr("pipeline.complete")));
}

TEST(ReportPipelineTest, InvalidPeriodFailsHarvest) {
  test::StaticEventSource source(test::ScenarioABatch());
  Period inverted = ReportWeek();
  std::swap(inverted.start, inverted.end);

  const auto result = PipelineBuilder::WithDefaults().Build().Run(inverted,
                                                                  source);

  ASSERT_FALSE(result.Succeeded());
  EXPECT_EQ(result.error().stage, PipelineStage::kHarvest);
  EXPECT_EQ(source.fetch_count(), 0);
}

TEST(ReportPipelineTest, ConsistencyViolationFailsSummarize) {
  const auto events = test::ToEventSet(test::ScenarioABatch());
  auto metrics = MetricsEngine().Compute(events, ReportWeek());
  metrics.author_stats.at("alice").total_deletions += 3;

  PipelineContext context;
  context.period = ReportWeek();
  context.state = PipelineState::kSummarizing;
  context.events = events;
  context.metrics = metrics;
  context.risk = RiskAssessment{};

  test::StaticEventSource source(RawEventBatch{});
  const auto pipeline = PipelineBuilder::WithDefaults().Build();
  const auto result = pipeline.Execute(context, source, {});

  ASSERT_FALSE(result.Succeeded());
  EXPECT_EQ(result.error().stage, PipelineStage::kSummarize);
  EXPECT_THAT(result.error().detail, HasSubstr("reconcile"));
  EXPECT_EQ(context.state, PipelineState::kFailed);
  EXPECT_FALSE(context.report.has_value());
  EXPECT_EQ(source.fetch_count(), 0);
}

TEST(ReportPipelineTest, EmptyPeriodStillSucceeds) {
  test::StaticEventSource source(RawEventBatch{});
  const auto result =
      PipelineBuilder::WithDefaults().Build().Run(ReportWeek(), source);

  ASSERT_TRUE(result.Succeeded());
  const auto &report = result.report();
  EXPECT_EQ(report.period_metrics.total_commits, 0);
  EXPECT_FALSE(report.period_metrics.change_failure_rate.has_value());
  EXPECT_DOUBLE_EQ(report.risk.risky_commit_percent, 0.0);
  EXPECT_DOUBLE_EQ(report.risk.after_hours_percent, 0.0);
}

TEST(ReportPipelineTest, LogsLifecycleAndDroppedRecords) {
  auto batch = test::ScenarioABatch();
  batch.commits.push_back(test::MakeRawCommit(
      "outside", "alice", At("2024-02-01T10:00:00Z"), 1, 1));
  test::StaticEventSource source(batch);
  std::stringstream log;
  const auto pipeline =
      PipelineBuilder()
          .WithLogger(MakeLogger({LogLevel::kInfo, "pulse"}, log))
          .Build();

  const auto result = pipeline.Run(ReportWeek(), source);

  ASSERT_TRUE(result.Succeeded());
  EXPECT_EQ(result.report().harvest.out_of_range_commits, 1u);
  const auto output = log.str();
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.start\""));
  EXPECT_THAT(output, HasSubstr("level=warn"));
  EXPECT_THAT(output, HasSubstr("harvest.dropped"));
  EXPECT_THAT(output, HasSubstr("\"out_of_range_commits\": \"1\""));
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.complete\""));
  EXPECT_THAT(output, ::testing::Not(HasSubstr("pipeline.stage.complete")));
}

TEST(ReportPipelineTest, BuilderAppliesConfiguration) {
  RawEventBatch batch;
  batch.commits.push_back(test::MakeRawCommit(
      "night", "alice", At("2024-03-05T02:00:00Z"), 40, 10));
  test::StaticEventSource source(batch);

  HarvestOptions harvest;
  harvest.workday_start_hour = 0;
  harvest.workday_end_hour = 24;
  RiskConfig risk;
  risk.churn_threshold = 30.0;
  const auto pipeline = PipelineBuilder::WithDefaults()
                            .WithHarvestOptions(harvest)
                            .WithRiskConfig(risk)
                            .Build();

  const auto result = pipeline.Run(ReportWeek(), source);

  ASSERT_TRUE(result.Succeeded());
  EXPECT_DOUBLE_EQ(result.report().risk.after_hours_percent, 0.0);
  EXPECT_THAT(result.report().risk.risky_commits, ElementsAre("night"));
}

} // namespace
} // namespace pulse
