#pragma once

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pulse {

using Timestamp = std::chrono::system_clock::time_point;

enum class Granularity { kDaily, kWeekly, kMonthly };

// Half-open interval [start, end).
struct Period {
  Timestamp start;
  Timestamp end;
  Granularity granularity = Granularity::kWeekly;

  bool Contains(Timestamp timestamp) const {
    return timestamp >= start && timestamp < end;
  }
};

enum class ChangeTag { kFix, kFeat, kRefactor, kOther };

enum class CiOutcome { kPass, kFail, kUnknown };

// Records as supplied by a harvest collaborator. Any field may be missing.
struct RawCommit {
  std::string id;
  std::optional<std::string> author;
  std::optional<Timestamp> timestamp;
  std::optional<int> additions;
  std::optional<int> deletions;
  std::optional<int> files_changed;
  std::string message;
  std::vector<std::string> files;
  // Fields that were present but could not be read.
  std::vector<std::string> unreadable_fields;
};

struct RawPullRequest {
  std::string id;
  std::optional<std::string> author;
  std::optional<Timestamp> created_at;
  std::optional<Timestamp> merged_at;
  std::optional<int> additions;
  std::optional<int> deletions;
  std::optional<int> files_changed;
  CiOutcome ci = CiOutcome::kUnknown;
  std::vector<Timestamp> review_times;
  std::vector<std::string> unreadable_fields;
};

struct RawEventBatch {
  std::vector<RawCommit> commits;
  std::vector<RawPullRequest> pull_requests;
};

struct CommitEvent {
  std::string id;
  std::string author;
  Timestamp timestamp;
  int additions = 0;
  int deletions = 0;
  int files_changed = 0;
  std::string message;
  std::vector<std::string> files;
  ChangeTag tag = ChangeTag::kOther;
  bool is_after_hours = false;

  long long Churn() const {
    return static_cast<long long>(additions) + deletions;
  }
};

struct PullRequestEvent {
  std::string id;
  std::string author;
  Timestamp created_at;
  std::optional<Timestamp> merged_at;
  int additions = 0;
  int deletions = 0;
  int files_changed = 0;
  CiOutcome ci = CiOutcome::kUnknown;
  std::vector<Timestamp> review_times;

  bool IsMerged() const { return merged_at.has_value(); }
};

struct HarvestSummary {
  std::size_t commits_ingested = 0;
  std::size_t pull_requests_ingested = 0;
  std::size_t malformed_commits = 0;
  std::size_t malformed_pull_requests = 0;
  std::size_t out_of_range_commits = 0;
  std::size_t out_of_range_pull_requests = 0;

  std::size_t TotalDropped() const {
    return malformed_commits + malformed_pull_requests +
           out_of_range_commits + out_of_range_pull_requests;
  }
};

struct EventSet {
  std::vector<CommitEvent> commits;
  std::vector<PullRequestEvent> pull_requests;
};

struct AuthorStats {
  std::string author;
  int commit_count = 0;
  long long total_additions = 0;
  long long total_deletions = 0;
  long long files_changed = 0;
  double average_churn = 0.0;
  double files_per_commit = 0.0;
  int risky_commit_count = 0;
  int after_hours_commit_count = 0;

  long long TotalChurn() const { return total_additions + total_deletions; }
};

using AuthorStatsMap = std::map<std::string, AuthorStats>;

struct PeriodMetrics {
  Period period;
  int total_commits = 0;
  long long total_additions = 0;
  long long total_deletions = 0;
  long long total_churn = 0;
  int files_touched = 0;
  int pull_request_count = 0;
  std::optional<double> lead_time_hours;
  int deploy_frequency = 0;
  std::optional<double> change_failure_rate;
  std::optional<double> mttr_hours;
  std::optional<double> review_latency_hours;
  std::array<int, 7> weekday_commits{};
};

struct MetricDelta {
  std::string metric;
  double previous = 0.0;
  double current = 0.0;

  double Change() const { return current - previous; }
};

struct MetricsResult {
  AuthorStatsMap author_stats;
  PeriodMetrics period_metrics;
  std::vector<MetricDelta> deltas;
};

struct RiskFlag {
  std::string check;
  std::string subject;
  std::string detail;
};

struct RiskAssessment {
  std::vector<RiskFlag> flags;
  std::vector<std::string> risky_commits;
  std::map<std::string, int> risky_commits_by_author;
  double risky_commit_percent = 0.0;
  double after_hours_percent = 0.0;
  double applied_churn_threshold = 0.0;
};

enum class ForecastMetric { kChurn, kLeadTime };
enum class ForecastStatus { kFitted, kNaive, kInsufficientData };
enum class TrendDirection { kIncreasing, kDecreasing, kFlat };
enum class Confidence { kHigh, kMedium, kLow };

struct ForecastResult {
  ForecastMetric metric = ForecastMetric::kChurn;
  Period target_period;
  ForecastStatus status = ForecastStatus::kInsufficientData;
  std::optional<double> prediction;
  std::optional<double> last_observed;
  TrendDirection direction = TrendDirection::kFlat;
  Confidence confidence = Confidence::kLow;
  std::size_t history_length = 0;
  double alpha = 0.0;
  double beta = 0.0;
  std::optional<double> rmse;
};

struct Report {
  Period period;
  PeriodMetrics period_metrics;
  AuthorStatsMap author_stats;
  RiskAssessment risk;
  std::vector<ForecastResult> forecasts;
  std::vector<MetricDelta> deltas;
  HarvestSummary harvest;
};

struct HarvestOptions {
  int workday_start_hour = 9;
  int workday_end_hour = 18;
  int utc_offset_minutes = 0;
};

struct RiskConfig {
  double churn_threshold = 100.0;
  double spike_stddev_multiplier = 2.0;
  std::size_t min_commits_for_statistics = 5;
  double outlier_stddev_multiplier = 1.0;
  double concentration_share = 0.6;
};

struct ForecastConfig {
  std::size_t max_history = 12;
  std::size_t min_history = 2;
  double flat_band = 0.05;
};

struct Rendering {
  std::string markdown;
  std::string json;
};

struct RenderOptions {
  std::vector<std::string> formats;
  std::string source_label;
};

const char *ToString(Granularity granularity);
const char *ToString(ChangeTag tag);
const char *ToString(CiOutcome outcome);
const char *ToString(ForecastMetric metric);
const char *ToString(ForecastStatus status);
const char *ToString(TrendDirection direction);
const char *ToString(Confidence confidence);

} // namespace pulse
