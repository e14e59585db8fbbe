#include <pulse/event_model.h>
#include <pulse/metrics_engine.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace pulse {
namespace {

int CountFilesTouched(const std::vector<CommitEvent> &commits) {
  std::unordered_set<std::string> distinct_files;
  int unlisted = 0;
  for (const auto &commit : commits) {
    if (commit.files.empty()) {
      unlisted += commit.files_changed;
      continue;
    }
    distinct_files.insert(commit.files.begin(), commit.files.end());
  }
  return static_cast<int>(distinct_files.size()) + unlisted;
}

void AppendDelta(const std::string &metric, const std::optional<double> &previous,
                 const std::optional<double> &current,
                 std::vector<MetricDelta> &deltas) {
  if (!previous || !current) {
    return;
  }
  deltas.push_back(MetricDelta{metric, *previous, *current});
}

} // namespace

MetricsEngine::MetricsEngine(MetricsConfig config,
                             std::shared_ptr<Logger> logger)
    : config_(config), logger_(EnsureLogger(std::move(logger))) {}

AuthorStatsMap BuildAuthorStats(const std::vector<CommitEvent> &commits) {
  AuthorStatsMap stats;
  for (const auto &commit : commits) {
    auto &entry = stats[commit.author];
    entry.author = commit.author;
    ++entry.commit_count;
    entry.total_additions += commit.additions;
    entry.total_deletions += commit.deletions;
    entry.files_changed += commit.files_changed;
    if (commit.is_after_hours) {
      ++entry.after_hours_commit_count;
    }
  }
  for (auto &[author, entry] : stats) {
    entry.average_churn = static_cast<double>(entry.TotalChurn()) /
                          static_cast<double>(entry.commit_count);
    entry.files_per_commit = static_cast<double>(entry.files_changed) /
                             static_cast<double>(entry.commit_count);
  }
  return stats;
}

std::optional<double>
LeadTimeHours(const std::vector<PullRequestEvent> &pull_requests) {
  double total_hours = 0.0;
  std::size_t merged = 0;
  for (const auto &pull_request : pull_requests) {
    if (!pull_request.merged_at) {
      continue;
    }
    total_hours += HoursBetween(pull_request.created_at, *pull_request.merged_at);
    ++merged;
  }
  if (merged == 0) {
    return std::nullopt;
  }
  return total_hours / static_cast<double>(merged);
}

std::optional<double>
ChangeFailureRate(const std::vector<PullRequestEvent> &pull_requests) {
  std::size_t failed = 0;
  std::size_t evaluated = 0;
  for (const auto &pull_request : pull_requests) {
    if (pull_request.ci == CiOutcome::kUnknown) {
      continue;
    }
    ++evaluated;
    if (pull_request.ci == CiOutcome::kFail) {
      ++failed;
    }
  }
  if (evaluated == 0) {
    return std::nullopt;
  }
  return 100.0 * static_cast<double>(failed) / static_cast<double>(evaluated);
}

std::optional<double>
MeanTimeToRecoveryHours(const std::vector<CommitEvent> &commits) {
  std::vector<const CommitEvent *> ordered;
  ordered.reserve(commits.size());
  for (const auto &commit : commits) {
    ordered.push_back(&commit);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const CommitEvent *lhs, const CommitEvent *rhs) {
                     return lhs->timestamp < rhs->timestamp;
                   });

  std::unordered_map<std::string, Timestamp> last_non_fix;
  double total_hours = 0.0;
  std::size_t pairs = 0;
  for (const auto *commit : ordered) {
    if (commit->tag != ChangeTag::kFix) {
      last_non_fix[commit->author] = commit->timestamp;
      continue;
    }
    const auto preceding = last_non_fix.find(commit->author);
    if (preceding == last_non_fix.end()) {
      continue;
    }
    total_hours += HoursBetween(preceding->second, commit->timestamp);
    ++pairs;
  }
  if (pairs == 0) {
    return std::nullopt;
  }
  return total_hours / static_cast<double>(pairs);
}

std::optional<double>
ReviewLatencyHours(const std::vector<PullRequestEvent> &pull_requests) {
  double total_hours = 0.0;
  std::size_t reviewed = 0;
  for (const auto &pull_request : pull_requests) {
    if (pull_request.review_times.empty()) {
      continue;
    }
    total_hours += HoursBetween(pull_request.created_at,
                                pull_request.review_times.front());
    ++reviewed;
  }
  if (reviewed == 0) {
    return std::nullopt;
  }
  return total_hours / static_cast<double>(reviewed);
}

std::vector<MetricDelta> ComputeDeltas(const PeriodMetrics &previous,
                                       const PeriodMetrics &current) {
  std::vector<MetricDelta> deltas;
  AppendDelta("total_commits", static_cast<double>(previous.total_commits),
              static_cast<double>(current.total_commits), deltas);
  AppendDelta("total_churn", static_cast<double>(previous.total_churn),
              static_cast<double>(current.total_churn), deltas);
  AppendDelta("lead_time_hours", previous.lead_time_hours,
              current.lead_time_hours, deltas);
  AppendDelta("deploy_frequency",
              static_cast<double>(previous.deploy_frequency),
              static_cast<double>(current.deploy_frequency), deltas);
  AppendDelta("change_failure_rate", previous.change_failure_rate,
              current.change_failure_rate, deltas);
  return deltas;
}

MetricsResult MetricsEngine::Compute(
    const EventSet &events, const Period &period,
    const std::optional<PeriodMetrics> &prior) const {
  MetricsResult result;
  result.author_stats = BuildAuthorStats(events.commits);

  auto &metrics = result.period_metrics;
  metrics.period = period;
  metrics.total_commits = static_cast<int>(events.commits.size());
  for (const auto &commit : events.commits) {
    metrics.total_additions += commit.additions;
    metrics.total_deletions += commit.deletions;
    const int weekday =
        LocalWeekday(commit.timestamp, config_.utc_offset_minutes);
    ++metrics.weekday_commits[static_cast<std::size_t>(weekday)];
  }
  metrics.total_churn = metrics.total_additions + metrics.total_deletions;
  metrics.files_touched = CountFilesTouched(events.commits);

  metrics.pull_request_count = static_cast<int>(events.pull_requests.size());
  metrics.deploy_frequency = static_cast<int>(std::count_if(
      events.pull_requests.begin(), events.pull_requests.end(),
      [](const PullRequestEvent &pull_request) {
        return pull_request.IsMerged();
      }));
  metrics.lead_time_hours = LeadTimeHours(events.pull_requests);
  metrics.change_failure_rate = ChangeFailureRate(events.pull_requests);
  metrics.mttr_hours = MeanTimeToRecoveryHours(events.commits);
  metrics.review_latency_hours = ReviewLatencyHours(events.pull_requests);

  if (prior) {
    result.deltas = ComputeDeltas(*prior, metrics);
  }

  logger_->Log(LogLevel::kDebug, "metrics.computed",
               {{"authors", std::to_string(result.author_stats.size())},
                {"commits", std::to_string(metrics.total_commits)},
                {"churn", std::to_string(metrics.total_churn)},
                {"deploys", std::to_string(metrics.deploy_frequency)}});
  return result;
}

} // namespace pulse
