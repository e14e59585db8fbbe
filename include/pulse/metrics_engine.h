#pragma once

#include <pulse/logging.h>
#include <pulse/models.h>

#include <memory>
#include <optional>

namespace pulse {

struct MetricsConfig {
  int utc_offset_minutes = 0;
};

// Per-author statistics and four-keys indicators for one Period. Never
// throws for empty input: no activity yields zero counts and unset
// optionals.
class MetricsEngine {
public:
  explicit MetricsEngine(MetricsConfig config = {},
                         std::shared_ptr<Logger> logger = nullptr);

  MetricsResult Compute(const EventSet &events, const Period &period,
                        const std::optional<PeriodMetrics> &prior =
                            std::nullopt) const;

private:
  MetricsConfig config_;
  std::shared_ptr<Logger> logger_;
};

AuthorStatsMap BuildAuthorStats(const std::vector<CommitEvent> &commits);

std::optional<double>
LeadTimeHours(const std::vector<PullRequestEvent> &pull_requests);
std::optional<double>
ChangeFailureRate(const std::vector<PullRequestEvent> &pull_requests);
std::optional<double> MeanTimeToRecoveryHours(
    const std::vector<CommitEvent> &commits);
std::optional<double>
ReviewLatencyHours(const std::vector<PullRequestEvent> &pull_requests);

std::vector<MetricDelta> ComputeDeltas(const PeriodMetrics &previous,
                                       const PeriodMetrics &current);

} // namespace pulse
