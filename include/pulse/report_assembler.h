#pragma once

#include <pulse/models.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace pulse {

// Raised when per-author statistics diverge from the Period aggregate. This
// indicates a bug in the metrics computation, never bad input.
class ConsistencyError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

inline constexpr double kReconciliationTolerance = 1e-6;

// Throws ConsistencyError when the author statistics do not sum to the
// Period aggregate.
void CheckReconciliation(const AuthorStatsMap &author_stats,
                         const PeriodMetrics &period_metrics);

struct ReportParts {
  Period period;
  AuthorStatsMap author_stats;
  PeriodMetrics period_metrics;
  RiskAssessment risk;
  std::vector<ForecastResult> forecasts;
  std::vector<MetricDelta> deltas;
  HarvestSummary harvest;
};

Report AssembleReport(ReportParts parts);

} // namespace pulse
