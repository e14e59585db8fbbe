#include <pulse/report_assembler.h>

#include <cmath>
#include <utility>

namespace pulse {
namespace {

void ExpectEqual(const char *field, double from_authors, double aggregate) {
  if (std::fabs(from_authors - aggregate) <= kReconciliationTolerance) {
    return;
  }
  throw ConsistencyError(std::string("Author statistics do not reconcile for ") +
                         field + ": authors sum to " +
                         std::to_string(from_authors) + ", period reports " +
                         std::to_string(aggregate));
}

} // namespace

void CheckReconciliation(const AuthorStatsMap &author_stats,
                         const PeriodMetrics &period_metrics) {
  double commits = 0.0;
  double additions = 0.0;
  double deletions = 0.0;
  double churn = 0.0;
  for (const auto &[author, stats] : author_stats) {
    if (stats.author != author) {
      throw ConsistencyError("Author statistics keyed as '" + author +
                             "' describe '" + stats.author + "'");
    }
    commits += stats.commit_count;
    additions += static_cast<double>(stats.total_additions);
    deletions += static_cast<double>(stats.total_deletions);
    churn += static_cast<double>(stats.TotalChurn());
  }
  ExpectEqual("commit count", commits, period_metrics.total_commits);
  ExpectEqual("additions", additions,
              static_cast<double>(period_metrics.total_additions));
  ExpectEqual("deletions", deletions,
              static_cast<double>(period_metrics.total_deletions));
  ExpectEqual("churn", churn, static_cast<double>(period_metrics.total_churn));
}

Report AssembleReport(ReportParts parts) {
  CheckReconciliation(parts.author_stats, parts.period_metrics);

  Report report;
  report.period = parts.period;
  report.period_metrics = std::move(parts.period_metrics);
  report.author_stats = std::move(parts.author_stats);
  report.risk = std::move(parts.risk);
  report.forecasts = std::move(parts.forecasts);
  report.deltas = std::move(parts.deltas);
  report.harvest = parts.harvest;
  return report;
}

} // namespace pulse
