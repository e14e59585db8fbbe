#include <pulse/risk_detector.h>
#include <pulse/statistics.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace pulse {
namespace {

std::string FormatNumber(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(1) << value;
  return stream.str();
}

} // namespace

RiskDetector::RiskDetector(RiskConfig config, std::shared_ptr<Logger> logger)
    : config_(config), logger_(EnsureLogger(std::move(logger))) {}

double
RiskDetector::ChurnThreshold(const std::vector<CommitEvent> &commits) const {
  double threshold = config_.churn_threshold;
  if (commits.size() < config_.min_commits_for_statistics) {
    return threshold;
  }
  std::vector<double> churn;
  churn.reserve(commits.size());
  for (const auto &commit : commits) {
    churn.push_back(static_cast<double>(commit.Churn()));
  }
  const double statistical =
      Mean(churn) + config_.spike_stddev_multiplier * SampleStdDev(churn);
  return std::min(threshold, statistical);
}

void RiskDetector::DetectChurnSpikes(const std::vector<CommitEvent> &commits,
                                     RiskAssessment &assessment) const {
  const double threshold = ChurnThreshold(commits);
  assessment.applied_churn_threshold = threshold;
  for (const auto &commit : commits) {
    if (static_cast<double>(commit.Churn()) <= threshold) {
      continue;
    }
    assessment.risky_commits.push_back(commit.id);
    ++assessment.risky_commits_by_author[commit.author];
    assessment.flags.push_back(
        RiskFlag{kChurnSpikeCheck, commit.id,
                 "churn " + std::to_string(commit.Churn()) +
                     " exceeds threshold " + FormatNumber(threshold) +
                     " (author " + commit.author + ")"});
  }
  assessment.risky_commit_percent =
      Percent(assessment.risky_commits.size(), commits.size());
}

void RiskDetector::DetectAfterHours(const std::vector<CommitEvent> &commits,
                                    RiskAssessment &assessment) const {
  std::size_t after_hours = 0;
  for (const auto &commit : commits) {
    if (!commit.is_after_hours) {
      continue;
    }
    ++after_hours;
    assessment.flags.push_back(RiskFlag{
        kAfterHoursCheck, commit.id,
        "committed outside working hours by " + commit.author});
  }
  assessment.after_hours_percent = Percent(after_hours, commits.size());
}

void RiskDetector::DetectOutlierAuthors(const AuthorStatsMap &author_stats,
                                        RiskAssessment &assessment) const {
  if (author_stats.size() < 2) {
    return;
  }
  std::vector<double> churn;
  churn.reserve(author_stats.size());
  for (const auto &[author, stats] : author_stats) {
    churn.push_back(static_cast<double>(stats.TotalChurn()));
  }
  const double threshold =
      Mean(churn) + config_.outlier_stddev_multiplier * SampleStdDev(churn);
  for (const auto &[author, stats] : author_stats) {
    if (static_cast<double>(stats.TotalChurn()) <= threshold) {
      continue;
    }
    assessment.flags.push_back(
        RiskFlag{kOutlierAuthorCheck, author,
                 "author churn " + std::to_string(stats.TotalChurn()) +
                     " exceeds " + FormatNumber(threshold)});
  }
}

void RiskDetector::DetectConcentration(const AuthorStatsMap &author_stats,
                                       RiskAssessment &assessment) const {
  if (author_stats.size() < 2) {
    return;
  }
  long long total = 0;
  const AuthorStats *dominant = nullptr;
  for (const auto &[author, stats] : author_stats) {
    total += stats.TotalChurn();
    if (dominant == nullptr || stats.TotalChurn() > dominant->TotalChurn()) {
      dominant = &stats;
    }
  }
  if (total == 0 || dominant == nullptr) {
    return;
  }
  const double share = static_cast<double>(dominant->TotalChurn()) /
                       static_cast<double>(total);
  if (share <= config_.concentration_share) {
    return;
  }
  assessment.flags.push_back(
      RiskFlag{kCodeConcentrationCheck, dominant->author,
               FormatNumber(share * 100.0) + "% of period churn"});
}

RiskAssessment RiskDetector::Detect(const EventSet &events,
                                    const AuthorStatsMap &author_stats) const {
  RiskAssessment assessment;
  DetectChurnSpikes(events.commits, assessment);
  DetectAfterHours(events.commits, assessment);
  DetectOutlierAuthors(author_stats, assessment);
  DetectConcentration(author_stats, assessment);

  logger_->Log(LogLevel::kDebug, "risk.detected",
               {{"flags", std::to_string(assessment.flags.size())},
                {"risky_commits",
                 std::to_string(assessment.risky_commits.size())},
                {"threshold", FormatNumber(assessment.applied_churn_threshold)}});
  return assessment;
}

AuthorStatsMap AttachRiskCounts(const AuthorStatsMap &author_stats,
                                const RiskAssessment &assessment) {
  AuthorStatsMap updated = author_stats;
  for (auto &[author, stats] : updated) {
    const auto found = assessment.risky_commits_by_author.find(author);
    stats.risky_commit_count =
        found == assessment.risky_commits_by_author.end() ? 0 : found->second;
  }
  return updated;
}

} // namespace pulse
