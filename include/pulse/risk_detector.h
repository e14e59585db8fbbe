#pragma once

#include <pulse/logging.h>
#include <pulse/models.h>

#include <memory>

namespace pulse {

inline constexpr char kChurnSpikeCheck[] = "churn_spike";
inline constexpr char kAfterHoursCheck[] = "after_hours";
inline constexpr char kOutlierAuthorCheck[] = "outlier_author";
inline constexpr char kCodeConcentrationCheck[] = "code_concentration";

class RiskDetector {
public:
  explicit RiskDetector(RiskConfig config = {},
                        std::shared_ptr<Logger> logger = nullptr);

  RiskAssessment Detect(const EventSet &events,
                        const AuthorStatsMap &author_stats) const;

  // Lowest churn that is still considered safe for the given commits.
  double ChurnThreshold(const std::vector<CommitEvent> &commits) const;

private:
  void DetectChurnSpikes(const std::vector<CommitEvent> &commits,
                         RiskAssessment &assessment) const;
  void DetectAfterHours(const std::vector<CommitEvent> &commits,
                        RiskAssessment &assessment) const;
  void DetectOutlierAuthors(const AuthorStatsMap &author_stats,
                            RiskAssessment &assessment) const;
  void DetectConcentration(const AuthorStatsMap &author_stats,
                           RiskAssessment &assessment) const;

  RiskConfig config_;
  std::shared_ptr<Logger> logger_;
};

// Returns a fresh map carrying the risky-commit counts of the assessment.
AuthorStatsMap AttachRiskCounts(const AuthorStatsMap &author_stats,
                                const RiskAssessment &assessment);

} // namespace pulse
