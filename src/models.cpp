#include <pulse/models.h>

namespace pulse {

const char *ToString(Granularity granularity) {
  switch (granularity) {
  case Granularity::kDaily:
    return "daily";
  case Granularity::kWeekly:
    return "weekly";
  case Granularity::kMonthly:
    return "monthly";
  }
  return "unknown";
}

const char *ToString(ChangeTag tag) {
  switch (tag) {
  case ChangeTag::kFix:
    return "fix";
  case ChangeTag::kFeat:
    return "feat";
  case ChangeTag::kRefactor:
    return "refactor";
  case ChangeTag::kOther:
    return "other";
  }
  return "unknown";
}

const char *ToString(CiOutcome outcome) {
  switch (outcome) {
  case CiOutcome::kPass:
    return "pass";
  case CiOutcome::kFail:
    return "fail";
  case CiOutcome::kUnknown:
    return "unknown";
  }
  return "unknown";
}

const char *ToString(ForecastMetric metric) {
  switch (metric) {
  case ForecastMetric::kChurn:
    return "churn";
  case ForecastMetric::kLeadTime:
    return "lead_time";
  }
  return "unknown";
}

const char *ToString(ForecastStatus status) {
  switch (status) {
  case ForecastStatus::kFitted:
    return "fitted";
  case ForecastStatus::kNaive:
    return "naive";
  case ForecastStatus::kInsufficientData:
    return "insufficient_data";
  }
  return "unknown";
}

const char *ToString(TrendDirection direction) {
  switch (direction) {
  case TrendDirection::kIncreasing:
    return "increasing";
  case TrendDirection::kDecreasing:
    return "decreasing";
  case TrendDirection::kFlat:
    return "flat";
  }
  return "unknown";
}

const char *ToString(Confidence confidence) {
  switch (confidence) {
  case Confidence::kHigh:
    return "high";
  case Confidence::kMedium:
    return "medium";
  case Confidence::kLow:
    return "low";
  }
  return "unknown";
}

} // namespace pulse
