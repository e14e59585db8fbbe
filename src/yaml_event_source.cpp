#include <pulse/yaml_event_source.h>

#include <pulse/event_model.h>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

template <typename T>
std::optional<T> OptionalScalar(const YAML::Node &node, const char *key) {
  const auto child = node[key];
  if (!child || !child.IsScalar()) {
    return std::nullopt;
  }
  T value{};
  if (!YAML::convert<T>::decode(child, value)) {
    return std::nullopt;
  }
  return value;
}

std::string StringOr(const YAML::Node &node, const char *key,
                     std::string fallback = {}) {
  return OptionalScalar<std::string>(node, key).value_or(std::move(fallback));
}

// Absent or null fields come back unset. Fields that are present but do not
// convert also come back unset and are recorded in `unreadable`.
template <typename T>
std::optional<T> ReadField(const YAML::Node &node, const char *key,
                           std::vector<std::string> &unreadable) {
  const auto child = node[key];
  if (!child || child.IsNull()) {
    return std::nullopt;
  }
  T value{};
  if (!child.IsScalar() || !YAML::convert<T>::decode(child, value)) {
    unreadable.emplace_back(key);
    return std::nullopt;
  }
  return value;
}

std::optional<pulse::Timestamp> ParseTimestampOrNull(const std::string &text) {
  try {
    return pulse::ParseTimestamp(text);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  }
}

std::optional<pulse::Timestamp>
ReadTimestamp(const YAML::Node &node, const char *key,
              std::vector<std::string> &unreadable) {
  const auto text = ReadField<std::string>(node, key, unreadable);
  if (!text) {
    return std::nullopt;
  }
  auto timestamp = ParseTimestampOrNull(*text);
  if (!timestamp) {
    unreadable.emplace_back(key);
  }
  return timestamp;
}

pulse::CiOutcome ParseCiOutcome(const std::string &text) {
  if (text == "pass" || text == "passed" || text == "success") {
    return pulse::CiOutcome::kPass;
  }
  if (text == "fail" || text == "failed" || text == "failure") {
    return pulse::CiOutcome::kFail;
  }
  return pulse::CiOutcome::kUnknown;
}

void RequireSequence(const YAML::Node &node, const char *key) {
  if (node && !node.IsSequence() && !node.IsNull()) {
    throw std::invalid_argument(std::string("Event key '") + key +
                                "' must be a list");
  }
}

pulse::RawCommit ToRawCommit(const YAML::Node &node) {
  pulse::RawCommit commit;
  auto &unreadable = commit.unreadable_fields;
  commit.id = StringOr(node, "id");
  commit.author = ReadField<std::string>(node, "author", unreadable);
  commit.timestamp = ReadTimestamp(node, "timestamp", unreadable);
  commit.additions = ReadField<int>(node, "additions", unreadable);
  commit.deletions = ReadField<int>(node, "deletions", unreadable);
  commit.files_changed = ReadField<int>(node, "files_changed", unreadable);
  commit.message = StringOr(node, "message");
  if (const auto files = node["files"]; files && files.IsSequence()) {
    for (const auto &file : files) {
      if (file.IsScalar()) {
        commit.files.push_back(file.as<std::string>());
      }
    }
  }
  return commit;
}

pulse::RawPullRequest ToRawPullRequest(const YAML::Node &node) {
  pulse::RawPullRequest pull_request;
  auto &unreadable = pull_request.unreadable_fields;
  pull_request.id = StringOr(node, "id");
  pull_request.author = ReadField<std::string>(node, "author", unreadable);
  pull_request.created_at = ReadTimestamp(node, "created_at", unreadable);
  pull_request.merged_at = ReadTimestamp(node, "merged_at", unreadable);
  pull_request.additions = ReadField<int>(node, "additions", unreadable);
  pull_request.deletions = ReadField<int>(node, "deletions", unreadable);
  pull_request.files_changed =
      ReadField<int>(node, "files_changed", unreadable);
  pull_request.ci = ParseCiOutcome(StringOr(node, "ci", "unknown"));
  if (const auto reviews = node["review_times"]; reviews && !reviews.IsNull()) {
    if (!reviews.IsSequence()) {
      unreadable.emplace_back("review_times");
      return pull_request;
    }
    for (const auto &review : reviews) {
      const auto timestamp = review.IsScalar()
                                 ? ParseTimestampOrNull(review.Scalar())
                                 : std::nullopt;
      if (!timestamp) {
        unreadable.emplace_back("review_times");
        break;
      }
      pull_request.review_times.push_back(*timestamp);
    }
  }
  return pull_request;
}

pulse::RawEventBatch ToEventBatch(const YAML::Node &root) {
  pulse::RawEventBatch batch;
  if (root.IsNull()) {
    return batch;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Event file must contain a mapping at the root");
  }

  const auto commits = root["commits"];
  RequireSequence(commits, "commits");
  if (commits && commits.IsSequence()) {
    for (const auto &entry : commits) {
      batch.commits.push_back(ToRawCommit(entry));
    }
  }

  const auto pull_requests = root["pull_requests"];
  RequireSequence(pull_requests, "pull_requests");
  if (pull_requests && pull_requests.IsSequence()) {
    for (const auto &entry : pull_requests) {
      batch.pull_requests.push_back(ToRawPullRequest(entry));
    }
  }
  return batch;
}

template <typename T>
void ReadInto(const YAML::Node &node, const char *key, T &target) {
  if (const auto value = OptionalScalar<T>(node, key)) {
    target = *value;
  }
}

void ReadOptional(const YAML::Node &node, const char *key,
                  std::optional<double> &target) {
  target = OptionalScalar<double>(node, key);
}

pulse::PeriodMetrics ToPeriodMetrics(const YAML::Node &node,
                                     pulse::Granularity granularity) {
  const auto start = OptionalScalar<std::string>(node, "start");
  if (!start) {
    throw std::invalid_argument("History entry is missing 'start'");
  }

  pulse::PeriodMetrics metrics;
  metrics.period = pulse::MakePeriod(granularity, pulse::ParseTimestamp(*start));
  ReadInto(node, "total_commits", metrics.total_commits);
  ReadInto(node, "total_additions", metrics.total_additions);
  ReadInto(node, "total_deletions", metrics.total_deletions);
  metrics.total_churn = metrics.total_additions + metrics.total_deletions;
  ReadInto(node, "total_churn", metrics.total_churn);
  ReadInto(node, "files_touched", metrics.files_touched);
  ReadInto(node, "pull_request_count", metrics.pull_request_count);
  ReadInto(node, "deploy_frequency", metrics.deploy_frequency);
  ReadOptional(node, "lead_time_hours", metrics.lead_time_hours);
  ReadOptional(node, "change_failure_rate", metrics.change_failure_rate);
  ReadOptional(node, "mttr_hours", metrics.mttr_hours);
  ReadOptional(node, "review_latency_hours", metrics.review_latency_hours);
  return metrics;
}

std::vector<pulse::PeriodMetrics> ToHistory(const YAML::Node &root,
                                            pulse::Granularity granularity) {
  std::vector<pulse::PeriodMetrics> history;
  if (root.IsNull()) {
    return history;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "History file must contain a mapping at the root");
  }
  const auto periods = root["periods"];
  RequireSequence(periods, "periods");
  if (periods && periods.IsSequence()) {
    for (const auto &entry : periods) {
      history.push_back(ToPeriodMetrics(entry, granularity));
    }
  }
  std::stable_sort(history.begin(), history.end(),
                   [](const pulse::PeriodMetrics &lhs,
                      const pulse::PeriodMetrics &rhs) {
                     return lhs.period.start < rhs.period.start;
                   });
  return history;
}

void RequireFile(const std::filesystem::path &path, const char *kind) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error(std::string(kind) +
                             " file not found: " + path.string());
  }
}

} // namespace

namespace pulse {

YamlEventSource::YamlEventSource(std::filesystem::path path)
    : path_(std::move(path)) {}

RawEventBatch YamlEventSource::Fetch(const Period &) {
  return LoadEventBatch(path_);
}

RawEventBatch ParseEventBatch(const std::string &yaml_text) {
  return ToEventBatch(YAML::Load(yaml_text));
}

RawEventBatch LoadEventBatch(const std::filesystem::path &path) {
  RequireFile(path, "Event");
  return ToEventBatch(YAML::LoadFile(path.string()));
}

std::vector<PeriodMetrics> ParseMetricsHistory(const std::string &yaml_text,
                                               Granularity granularity) {
  return ToHistory(YAML::Load(yaml_text), granularity);
}

std::vector<PeriodMetrics>
LoadMetricsHistory(const std::filesystem::path &path, Granularity granularity) {
  RequireFile(path, "History");
  return ToHistory(YAML::LoadFile(path.string()), granularity);
}

} // namespace pulse
