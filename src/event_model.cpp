#include <pulse/event_model.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pulse {
namespace {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::sys_days;
using std::chrono::year_month_day;

int ReadNumber(std::string_view text, std::size_t &position,
               std::size_t digits) {
  if (position + digits > text.size()) {
    throw std::invalid_argument("Truncated timestamp: " + std::string(text));
  }
  int value = 0;
  const auto *begin = text.data() + position;
  const auto result = std::from_chars(begin, begin + digits, value);
  if (result.ec != std::errc{} || result.ptr != begin + digits) {
    throw std::invalid_argument("Malformed timestamp: " + std::string(text));
  }
  position += digits;
  return value;
}

void Expect(std::string_view text, std::size_t &position, char expected) {
  if (position >= text.size() || text[position] != expected) {
    throw std::invalid_argument("Malformed timestamp: " + std::string(text));
  }
  ++position;
}

std::string ToLower(std::string_view value) {
  std::string lowered(value);
  std::transform(
      lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::vector<std::string> Tokenize(const std::string &lowered) {
  std::vector<std::string> tokens;
  std::string current;
  for (const auto character : lowered) {
    if (std::isalnum(static_cast<unsigned char>(character)) != 0) {
      current.push_back(character);
    } else if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

bool HasAnyToken(const std::vector<std::string> &tokens,
                 std::initializer_list<std::string_view> keywords) {
  return std::any_of(tokens.begin(), tokens.end(), [&](const auto &token) {
    return std::find(keywords.begin(), keywords.end(), token) !=
           keywords.end();
  });
}

bool HasNegativeCount(const std::optional<int> &additions,
                      const std::optional<int> &deletions,
                      const std::optional<int> &files_changed) {
  return additions.value_or(0) < 0 || deletions.value_or(0) < 0 ||
         files_changed.value_or(0) < 0;
}

bool IsMalformed(const RawCommit &raw) {
  return raw.id.empty() || !raw.author || raw.author->empty() ||
         !raw.timestamp || !raw.unreadable_fields.empty() ||
         HasNegativeCount(raw.additions, raw.deletions, raw.files_changed);
}

bool IsMalformed(const RawPullRequest &raw) {
  if (raw.id.empty() || !raw.author || raw.author->empty() ||
      !raw.created_at || !raw.unreadable_fields.empty()) {
    return true;
  }
  if (raw.merged_at && *raw.merged_at < *raw.created_at) {
    return true;
  }
  return HasNegativeCount(raw.additions, raw.deletions, raw.files_changed);
}

// A pull request belongs to the Period its merge falls in; open pull
// requests belong to the Period they were opened in.
Timestamp AssignmentTime(const RawPullRequest &raw) {
  return raw.merged_at ? *raw.merged_at : *raw.created_at;
}

} // namespace

Timestamp ParseTimestamp(std::string_view text) {
  std::size_t position = 0;
  const int year = ReadNumber(text, position, 4);
  Expect(text, position, '-');
  const int month = ReadNumber(text, position, 2);
  Expect(text, position, '-');
  const int day = ReadNumber(text, position, 2);
  const year_month_day date{std::chrono::year{year},
                            std::chrono::month{static_cast<unsigned>(month)},
                            std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    throw std::invalid_argument("Date out of range: " + std::string(text));
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  long long offset_seconds = 0;
  if (position < text.size()) {
    if (text[position] != 'T' && text[position] != 't' &&
        text[position] != ' ') {
      throw std::invalid_argument("Malformed timestamp: " + std::string(text));
    }
    ++position;
    hour = ReadNumber(text, position, 2);
    Expect(text, position, ':');
    minute = ReadNumber(text, position, 2);
    if (position < text.size() && text[position] == ':') {
      ++position;
      second = ReadNumber(text, position, 2);
    }
    if (position < text.size() && text[position] == '.') {
      ++position;
      while (position < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
        ++position;
      }
    }
    if (position < text.size()) {
      const char designator = text[position];
      if (designator == 'Z' || designator == 'z') {
        ++position;
      } else if (designator == '+' || designator == '-') {
        ++position;
        const int offset_hours = ReadNumber(text, position, 2);
        if (position < text.size() && text[position] == ':') {
          ++position;
        }
        const int offset_minutes = ReadNumber(text, position, 2);
        offset_seconds = (offset_hours * 3600LL + offset_minutes * 60LL) *
                         (designator == '+' ? 1 : -1);
      }
    }
    if (position != text.size() || hour > 23 || minute > 59 || second > 60) {
      throw std::invalid_argument("Malformed timestamp: " + std::string(text));
    }
  }

  const auto instant = sys_days{date} + std::chrono::hours{hour} +
                       std::chrono::minutes{minute} +
                       std::chrono::seconds(second - offset_seconds);
  return std::chrono::time_point_cast<Timestamp::duration>(instant);
}

std::string FormatTimestamp(Timestamp timestamp) {
  const auto seconds = floor<std::chrono::seconds>(timestamp);
  const auto day = floor<days>(seconds);
  const year_month_day date{day};
  const std::chrono::hh_mm_ss time{seconds - day};
  std::ostringstream stream;
  stream << std::setfill('0') << std::setw(4) << static_cast<int>(date.year())
         << '-' << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
         << std::setw(2) << static_cast<unsigned>(date.day()) << 'T'
         << std::setw(2) << time.hours().count() << ':' << std::setw(2)
         << time.minutes().count() << ':' << std::setw(2)
         << time.seconds().count() << 'Z';
  return stream.str();
}

std::string FormatDate(Timestamp timestamp) {
  return FormatTimestamp(timestamp).substr(0, 10);
}

Granularity ParseGranularity(std::string_view text) {
  const auto normalized = ToLower(text);
  if (normalized == "daily" || normalized == "day") {
    return Granularity::kDaily;
  }
  if (normalized == "weekly" || normalized == "week") {
    return Granularity::kWeekly;
  }
  if (normalized == "monthly" || normalized == "month") {
    return Granularity::kMonthly;
  }
  throw std::invalid_argument("Unknown granularity: " + std::string(text));
}

Period MakePeriod(Granularity granularity, Timestamp start) {
  Period period;
  period.start = start;
  period.granularity = granularity;
  switch (granularity) {
  case Granularity::kDaily:
    period.end = start + days{1};
    return period;
  case Granularity::kWeekly:
    period.end = start + days{7};
    return period;
  case Granularity::kMonthly:
    break;
  }

  // Day-of-month is clamped when the next month is shorter.
  const auto day_start = floor<days>(start);
  auto next = year_month_day{day_start} + std::chrono::months{1};
  if (!next.ok()) {
    next = year_month_day{next.year() / next.month() / std::chrono::last};
  }
  period.end = sys_days{next} + (start - day_start);
  return period;
}

Period NextPeriod(const Period &period) {
  return MakePeriod(period.granularity, period.end);
}

double HoursBetween(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

int LocalHour(Timestamp timestamp, int utc_offset_minutes) {
  const auto local = timestamp + std::chrono::minutes{utc_offset_minutes};
  return static_cast<int>(
      floor<std::chrono::hours>(local - floor<days>(local)).count());
}

int LocalWeekday(Timestamp timestamp, int utc_offset_minutes) {
  const auto local = timestamp + std::chrono::minutes{utc_offset_minutes};
  const std::chrono::weekday weekday{floor<days>(local)};
  return static_cast<int>((weekday.c_encoding() + 6) % 7);
}

bool IsAfterHours(Timestamp timestamp, const HarvestOptions &options) {
  const int hour = LocalHour(timestamp, options.utc_offset_minutes);
  return hour < options.workday_start_hour || hour >= options.workday_end_hour;
}

ChangeTag ClassifyMessage(std::string_view message) {
  const auto lowered = ToLower(message);
  const auto tokens = Tokenize(lowered);
  if (HasAnyToken(tokens, {"fix", "fixes", "fixed", "fixing", "bug", "bugs",
                           "bugfix", "hotfix", "revert", "reverts",
                           "reverted", "patch", "patches", "patched"})) {
    return ChangeTag::kFix;
  }
  if (HasAnyToken(tokens, {"feat", "feature", "features", "add", "adds",
                           "added", "adding"})) {
    return ChangeTag::kFeat;
  }
  if (HasAnyToken(tokens, {"refactor", "refactors", "refactored",
                           "refactoring", "cleanup", "restructure",
                           "restructured", "restructuring"}) ||
      lowered.find("clean up") != std::string::npos) {
    return ChangeTag::kRefactor;
  }
  return ChangeTag::kOther;
}

HarvestResult IngestEvents(const Period &period, const RawEventBatch &batch,
                           const HarvestOptions &options) {
  HarvestResult result;
  auto &summary = result.summary;

  for (const auto &raw : batch.commits) {
    if (IsMalformed(raw)) {
      ++summary.malformed_commits;
      continue;
    }
    if (!period.Contains(*raw.timestamp)) {
      ++summary.out_of_range_commits;
      continue;
    }
    CommitEvent commit;
    commit.id = raw.id;
    commit.author = *raw.author;
    commit.timestamp = *raw.timestamp;
    commit.additions = raw.additions.value_or(0);
    commit.deletions = raw.deletions.value_or(0);
    commit.files = raw.files;
    commit.files_changed = raw.files_changed.value_or(
        static_cast<int>(raw.files.size()));
    commit.message = raw.message;
    commit.tag = ClassifyMessage(raw.message);
    commit.is_after_hours = IsAfterHours(commit.timestamp, options);
    result.events.commits.push_back(std::move(commit));
  }

  for (const auto &raw : batch.pull_requests) {
    if (IsMalformed(raw)) {
      ++summary.malformed_pull_requests;
      continue;
    }
    if (!period.Contains(AssignmentTime(raw))) {
      ++summary.out_of_range_pull_requests;
      continue;
    }
    PullRequestEvent pull_request;
    pull_request.id = raw.id;
    pull_request.author = *raw.author;
    pull_request.created_at = *raw.created_at;
    pull_request.merged_at = raw.merged_at;
    pull_request.additions = raw.additions.value_or(0);
    pull_request.deletions = raw.deletions.value_or(0);
    pull_request.files_changed = raw.files_changed.value_or(0);
    pull_request.ci = raw.ci;
    pull_request.review_times = raw.review_times;
    std::sort(pull_request.review_times.begin(),
              pull_request.review_times.end());
    result.events.pull_requests.push_back(std::move(pull_request));
  }

  std::stable_sort(result.events.commits.begin(), result.events.commits.end(),
                   [](const CommitEvent &lhs, const CommitEvent &rhs) {
                     return lhs.timestamp < rhs.timestamp;
                   });

  summary.commits_ingested = result.events.commits.size();
  summary.pull_requests_ingested = result.events.pull_requests.size();
  return result;
}

} // namespace pulse
