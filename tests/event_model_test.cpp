#include <pulse/event_model.h>
#include <pulse/models.h>

#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/event_builders.h"

namespace pulse {
namespace {

using test::At;
using test::MakeRawCommit;
using test::MakeRawPullRequest;
using test::ReportWeek;

TEST(EventModelTest, ParsesDatesAndOffsets) {
  EXPECT_EQ(FormatTimestamp(At("2024-03-04")), "2024-03-04T00:00:00Z");
  EXPECT_EQ(FormatTimestamp(At("2024-03-04T10:15:30Z")),
            "2024-03-04T10:15:30Z");
  EXPECT_EQ(At("2024-03-04T12:15:00+02:00"), At("2024-03-04T10:15:00Z"));
  EXPECT_EQ(At("2024-03-03T23:30:00-01:00"), At("2024-03-04T00:30:00Z"));
  EXPECT_EQ(At("2024-03-04T10:15:00.250Z"), At("2024-03-04T10:15:00Z"));
}

TEST(EventModelTest, RejectsMalformedTimestamps) {
  EXPECT_THROW(ParseTimestamp("yesterday"), std::invalid_argument);
  EXPECT_THROW(ParseTimestamp("2024-02-30"), std::invalid_argument);
  EXPECT_THROW(ParseTimestamp("2024-03-04T25:00:00Z"), std::invalid_argument);
  EXPECT_THROW(ParseTimestamp("2024-03-04T10:00:00Q"), std::invalid_argument);
}

TEST(EventModelTest, DerivesPeriodBoundsFromGranularity) {
  const auto daily = MakePeriod(Granularity::kDaily, At("2024-03-04"));
  EXPECT_EQ(daily.end, At("2024-03-05"));

  const auto weekly = ReportWeek();
  EXPECT_EQ(weekly.end, At("2024-03-11"));
  EXPECT_TRUE(weekly.Contains(At("2024-03-10T23:59:59Z")));
  EXPECT_FALSE(weekly.Contains(At("2024-03-11")));

  const auto monthly = MakePeriod(Granularity::kMonthly, At("2024-01-31"));
  EXPECT_EQ(monthly.end, At("2024-02-29"));
  const auto december = MakePeriod(Granularity::kMonthly, At("2023-12-01"));
  EXPECT_EQ(december.end, At("2024-01-01"));

  const auto next = NextPeriod(weekly);
  EXPECT_EQ(next.start, At("2024-03-11"));
  EXPECT_EQ(next.end, At("2024-03-18"));
}

TEST(EventModelTest, HandlesLeapDaysAndDatesBeforeEpoch) {
  EXPECT_EQ(FormatTimestamp(At("2024-02-29T23:59:59Z")),
            "2024-02-29T23:59:59Z");
  EXPECT_THROW(ParseTimestamp("2023-02-29"), std::invalid_argument);
  EXPECT_EQ(FormatTimestamp(At("1969-12-31T23:00:00Z")),
            "1969-12-31T23:00:00Z");
  EXPECT_EQ(FormatTimestamp(At("2000-01-01T00:30:00+01:00")),
            "1999-12-31T23:30:00Z");

  const auto march =
      MakePeriod(Granularity::kMonthly, At("2023-03-31T06:00:00Z"));
  EXPECT_EQ(march.end, At("2023-04-30T06:00:00Z"));
}

TEST(EventModelTest, ParsesGranularityNames) {
  EXPECT_EQ(ParseGranularity("Weekly"), Granularity::kWeekly);
  EXPECT_EQ(ParseGranularity("month"), Granularity::kMonthly);
  EXPECT_THROW(ParseGranularity("hourly"), std::invalid_argument);
}

TEST(EventModelTest, ComputesLocalHourAndWeekday) {
  const auto timestamp = At("2024-03-04T23:30:00Z");
  EXPECT_EQ(LocalWeekday(timestamp, 0), 0);
  EXPECT_EQ(LocalHour(timestamp, 0), 23);
  EXPECT_EQ(LocalWeekday(timestamp, 60), 1);
  EXPECT_EQ(LocalHour(timestamp, 60), 0);
  EXPECT_EQ(LocalHour(At("2024-03-04T01:00:00Z"), -120), 23);
  EXPECT_EQ(LocalWeekday(At("2024-03-10T12:00:00Z"), 0), 6);
}

TEST(EventModelTest, FlagsCommitsOutsideWorkingHours) {
  const HarvestOptions options;
  EXPECT_TRUE(IsAfterHours(At("2024-03-04T02:00:00Z"), options));
  EXPECT_TRUE(IsAfterHours(At("2024-03-04T18:00:00Z"), options));
  EXPECT_FALSE(IsAfterHours(At("2024-03-04T09:00:00Z"), options));
  EXPECT_FALSE(IsAfterHours(At("2024-03-04T17:59:00Z"), options));

  HarvestOptions shifted;
  shifted.utc_offset_minutes = 9 * 60;
  EXPECT_FALSE(IsAfterHours(At("2024-03-04T02:00:00Z"), shifted));
}

TEST(EventModelTest, ClassifiesCommitMessages) {
  EXPECT_EQ(ClassifyMessage("Fix: crash on start"), ChangeTag::kFix);
  EXPECT_EQ(ClassifyMessage("hotfix for login"), ChangeTag::kFix);
  EXPECT_EQ(ClassifyMessage("Revert \"feat: new cache\""), ChangeTag::kFix);
  EXPECT_EQ(ClassifyMessage("feat(api): add endpoint"), ChangeTag::kFeat);
  EXPECT_EQ(ClassifyMessage("Add retry support"), ChangeTag::kFeat);
  EXPECT_EQ(ClassifyMessage("Refactor parser"), ChangeTag::kRefactor);
  EXPECT_EQ(ClassifyMessage("Clean up logging"), ChangeTag::kRefactor);
  EXPECT_EQ(ClassifyMessage("bump version"), ChangeTag::kOther);
}

TEST(EventModelTest, MatchesWholeWordsOnly) {
  EXPECT_EQ(ClassifyMessage("update test fixture"), ChangeTag::kOther);
  EXPECT_EQ(ClassifyMessage("Add fixture for parser"), ChangeTag::kFeat);
  EXPECT_EQ(ClassifyMessage("address review comments"), ChangeTag::kOther);
  EXPECT_EQ(ClassifyMessage("additional logging"), ChangeTag::kOther);
  EXPECT_EQ(ClassifyMessage("prefixed names"), ChangeTag::kOther);
  EXPECT_EQ(ClassifyMessage("fix(parser)!: crash"), ChangeTag::kFix);
  EXPECT_EQ(ClassifyMessage("feat!: drop v1 api"), ChangeTag::kFeat);
}

TEST(EventModelTest, FixKeywordsTakePrecedence) {
  EXPECT_EQ(ClassifyMessage("Add feature and fix bug"), ChangeTag::kFix);
  EXPECT_EQ(ClassifyMessage("feature: refactor module"), ChangeTag::kFeat);
}

TEST(EventModelTest, IngestionDropsMalformedAndOutOfRangeRecords) {
  RawEventBatch batch;
  batch.commits.push_back(MakeRawCommit(
      "ok", "alice", At("2024-03-05T10:00:00Z"), 10, 2, "fix: typo"));
  auto missing_author =
      MakeRawCommit("no-author", "", At("2024-03-05T10:00:00Z"), 1, 1);
  missing_author.author.reset();
  batch.commits.push_back(missing_author);
  batch.commits.push_back(
      MakeRawCommit("negative", "bob", At("2024-03-05T10:00:00Z"), -1, 1));
  auto missing_time = MakeRawCommit("no-time", "bob", At("2024-03-05"), 1, 1);
  missing_time.timestamp.reset();
  batch.commits.push_back(missing_time);
  batch.commits.push_back(
      MakeRawCommit("late", "bob", At("2024-03-11T00:00:00Z"), 1, 1));

  batch.pull_requests.push_back(MakeRawPullRequest(
      "backwards", "alice", At("2024-03-06"), At("2024-03-05")));
  batch.pull_requests.push_back(MakeRawPullRequest(
      "carried-over", "alice", At("2024-03-01"), At("2024-03-05")));
  batch.pull_requests.push_back(MakeRawPullRequest(
      "merged-later", "alice", At("2024-03-08"), At("2024-03-12")));
  batch.pull_requests.push_back(
      MakeRawPullRequest("open", "bob", At("2024-03-07"), std::nullopt));

  const auto harvested = IngestEvents(ReportWeek(), batch, HarvestOptions{});

  ASSERT_EQ(harvested.events.commits.size(), 1u);
  EXPECT_EQ(harvested.events.commits.front().id, "ok");
  EXPECT_EQ(harvested.events.commits.front().tag, ChangeTag::kFix);
  EXPECT_FALSE(harvested.events.commits.front().is_after_hours);

  std::vector<std::string> pull_request_ids;
  for (const auto &pull_request : harvested.events.pull_requests) {
    pull_request_ids.push_back(pull_request.id);
  }
  EXPECT_THAT(pull_request_ids,
              ::testing::ElementsAre("carried-over", "open"));

  const auto &summary = harvested.summary;
  EXPECT_EQ(summary.commits_ingested, 1u);
  EXPECT_EQ(summary.pull_requests_ingested, 2u);
  EXPECT_EQ(summary.malformed_commits, 3u);
  EXPECT_EQ(summary.out_of_range_commits, 1u);
  EXPECT_EQ(summary.malformed_pull_requests, 1u);
  EXPECT_EQ(summary.out_of_range_pull_requests, 1u);
  EXPECT_EQ(summary.TotalDropped(), 6u);
}

TEST(EventModelTest, IngestionOrdersCommitsAndReviews) {
  RawEventBatch batch;
  batch.commits.push_back(
      MakeRawCommit("second", "alice", At("2024-03-06T10:00:00Z"), 1, 1));
  batch.commits.push_back(
      MakeRawCommit("first", "alice", At("2024-03-05T10:00:00Z"), 1, 1));
  auto pull_request = MakeRawPullRequest("pr", "alice", At("2024-03-05"),
                                         At("2024-03-06"));
  pull_request.review_times = {At("2024-03-05T15:00:00Z"),
                               At("2024-03-05T11:00:00Z")};
  batch.pull_requests.push_back(pull_request);

  const auto harvested = IngestEvents(ReportWeek(), batch, HarvestOptions{});

  ASSERT_EQ(harvested.events.commits.size(), 2u);
  EXPECT_EQ(harvested.events.commits[0].id, "first");
  EXPECT_EQ(harvested.events.commits[1].id, "second");
  ASSERT_EQ(harvested.events.pull_requests.size(), 1u);
  EXPECT_EQ(harvested.events.pull_requests[0].review_times.front(),
            At("2024-03-05T11:00:00Z"));
}

TEST(EventModelTest, FilesChangedFallsBackToListedFiles) {
  RawEventBatch batch;
  auto commit = MakeRawCommit("c", "alice", At("2024-03-05T10:00:00Z"), 1, 1);
  commit.files_changed.reset();
  commit.files = {"a.cpp", "b.cpp"};
  batch.commits.push_back(commit);

  const auto harvested = IngestEvents(ReportWeek(), batch, HarvestOptions{});

  ASSERT_EQ(harvested.events.commits.size(), 1u);
  EXPECT_EQ(harvested.events.commits.front().files_changed, 2);
}

} // namespace
} // namespace pulse
