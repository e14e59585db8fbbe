#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace pulse {
namespace {

using ::testing::HasSubstr;

constexpr const char *kEvents = R"(commits:
  - id: c1
    author: alice
    timestamp: 2024-03-04T10:00:00Z
    additions: 400
    deletions: 50
    files_changed: 3
    message: "feat: add exporter"
  - id: c2
    author: bob
    timestamp: 2024-03-05T22:30:00Z
    additions: 10
    deletions: 2
    files_changed: 1
    message: "fix: exporter crash"
  - id: c3
    author: carol
    timestamp: 2024-03-06T11:00:00Z
    additions: 1
    files_changed: 1
  - id: late
    author: carol
    timestamp: 2024-03-12T11:00:00Z
    additions: 1
    deletions: 1
    files_changed: 1
pull_requests:
  - id: pr1
    author: alice
    created_at: 2024-03-04T09:00:00Z
    merged_at: 2024-03-05T09:00:00Z
    ci: pass
  - id: pr2
    author: bob
    created_at: 2024-03-05T20:00:00Z
    merged_at: 2024-03-06T08:00:00Z
    ci: fail
)";

constexpr const char *kHistory = R"(periods:
  - start: 2024-02-19
    total_commits: 2
    total_churn: 300
    lead_time_hours: 20
  - start: 2024-02-26
    total_commits: 4
    total_churn: 380
    lead_time_hours: 16
  - start: 2024-03-11
    total_commits: 99
    total_churn: 9999
)";

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::string ExecutableUnderTest() { return PULSE_REPORT_BINARY; }

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string Quiet(const std::string &command) {
  return command + " > /dev/null 2>&1";
}

TEST(CliIntegrationTest, GeneratesReportsForSampleEvents) {
  test::TemporaryDirectory directory;
  const auto events = directory.AddFile("events.yaml", kEvents);
  const auto history = directory.AddFile("history.yaml", kHistory);
  const auto output_directory = directory.root() / "artifacts";

  const std::string command =
      ExecutableUnderTest() + " report --events " + events.string() +
      " --history " + history.string() +
      " --period-start 2024-03-04 --format markdown,json --out " +
      output_directory.string();

  ASSERT_EQ(ExitCode(Quiet(command)), 0);

  const auto markdown_report = output_directory / "pulse_report.md";
  const auto json_report = output_directory / "pulse_report.json";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  ASSERT_TRUE(std::filesystem::exists(json_report));

  const auto markdown = LoadFile(markdown_report);
  EXPECT_THAT(markdown, HasSubstr("# Repository Pulse Report"));
  EXPECT_THAT(markdown, HasSubstr("| Commits | 3 |"));
  EXPECT_THAT(markdown, HasSubstr("| Change Failure Rate (%) | 50.0 |"));
  EXPECT_THAT(markdown, HasSubstr("| total_commits | 4.0 | 3.0 | -1.0 |"));
  EXPECT_THAT(markdown, HasSubstr("- Out-of-period commits dropped: 1"));

  const auto json = LoadFile(json_report);
  EXPECT_THAT(json, HasSubstr("\"total_commits\": 3"));
  EXPECT_THAT(json, HasSubstr("\"out_of_range_commits\": 1"));
  EXPECT_THAT(json, HasSubstr("\"risky_commits\": [\"c1\"]"));
}

TEST(CliIntegrationTest, ReadsSettingsFromConfigFile) {
  test::TemporaryDirectory directory;
  directory.AddFile("data/events.yaml", kEvents);
  const auto config = directory.AddFile("pulse.yaml", R"(events: data/events.yaml
period_start: 2024-03-04
formats: json
out: reports
)");

  ASSERT_EQ(ExitCode(Quiet(ExecutableUnderTest() + " --config " +
                           config.string())),
            0);

  EXPECT_TRUE(std::filesystem::exists(directory.root() / "reports" /
                                      "pulse_report.json"));
  EXPECT_FALSE(std::filesystem::exists(directory.root() / "reports" /
                                       "pulse_report.md"));
}

TEST(CliIntegrationTest, MissingRequiredArgumentIsUsageError) {
  test::TemporaryDirectory directory;

  EXPECT_EQ(ExitCode(Quiet(ExecutableUnderTest() +
                           " report --period-start 2024-03-04 --out " +
                           directory.root().string())),
            1);
  EXPECT_EQ(ExitCode(Quiet(ExecutableUnderTest() + " report --bogus")), 1);
  EXPECT_EQ(ExitCode(Quiet(ExecutableUnderTest() + " summarize")), 1);
}

TEST(CliIntegrationTest, UnreadableEventsFailThePipeline) {
  test::TemporaryDirectory directory;
  const auto events = directory.AddFile("events.yaml", "- not a mapping\n");
  const auto output_directory = directory.root() / "artifacts";

  const std::string command =
      ExecutableUnderTest() + " report --events " + events.string() +
      " --period-start 2024-03-04 --out " + output_directory.string();

  EXPECT_EQ(ExitCode(Quiet(command)), 2);
  EXPECT_FALSE(std::filesystem::exists(output_directory / "pulse_report.md"));
}

TEST(CliIntegrationTest, HelpExitsSuccessfully) {
  EXPECT_EQ(ExitCode(Quiet(ExecutableUnderTest() + " --help")), 0);
  EXPECT_EQ(ExitCode(Quiet(ExecutableUnderTest() + " report --help")), 0);
}

} // namespace
} // namespace pulse
