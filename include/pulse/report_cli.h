#pragma once

#include <pulse/logging.h>
#include <pulse/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pulse {

struct ReportOptions {
  std::optional<std::filesystem::path> events;
  std::optional<std::filesystem::path> history;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::optional<Granularity> granularity;
  std::optional<std::string> period_start;
  std::optional<LogLevel> log_level;
  std::optional<std::string> reporter;
  std::optional<std::string> source;
  std::optional<int> workday_start_hour;
  std::optional<int> workday_end_hour;
  std::optional<int> utc_offset_minutes;
  std::optional<double> churn_threshold;
  std::optional<double> concentration_share;
  std::optional<std::size_t> max_history;
  std::optional<std::size_t> min_history;
  bool show_help = false;
};

ReportOptions ParseReportArguments(const std::vector<std::string> &arguments);
ReportOptions ParseConfigFile(const std::filesystem::path &path);
ReportOptions MergeOptions(const ReportOptions &config_options,
                           const ReportOptions &cli_options);
// Loads --config when given, merges with CLI taking precedence and
// validates the result. Throws std::invalid_argument on bad input.
ReportOptions ResolveReportOptions(const ReportOptions &cli_options);

HarvestOptions BuildHarvestOptions(const ReportOptions &options);
RiskConfig BuildRiskConfig(const ReportOptions &options);
ForecastConfig BuildForecastConfig(const ReportOptions &options);
Period ResolvePeriod(const ReportOptions &options);

int RunReport(const std::vector<std::string> &arguments);

} // namespace pulse
