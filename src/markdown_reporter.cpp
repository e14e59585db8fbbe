#include <pulse/markdown_reporter.h>

#include <pulse/event_model.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace pulse {
namespace {

constexpr std::array<const char *, 7> kWeekdayNames{
    "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(character);
      escaped.append(code.str());
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Quoted(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string JsonNumber(const std::optional<double> &value) {
  return value ? FormatOneDecimal(*value) : "null";
}

// Pipes would break the table layout.
std::string EscapeCell(std::string value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.push_back(' ');
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string GeneratedOn() {
  return FormatTimestamp(std::chrono::system_clock::now());
}

std::string ForecastMetricLabel(ForecastMetric metric) {
  return metric == ForecastMetric::kChurn ? "Churn (lines)"
                                          : "Lead Time (hours)";
}

std::string BuildHeaderMarkdown(const Report &report,
                                const RenderOptions &options,
                                const std::string &timestamp) {
  std::ostringstream section;
  section << "## Report Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Period | " << FormatDate(report.period.start) << " to "
          << FormatDate(report.period.end) << " |\n";
  section << "| Granularity | " << ToString(report.period.granularity)
          << " |\n";
  section << "| Generated On | " << timestamp << " |\n";
  std::string source = "None";
  if (!options.source_label.empty()) {
    source = EscapeCell(options.source_label);
  }
  section << "| Source | " << source << " |\n\n";
  return section.str();
}

std::string BuildMetricsMarkdown(const PeriodMetrics &metrics) {
  std::ostringstream section;
  section << "## Delivery Metrics\n\n";
  section << "| Metric | Value |\n";
  section << "| --- | --- |\n";
  section << "| Commits | " << metrics.total_commits << " |\n";
  section << "| Additions | " << metrics.total_additions << " |\n";
  section << "| Deletions | " << metrics.total_deletions << " |\n";
  section << "| Churn | " << metrics.total_churn << " |\n";
  section << "| Files Touched | " << metrics.files_touched << " |\n";
  section << "| Pull Requests | " << metrics.pull_request_count << " |\n";
  section << "| Lead Time (hours) | "
          << FormatOptional(metrics.lead_time_hours) << " |\n";
  section << "| Deploy Frequency | " << metrics.deploy_frequency << " |\n";
  section << "| Change Failure Rate (%) | "
          << FormatOptional(metrics.change_failure_rate) << " |\n";
  section << "| MTTR (hours) | " << FormatOptional(metrics.mttr_hours)
          << " |\n";
  section << "| Review Latency (hours) | "
          << FormatOptional(metrics.review_latency_hours) << " |\n\n";
  return section.str();
}

std::string BuildDeltasMarkdown(const std::vector<MetricDelta> &deltas) {
  std::ostringstream section;
  section << "## Change Since Previous Period\n\n";
  if (deltas.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  section << "| Metric | Previous | Current | Change |\n";
  section << "| --- | --- | --- | --- |\n";
  for (const auto &delta : deltas) {
    const auto change = delta.Change();
    section << "| " << delta.metric << " | "
            << FormatOneDecimal(delta.previous) << " | "
            << FormatOneDecimal(delta.current) << " | "
            << (change > 0 ? "+" : "") << FormatOneDecimal(change) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildAuthorsMarkdown(const AuthorStatsMap &author_stats) {
  std::ostringstream section;
  section << "## Contributors\n\n";
  section << "| Author | Commits | Additions | Deletions | Avg Churn | "
             "Files/Commit | Risky | After Hours |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  if (author_stats.empty()) {
    section << "| None | - | - | - | - | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &[author, stats] : author_stats) {
    section << "| " << EscapeCell(author) << " | " << stats.commit_count
            << " | " << stats.total_additions << " | "
            << stats.total_deletions << " | "
            << FormatOneDecimal(stats.average_churn) << " | "
            << FormatOneDecimal(stats.files_per_commit) << " | "
            << stats.risky_commit_count << " | "
            << stats.after_hours_commit_count << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildRiskMarkdown(const RiskAssessment &risk) {
  std::ostringstream section;
  section << "## Risk\n\n";
  section << "- Risky commits: " << FormatOneDecimal(risk.risky_commit_percent)
          << "%\n";
  section << "- After-hours commits: "
          << FormatOneDecimal(risk.after_hours_percent) << "%\n";
  section << "- Churn threshold applied: "
          << FormatOneDecimal(risk.applied_churn_threshold) << "\n\n";
  section << "| Check | Subject | Detail |\n";
  section << "| --- | --- | --- |\n";
  if (risk.flags.empty()) {
    section << "| None | - | - |\n\n";
    return section.str();
  }
  for (const auto &flag : risk.flags) {
    section << "| " << flag.check << " | " << EscapeCell(flag.subject)
            << " | " << EscapeCell(flag.detail) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildForecastsMarkdown(const std::vector<ForecastResult> &forecasts) {
  std::ostringstream section;
  section << "## Forecast\n\n";
  section << "| Metric | Target Period | Status | Prediction | Last Observed | "
             "Direction | Confidence | History |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  if (forecasts.empty()) {
    section << "| None | - | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &forecast : forecasts) {
    section << "| " << ForecastMetricLabel(forecast.metric) << " | "
            << FormatDate(forecast.target_period.start) << " | "
            << ToString(forecast.status) << " | "
            << FormatOptional(forecast.prediction) << " | "
            << FormatOptional(forecast.last_observed) << " | "
            << ToString(forecast.direction) << " | "
            << ToString(forecast.confidence) << " | "
            << forecast.history_length << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildWeekdayMarkdown(const PeriodMetrics &metrics) {
  std::ostringstream section;
  section << "## Commits by Weekday\n\n";
  section << "|";
  for (const auto *name : kWeekdayNames) {
    section << " " << name << " |";
  }
  section << "\n|";
  for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
    section << " --- |";
  }
  section << "\n|";
  for (const auto count : metrics.weekday_commits) {
    section << " " << count << " |";
  }
  section << "\n\n";
  return section.str();
}

std::string BuildHarvestMarkdown(const HarvestSummary &harvest) {
  std::ostringstream section;
  section << "## Harvest Notes\n\n";
  section << "- Commits ingested: " << harvest.commits_ingested << "\n";
  section << "- Pull requests ingested: " << harvest.pull_requests_ingested
          << "\n";
  if (harvest.TotalDropped() == 0) {
    section << "- Dropped records: None\n";
    return section.str();
  }
  section << "- Malformed commits dropped: " << harvest.malformed_commits
          << "\n";
  section << "- Malformed pull requests dropped: "
          << harvest.malformed_pull_requests << "\n";
  section << "- Out-of-period commits dropped: "
          << harvest.out_of_range_commits << "\n";
  section << "- Out-of-period pull requests dropped: "
          << harvest.out_of_range_pull_requests << "\n";
  return section.str();
}

std::string BuildHeaderJson(const Report &report, const RenderOptions &options,
                            const std::string &timestamp) {
  std::ostringstream json;
  json << "\"report_header\": {";
  json << "\"period_start\": " << Quoted(FormatTimestamp(report.period.start))
       << ",";
  json << "\"period_end\": " << Quoted(FormatTimestamp(report.period.end))
       << ",";
  json << "\"granularity\": " << Quoted(ToString(report.period.granularity))
       << ",";
  json << "\"generated_on\": " << Quoted(timestamp) << ",";
  json << "\"source\": " << Quoted(options.source_label) << "}";
  return json.str();
}

std::string BuildMetricsJson(const PeriodMetrics &metrics) {
  std::ostringstream json;
  json << "\"period_metrics\": {";
  json << "\"total_commits\": " << metrics.total_commits << ",";
  json << "\"total_additions\": " << metrics.total_additions << ",";
  json << "\"total_deletions\": " << metrics.total_deletions << ",";
  json << "\"total_churn\": " << metrics.total_churn << ",";
  json << "\"files_touched\": " << metrics.files_touched << ",";
  json << "\"pull_request_count\": " << metrics.pull_request_count << ",";
  json << "\"lead_time_hours\": " << JsonNumber(metrics.lead_time_hours)
       << ",";
  json << "\"deploy_frequency\": " << metrics.deploy_frequency << ",";
  json << "\"change_failure_rate\": "
       << JsonNumber(metrics.change_failure_rate) << ",";
  json << "\"mttr_hours\": " << JsonNumber(metrics.mttr_hours) << ",";
  json << "\"review_latency_hours\": "
       << JsonNumber(metrics.review_latency_hours) << ",";
  json << "\"weekday_commits\": [";
  for (std::size_t i = 0; i < metrics.weekday_commits.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << metrics.weekday_commits[i];
  }
  json << "]}";
  return json.str();
}

std::string BuildDeltasJson(const std::vector<MetricDelta> &deltas) {
  std::ostringstream json;
  json << "\"deltas\": [";
  for (std::size_t i = 0; i < deltas.size(); ++i) {
    const auto &delta = deltas[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"metric\": " << Quoted(delta.metric) << ",";
    json << "\"previous\": " << FormatOneDecimal(delta.previous) << ",";
    json << "\"current\": " << FormatOneDecimal(delta.current) << ",";
    json << "\"change\": " << FormatOneDecimal(delta.Change()) << "}";
  }
  json << "]";
  return json.str();
}

std::string BuildAuthorsJson(const AuthorStatsMap &author_stats) {
  std::ostringstream json;
  json << "\"author_stats\": [";
  bool first = true;
  for (const auto &[author, stats] : author_stats) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "{\"author\": " << Quoted(author) << ",";
    json << "\"commit_count\": " << stats.commit_count << ",";
    json << "\"total_additions\": " << stats.total_additions << ",";
    json << "\"total_deletions\": " << stats.total_deletions << ",";
    json << "\"average_churn\": " << FormatOneDecimal(stats.average_churn)
         << ",";
    json << "\"files_changed\": " << stats.files_changed << ",";
    json << "\"files_per_commit\": "
         << FormatOneDecimal(stats.files_per_commit) << ",";
    json << "\"risky_commit_count\": " << stats.risky_commit_count << ",";
    json << "\"after_hours_commit_count\": " << stats.after_hours_commit_count
         << "}";
  }
  json << "]";
  return json.str();
}

std::string BuildRiskJson(const RiskAssessment &risk) {
  std::ostringstream json;
  json << "\"risk\": {";
  json << "\"risky_commit_percent\": "
       << FormatOneDecimal(risk.risky_commit_percent) << ",";
  json << "\"after_hours_percent\": "
       << FormatOneDecimal(risk.after_hours_percent) << ",";
  json << "\"churn_threshold\": "
       << FormatOneDecimal(risk.applied_churn_threshold) << ",";
  json << "\"risky_commits\": [";
  for (std::size_t i = 0; i < risk.risky_commits.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << Quoted(risk.risky_commits[i]);
  }
  json << "],\"flags\": [";
  for (std::size_t i = 0; i < risk.flags.size(); ++i) {
    const auto &flag = risk.flags[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"check\": " << Quoted(flag.check) << ",";
    json << "\"subject\": " << Quoted(flag.subject) << ",";
    json << "\"detail\": " << Quoted(flag.detail) << "}";
  }
  json << "]}";
  return json.str();
}

std::string BuildForecastsJson(const std::vector<ForecastResult> &forecasts) {
  std::ostringstream json;
  json << "\"forecasts\": [";
  for (std::size_t i = 0; i < forecasts.size(); ++i) {
    const auto &forecast = forecasts[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"metric\": " << Quoted(ToString(forecast.metric)) << ",";
    json << "\"target_period_start\": "
         << Quoted(FormatTimestamp(forecast.target_period.start)) << ",";
    json << "\"status\": " << Quoted(ToString(forecast.status)) << ",";
    json << "\"prediction\": " << JsonNumber(forecast.prediction) << ",";
    json << "\"last_observed\": " << JsonNumber(forecast.last_observed) << ",";
    json << "\"direction\": " << Quoted(ToString(forecast.direction)) << ",";
    json << "\"confidence\": " << Quoted(ToString(forecast.confidence)) << ",";
    json << "\"history_length\": " << forecast.history_length << ",";
    json << "\"rmse\": " << JsonNumber(forecast.rmse) << "}";
  }
  json << "]";
  return json.str();
}

std::string BuildHarvestJson(const HarvestSummary &harvest) {
  std::ostringstream json;
  json << "\"harvest\": {";
  json << "\"commits_ingested\": " << harvest.commits_ingested << ",";
  json << "\"pull_requests_ingested\": " << harvest.pull_requests_ingested
       << ",";
  json << "\"malformed_commits\": " << harvest.malformed_commits << ",";
  json << "\"malformed_pull_requests\": " << harvest.malformed_pull_requests
       << ",";
  json << "\"out_of_range_commits\": " << harvest.out_of_range_commits << ",";
  json << "\"out_of_range_pull_requests\": "
       << harvest.out_of_range_pull_requests << "}";
  return json.str();
}

} // namespace

std::string FormatOneDecimal(double value) {
  auto rounded = std::round(value * 10.0) / 10.0;
  if (rounded == 0.0) {
    rounded = 0.0;
  }
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(1) << rounded;
  return stream.str();
}

std::string FormatOptional(const std::optional<double> &value,
                           const std::string &missing) {
  return value ? FormatOneDecimal(*value) : missing;
}

Rendering MarkdownReporter::Render(const Report &report,
                                   const RenderOptions &options) {
  const auto timestamp = GeneratedOn();

  Rendering rendering;
  const bool render_markdown = ShouldRenderFormat(options.formats, "markdown");
  const bool render_json = ShouldRenderFormat(options.formats, "json");

  if (render_markdown) {
    std::ostringstream output;
    output << "# Repository Pulse Report\n\n";
    output << BuildHeaderMarkdown(report, options, timestamp);
    output << BuildMetricsMarkdown(report.period_metrics);
    output << BuildDeltasMarkdown(report.deltas);
    output << BuildAuthorsMarkdown(report.author_stats);
    output << BuildRiskMarkdown(report.risk);
    output << BuildForecastsMarkdown(report.forecasts);
    output << BuildWeekdayMarkdown(report.period_metrics);
    output << BuildHarvestMarkdown(report.harvest);
    rendering.markdown = output.str();
  }

  if (render_json) {
    std::ostringstream output;
    output << "{";
    output << BuildHeaderJson(report, options, timestamp) << ",";
    output << BuildMetricsJson(report.period_metrics) << ",";
    output << BuildDeltasJson(report.deltas) << ",";
    output << BuildAuthorsJson(report.author_stats) << ",";
    output << BuildRiskJson(report.risk) << ",";
    output << BuildForecastsJson(report.forecasts) << ",";
    output << BuildHarvestJson(report.harvest);
    output << "}";
    rendering.json = output.str();
  }

  return rendering;
}

} // namespace pulse
