#include <pulse/cli_exit_codes.h>
#include <pulse/component_registry.h>
#include <pulse/event_model.h>
#include <pulse/pipeline_builder.h>
#include <pulse/report_cli.h>
#include <pulse/report_pipeline.h>
#include <pulse/yaml_event_source.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using pulse::ReportOptions;

constexpr int kMaxUtcOffsetMinutes = 14 * 60;

void PrintReportUsage() {
  std::cout
      << "Usage: pulse-report report --events <file> --period-start <date> "
         "[options]\n"
      << "Options:\n"
      << "  --events <file>           YAML file with commits and pull "
         "requests\n"
      << "  --history <file>          YAML file with prior period metrics\n"
      << "  --period-start <date>     Start of the period (ISO-8601)\n"
      << "  --granularity <name>      daily, weekly or monthly (default: "
         "weekly)\n"
      << "  --format <list>           Comma-separated list of output formats\n"
      << "                            (supported: markdown,json)\n"
      << "  --out <path>              Directory for report outputs (default: "
         "current directory)\n"
      << "  --config <file>           Optional YAML config file\n"
      << "  --source <name>           Event source plug-in to use\n"
      << "  --reporter <name>         Reporter plug-in to render outputs\n"
      << "  --workday-start <hour>    First working hour (default: 9)\n"
      << "  --workday-end <hour>      Hour the working day ends (default: "
         "18)\n"
      << "  --utc-offset <minutes>    Local offset from UTC (default: 0)\n"
      << "  --churn-threshold <lines> Fixed churn spike threshold (default: "
         "100)\n"
      << "  --concentration-share <f> Author churn share flagged as "
         "concentration\n"
      << "                            (default: 0.6)\n"
      << "  --max-history <n>         Periods fed to the forecaster (default: "
         "12)\n"
      << "  --min-history <n>         Periods needed for a fitted forecast\n"
      << "                            (default: 2)\n"
      << "  --log-level <level>       Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                 Shortcut for --log-level info\n"
      << "  --debug                   Shortcut for --log-level debug\n"
      << "  --help                    Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

long long ParseInteger(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(trimmed, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(name + " must be an integer: " + value);
  }
  if (consumed != trimmed.size()) {
    throw std::invalid_argument(name + " must be an integer: " + value);
  }
  return parsed;
}

double ParseNumber(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(trimmed, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(name + " must be a number: " + value);
  }
  if (consumed != trimmed.size()) {
    throw std::invalid_argument(name + " must be a number: " + value);
  }
  return parsed;
}

std::size_t ParseCount(const std::string &value, const std::string &name) {
  const auto parsed = ParseInteger(value, name);
  if (parsed < 0) {
    throw std::invalid_argument(name + " cannot be negative: " + value);
  }
  return static_cast<std::size_t>(parsed);
}

std::vector<std::string> SplitFormats(const std::string &raw_formats) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_formats) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(static_cast<char>(std::tolower(character)));
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitFormats(raw_formats)) {
    format = Trim(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ReportOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        pulse::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = pulse::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = pulse::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleTuningOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ReportOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--workday-start") {
    options.workday_start_hour = static_cast<int>(
        ParseInteger(RequireValue(arguments, index, argument), argument));
    return true;
  }
  if (argument == "--workday-end") {
    options.workday_end_hour = static_cast<int>(
        ParseInteger(RequireValue(arguments, index, argument), argument));
    return true;
  }
  if (argument == "--utc-offset") {
    options.utc_offset_minutes = static_cast<int>(
        ParseInteger(RequireValue(arguments, index, argument), argument));
    return true;
  }
  if (argument == "--churn-threshold") {
    options.churn_threshold =
        ParseNumber(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--concentration-share") {
    options.concentration_share =
        ParseNumber(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-history") {
    options.max_history =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--min-history") {
    options.min_history =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool DispatchReportOption(const std::vector<std::string> &arguments,
                          std::size_t &index, ReportOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--events") {
    options.events = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--history") {
    options.history = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--period-start") {
    options.period_start = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--granularity") {
    options.granularity =
        pulse::ParseGranularity(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  if (argument == "--source") {
    options.source = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
    return true;
  }
  if (HandleLoggingOption(arguments, index, options)) {
    return true;
  }
  return HandleTuningOption(arguments, index, options);
}

void ValidateReportOptions(const ReportOptions &options) {
  if (!options.events) {
    throw std::invalid_argument("--events is required (or set in config file)");
  }
  if (!options.period_start) {
    throw std::invalid_argument(
        "--period-start is required (or set in config file)");
  }

  const auto start = options.workday_start_hour.value_or(9);
  const auto end = options.workday_end_hour.value_or(18);
  if (start < 0 || start > 23 || end < 1 || end > 24 || start >= end) {
    throw std::invalid_argument(
        "Working hours must satisfy 0 <= start < end <= 24");
  }
  if (options.utc_offset_minutes &&
      std::abs(*options.utc_offset_minutes) > kMaxUtcOffsetMinutes) {
    throw std::invalid_argument("UTC offset must be within +/- 840 minutes");
  }
  if (options.churn_threshold && *options.churn_threshold <= 0.0) {
    throw std::invalid_argument("Churn threshold must be positive");
  }
  if (options.concentration_share && (*options.concentration_share <= 0.0 ||
                                      *options.concentration_share > 1.0)) {
    throw std::invalid_argument("Concentration share must be in (0, 1]");
  }

  const auto min_history = options.min_history.value_or(2);
  const auto max_history = options.max_history.value_or(12);
  if (min_history < 1) {
    throw std::invalid_argument("Minimum history must be at least 1");
  }
  if (max_history < 2 || max_history < min_history) {
    throw std::invalid_argument(
        "Maximum history must be at least 2 and not below the minimum");
  }
}

using ConfigValue = std::variant<std::string, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"events",
                                                "history",
                                                "out",
                                                "formats",
                                                "granularity",
                                                "period_start",
                                                "log_level",
                                                "reporter",
                                                "source",
                                                "workday_start_hour",
                                                "workday_end_hour",
                                                "utc_offset_minutes",
                                                "churn_threshold",
                                                "max_history",
                                                "min_history",
                                                "concentration_share"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"events_file", "events"},
      {"history_file", "history"},
      {"workday_start", "workday_start_hour"},
      {"workday_end", "workday_end_hour"},
      {"utc_offset", "utc_offset_minutes"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractFormats(const YAML::Node &node,
                                        const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      AppendFormats(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendFormats(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractFormats(node, key);
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ReportOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }

    const auto &text = std::get<std::string>(value);
    if (key == "events") {
      options.events = text;
    } else if (key == "history") {
      options.history = text;
    } else if (key == "out") {
      options.output_directory = text;
    } else if (key == "granularity") {
      options.granularity = pulse::ParseGranularity(text);
    } else if (key == "period_start") {
      options.period_start = text;
    } else if (key == "log_level") {
      options.log_level = pulse::ParseLogLevel(text);
    } else if (key == "reporter") {
      options.reporter = text;
    } else if (key == "source") {
      options.source = text;
    } else if (key == "workday_start_hour") {
      options.workday_start_hour = static_cast<int>(ParseInteger(text, key));
    } else if (key == "workday_end_hour") {
      options.workday_end_hour = static_cast<int>(ParseInteger(text, key));
    } else if (key == "utc_offset_minutes") {
      options.utc_offset_minutes = static_cast<int>(ParseInteger(text, key));
    } else if (key == "churn_threshold") {
      options.churn_threshold = ParseNumber(text, key);
    } else if (key == "concentration_share") {
      options.concentration_share = ParseNumber(text, key);
    } else if (key == "max_history") {
      options.max_history = ParseCount(text, key);
    } else if (key == "min_history") {
      options.min_history = ParseCount(text, key);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

// Relative paths in a config file resolve against the file's directory.
void AnchorPaths(const std::filesystem::path &config_path,
                 ReportOptions &options) {
  const auto base = config_path.parent_path();
  const auto anchor = [&](std::optional<std::filesystem::path> &target) {
    if (target && target->is_relative()) {
      target = base / *target;
    }
  };
  anchor(options.events);
  anchor(options.history);
  anchor(options.output_directory);
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const pulse::Rendering &rendering) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "pulse_report.md", rendering.markdown);
  WriteFileIfContent(root / "pulse_report.json", rendering.json);
}

pulse::LoggingConfig BuildLoggingConfig(const ReportOptions &options) {
  pulse::LoggingConfig logging;
  logging.level = options.log_level.value_or(pulse::LogLevel::kWarn);
  return logging;
}

// Only Periods that ended before the reported one count as history.
std::vector<pulse::PeriodMetrics>
LoadPriorHistory(const ReportOptions &options, const pulse::Period &period) {
  if (!options.history) {
    return {};
  }
  auto history = pulse::LoadMetricsHistory(*options.history, period.granularity);
  history.erase(std::remove_if(history.begin(), history.end(),
                               [&](const pulse::PeriodMetrics &metrics) {
                                 return metrics.period.start >= period.start;
                               }),
                history.end());
  return history;
}

} // namespace

namespace pulse {

ReportOptions ParseReportArguments(const std::vector<std::string> &arguments) {
  ReportOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchReportOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

ReportOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ReportOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  AnchorPaths(path, options);
  return options;
}

ReportOptions MergeOptions(const ReportOptions &config_options,
                           const ReportOptions &cli_options) {
  ReportOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.events, cli_options.events);
  override_value(merged.history, cli_options.history);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.granularity, cli_options.granularity);
  override_value(merged.period_start, cli_options.period_start);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.source, cli_options.source);
  override_value(merged.workday_start_hour, cli_options.workday_start_hour);
  override_value(merged.workday_end_hour, cli_options.workday_end_hour);
  override_value(merged.utc_offset_minutes, cli_options.utc_offset_minutes);
  override_value(merged.churn_threshold, cli_options.churn_threshold);
  override_value(merged.concentration_share, cli_options.concentration_share);
  override_value(merged.max_history, cli_options.max_history);
  override_value(merged.min_history, cli_options.min_history);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  return merged;
}

ReportOptions ResolveReportOptions(const ReportOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ReportOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateReportOptions(merged);
  return merged;
}

HarvestOptions BuildHarvestOptions(const ReportOptions &options) {
  HarvestOptions harvest;
  harvest.workday_start_hour =
      options.workday_start_hour.value_or(harvest.workday_start_hour);
  harvest.workday_end_hour =
      options.workday_end_hour.value_or(harvest.workday_end_hour);
  harvest.utc_offset_minutes =
      options.utc_offset_minutes.value_or(harvest.utc_offset_minutes);
  return harvest;
}

RiskConfig BuildRiskConfig(const ReportOptions &options) {
  RiskConfig risk;
  risk.churn_threshold = options.churn_threshold.value_or(risk.churn_threshold);
  risk.concentration_share =
      options.concentration_share.value_or(risk.concentration_share);
  return risk;
}

ForecastConfig BuildForecastConfig(const ReportOptions &options) {
  ForecastConfig forecast;
  forecast.max_history = options.max_history.value_or(forecast.max_history);
  forecast.min_history = options.min_history.value_or(forecast.min_history);
  return forecast;
}

Period ResolvePeriod(const ReportOptions &options) {
  if (!options.period_start) {
    throw std::invalid_argument("--period-start is required");
  }
  return MakePeriod(options.granularity.value_or(Granularity::kWeekly),
                    ParseTimestamp(*options.period_start));
}

int RunReport(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseReportArguments(arguments);
  if (cli_options.show_help) {
    PrintReportUsage();
    return kExitSuccess;
  }

  const auto merged = ResolveReportOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  const auto period = ResolvePeriod(merged);
  const auto history = LoadPriorHistory(merged, period);

  const auto &registry = GlobalComponentRegistry();
  auto source = registry.CreateEventSource(merged.source.value_or(""),
                                           *merged.events);
  auto reporter = registry.CreateReporter(merged.reporter.value_or(""));

  PipelineBuilder builder;
  builder.WithHarvestOptions(BuildHarvestOptions(merged))
      .WithRiskConfig(BuildRiskConfig(merged))
      .WithForecastConfig(BuildForecastConfig(merged))
      .WithLogger(logger);
  const auto pipeline = builder.Build();

  const auto result = pipeline.Run(period, *source, history);
  if (!result.Succeeded()) {
    std::cerr << "Pipeline failed during " << ToString(result.error().stage)
              << " stage: " << result.error().detail << "\n";
    return PipelineExitCode(result);
  }

  RenderOptions render_options;
  render_options.formats = merged.formats.empty()
                               ? std::vector<std::string>{"markdown"}
                               : merged.formats;
  render_options.source_label = merged.events->string();
  const auto rendering = reporter->Render(result.report(), render_options);
  WriteReports(merged.output_directory.value_or(std::filesystem::path(".")),
               rendering);
  return PipelineExitCode(result);
}

} // namespace pulse
