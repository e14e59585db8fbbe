#pragma once

#include <pulse/interfaces.h>
#include <pulse/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace pulse {

// Reads commits and pull requests from a YAML document with top-level
// `commits` and `pull_requests` sequences. Records are returned unfiltered;
// ingestion decides what belongs to the Period. Absent fields come back
// unset. Fields that are present but fail to convert are also unset and are
// listed in `unreadable_fields`, which makes ingestion count the record as
// malformed.
class YamlEventSource : public EventSource {
public:
  explicit YamlEventSource(std::filesystem::path path);

  RawEventBatch Fetch(const Period &period) override;

private:
  std::filesystem::path path_;
};

RawEventBatch ParseEventBatch(const std::string &yaml_text);
RawEventBatch LoadEventBatch(const std::filesystem::path &path);

// Prior PeriodMetrics from a `periods` sequence, returned oldest first. Each
// entry needs a `start`; the period end is derived from the granularity.
std::vector<PeriodMetrics> ParseMetricsHistory(const std::string &yaml_text,
                                               Granularity granularity);
std::vector<PeriodMetrics>
LoadMetricsHistory(const std::filesystem::path &path, Granularity granularity);

} // namespace pulse
