#pragma once

#include <pulse/models.h>

#include <string>
#include <string_view>

namespace pulse {

// Parses ISO-8601 date or date-time strings such as "2024-03-04",
// "2024-03-04T10:15:00Z" or "2024-03-04T10:15:00+02:00". Throws
// std::invalid_argument on malformed input.
Timestamp ParseTimestamp(std::string_view text);
std::string FormatTimestamp(Timestamp timestamp);
std::string FormatDate(Timestamp timestamp);

Granularity ParseGranularity(std::string_view text);

Period MakePeriod(Granularity granularity, Timestamp start);
Period NextPeriod(const Period &period);

double HoursBetween(Timestamp from, Timestamp to);

// Hour of day (0-23) and weekday (Monday = 0) in the local time described by
// utc_offset_minutes.
int LocalHour(Timestamp timestamp, int utc_offset_minutes);
int LocalWeekday(Timestamp timestamp, int utc_offset_minutes);

bool IsAfterHours(Timestamp timestamp, const HarvestOptions &options);

ChangeTag ClassifyMessage(std::string_view message);

struct HarvestResult {
  EventSet events;
  HarvestSummary summary;
};

HarvestResult IngestEvents(const Period &period, const RawEventBatch &batch,
                           const HarvestOptions &options);

} // namespace pulse
