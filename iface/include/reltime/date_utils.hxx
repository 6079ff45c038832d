#ifndef RELTIME_DATE_UTILS_HXX
#define RELTIME_DATE_UTILS_HXX

#include <chrono>
#include <cstdint>
#include <date/date.h>
#include <string>
#include <string_view>

namespace reltime {

using timestamp = date::sys_seconds;
using seconds = std::chrono::seconds;

// Earliest and latest instants apply() may produce.
auto
min_timestamp() -> timestamp;

auto
max_timestamp() -> timestamp;

/**
 * Shifts by whole calendar months, carrying into the year.
 *
 * The day of month is clamped to the last day of the destination month
 * (Jan 31 + 1 month is Feb 28 or 29) and the time of day is kept. Throws
 * TimeOverflowError when the result leaves [min_timestamp, max_timestamp].
 */
auto
add_months(timestamp, int64_t) -> timestamp;

// add_months() by twelve times the count; Feb 29 lands on Feb 28.
auto
add_years(timestamp, int64_t) -> timestamp;

// Adds count * unit seconds with overflow checks.
auto
add_seconds(timestamp, int64_t count, int64_t unit) -> timestamp;

// YYYY-MM-DDTHH:MM:SS; a space separator is accepted as well.
auto
parse_timestamp(std::string_view) -> timestamp;

auto
format_timestamp(timestamp) -> std::string;

}

#endif
