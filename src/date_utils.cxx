#include <reltime/date_utils.hxx>
#include <reltime/exceptions.hxx>
#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <limits>
#include <sstream>

namespace reltime {

namespace {

constexpr int64_t MONTHS_IN_YEAR = 12;

auto
checked_add(int64_t lhs, int64_t rhs) -> int64_t
{
  if ((rhs > 0 and lhs > std::numeric_limits<int64_t>::max() - rhs) or
      (rhs < 0 and lhs < std::numeric_limits<int64_t>::min() - rhs)) {
    throw TimeOverflowError(fmt::format("{} + {} overflows", lhs, rhs));
  }
  return lhs + rhs;
}

auto
checked_multiply(int64_t count, int64_t factor) -> int64_t
{
  if (count == 0 or factor == 0) {
    return 0;
  }
  // |count * factor| <= max, with the asymmetric min handled by division
  const auto max = std::numeric_limits<int64_t>::max();
  const auto min = std::numeric_limits<int64_t>::min();
  const bool overflow = (count > 0)
                          ? (factor > 0 ? count > max / factor
                                        : factor < min / count)
                          : (factor > 0 ? count < min / factor
                                        : count < max / factor);
  if (overflow) {
    throw TimeOverflowError(fmt::format("{} * {} overflows", count, factor));
  }
  return count * factor;
}

void
check_range(timestamp instant)
{
  if (instant < min_timestamp() or instant > max_timestamp()) {
    throw TimeOverflowError(
      fmt::format("{}s since epoch is outside the supported calendar",
                  instant.time_since_epoch().count()));
  }
}

}

auto
min_timestamp() -> timestamp
{
  return date::sys_days{ date::year::min() / date::January / 1 };
}

auto
max_timestamp() -> timestamp
{
  return date::sys_days{ date::year::max() / date::December / 31 } +
         std::chrono::hours{ 23 } + std::chrono::minutes{ 59 } +
         seconds{ 59 };
}

auto
add_seconds(timestamp instant, int64_t count, int64_t unit) -> timestamp
{
  check_range(instant);

  const auto delta = checked_multiply(count, unit);
  const auto total = checked_add(instant.time_since_epoch().count(), delta);
  const timestamp result{ seconds{ total } };

  check_range(result);
  return result;
}

auto
add_months(timestamp instant, int64_t count) -> timestamp
{
  check_range(instant);

  const auto day = date::floor<date::days>(instant);
  const auto timeOfDay = instant - day;
  const date::year_month_day ymd{ day };

  const int64_t current =
    static_cast<int64_t>(static_cast<int>(ymd.year())) * MONTHS_IN_YEAR +
    static_cast<int64_t>(static_cast<unsigned>(ymd.month())) - 1;
  const int64_t target = checked_add(current, count);

  // floor division; years before 0 have negative month totals
  int64_t year = target / MONTHS_IN_YEAR;
  int64_t monthIndex = target % MONTHS_IN_YEAR;
  if (monthIndex < 0) {
    monthIndex += MONTHS_IN_YEAR;
    --year;
  }

  if (year < static_cast<int>(date::year::min()) or
      year > static_cast<int>(date::year::max())) {
    throw TimeOverflowError(
      fmt::format("Year {} is outside the supported calendar", year));
  }

  const date::year destYear{ static_cast<int>(year) };
  const date::month destMonth{ static_cast<unsigned>(monthIndex + 1) };
  const auto lastDay = (destYear / destMonth / date::last).day();
  const auto destDay = std::min(ymd.day(), lastDay);

  const timestamp result =
    date::sys_days{ destYear / destMonth / destDay } + timeOfDay;

  check_range(result);
  return result;
}

auto
add_years(timestamp instant, int64_t count) -> timestamp
{
  return add_months(instant, checked_multiply(count, MONTHS_IN_YEAR));
}

auto
parse_timestamp(std::string_view text) -> timestamp
{
  static constexpr std::array<const char*, 3> FORMATS{ "%FT%T",
                                                       "%F %T",
                                                       "%F" };

  for (const auto* format : FORMATS) {
    timestamp result;
    std::istringstream stream{ std::string{ text } };
    stream >> date::parse(format, result);
    if (not stream.fail() and stream.peek() == std::char_traits<char>::eof()) {
      return result;
    }
  }
  throw FormatError(fmt::format("Invalid timestamp <{}>", text));
}

auto
format_timestamp(timestamp instant) -> std::string
{
  return date::format("%FT%T", instant);
}

}
