#include "expression_reader.hxx"
#include <Poco/String.h>
#include <fmt/format.h>
#include <reltime/arithmetic_time_plugin.hxx>
#include <reltime/exceptions.hxx>

namespace reltime {

namespace {

constexpr int64_t SECONDS_IN_MINUTE = 60;
constexpr int64_t SECONDS_IN_HOUR = 60 * SECONDS_IN_MINUTE;
constexpr int64_t SECONDS_IN_DAY = 24 * SECONDS_IN_HOUR;
constexpr int64_t SECONDS_IN_WEEK = 7 * SECONDS_IN_DAY;
constexpr int64_t SECONDS_IN_FORTNIGHT = 14 * SECONDS_IN_DAY;

}

ArithmeticTimePlugin::ArithmeticTimePlugin(UnitVocabulary units)
  : mUnits(std::move(units))
{
}

auto
ArithmeticTimePlugin::logger() const -> Poco::Logger&
{
  return Poco::Logger::get("reltime.arithmetic");
}

auto
ArithmeticTimePlugin::units() -> UnitVocabulary&
{
  return mUnits;
}

auto
ArithmeticTimePlugin::units() const -> const UnitVocabulary&
{
  return mUnits;
}

auto
ArithmeticTimePlugin::key() const -> std::string_view
{
  return KEY;
}

auto
ArithmeticTimePlugin::tokenize(const char* input) const
  -> std::vector<TimeToken>
{
  if (input == nullptr) {
    throw NullInputError("tokenize() requires an input string");
  }
  return tokenize(std::string_view{ input });
}

auto
ArithmeticTimePlugin::tokenize(std::string_view input) const
  -> std::vector<TimeToken>
{
  const std::string expression{ Poco::trim(std::string{ input }) };

  ExpressionReader reader(expression, KEY, mUnits);
  auto tokens = reader.read();

  if (tokens.empty() and logger().debug()) {
    logger().debug(fmt::format("No relative time in <{}>, rejected at {}",
                               expression,
                               reader.failed_at()));
  }
  return tokens;
}

auto
ArithmeticTimePlugin::apply(const TimeToken& token, timestamp base) const
  -> timestamp
{
  switch (token.unit()) {
    case RelativeTimeUnit::Seconds:
      return add_seconds(base, token.magnitude(), 1);
    case RelativeTimeUnit::Minutes:
      return add_seconds(base, token.magnitude(), SECONDS_IN_MINUTE);
    case RelativeTimeUnit::Hours:
      return add_seconds(base, token.magnitude(), SECONDS_IN_HOUR);
    case RelativeTimeUnit::Days:
      return add_seconds(base, token.magnitude(), SECONDS_IN_DAY);
    case RelativeTimeUnit::Weeks:
      return add_seconds(base, token.magnitude(), SECONDS_IN_WEEK);
    case RelativeTimeUnit::Fortnights:
      return add_seconds(base, token.magnitude(), SECONDS_IN_FORTNIGHT);
    case RelativeTimeUnit::Months:
      return add_months(base, token.magnitude());
    case RelativeTimeUnit::Years:
      return add_years(base, token.magnitude());
    case RelativeTimeUnit::Unknown:
      break;
  }
  throw FormatError(
    fmt::format("Unrecognized relative time unit in {}", to_string(token)));
}

}
