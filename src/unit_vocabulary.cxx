#include <reltime/unit_vocabulary.hxx>
#include <Poco/UTF8String.h>
#include <array>
#include <utility>

namespace reltime {

namespace {

using Alias = std::pair<std::string_view, RelativeTimeUnit>;

constexpr std::array<Alias, 20> DEFAULT_ALIASES{ {
  { "sec", RelativeTimeUnit::Seconds },
  { "secs", RelativeTimeUnit::Seconds },
  { "second", RelativeTimeUnit::Seconds },
  { "seconds", RelativeTimeUnit::Seconds },
  { "min", RelativeTimeUnit::Minutes },
  { "mins", RelativeTimeUnit::Minutes },
  { "minute", RelativeTimeUnit::Minutes },
  { "minutes", RelativeTimeUnit::Minutes },
  { "hour", RelativeTimeUnit::Hours },
  { "hours", RelativeTimeUnit::Hours },
  { "day", RelativeTimeUnit::Days },
  { "days", RelativeTimeUnit::Days },
  { "week", RelativeTimeUnit::Weeks },
  { "weeks", RelativeTimeUnit::Weeks },
  { "fortnight", RelativeTimeUnit::Fortnights },
  { "fortnights", RelativeTimeUnit::Fortnights },
  { "month", RelativeTimeUnit::Months },
  { "months", RelativeTimeUnit::Months },
  { "year", RelativeTimeUnit::Years },
  { "years", RelativeTimeUnit::Years },
} };

}

UnitVocabulary::UnitVocabulary()
{
  seed_defaults();
}

auto
UnitVocabulary::fold(std::string_view alias) -> std::string
{
  return Poco::UTF8::toLower(std::string{ alias });
}

void
UnitVocabulary::set(std::string_view alias, RelativeTimeUnit unit)
{
  mUnits[fold(alias)] = unit;
}

auto
UnitVocabulary::operator[](std::string_view alias) -> RelativeTimeUnit&
{
  return mUnits.try_emplace(fold(alias), RelativeTimeUnit::Unknown)
    .first->second;
}

auto
UnitVocabulary::find(std::string_view alias) const
  -> std::optional<RelativeTimeUnit>
{
  const auto iter = mUnits.find(fold(alias));
  if (iter == mUnits.end()) {
    return std::nullopt;
  }
  return iter->second;
}

auto
UnitVocabulary::resolve(std::string_view alias) const
  -> std::optional<RelativeTimeUnit>
{
  auto unit = find(alias);
  if ((not unit or *unit == RelativeTimeUnit::Unknown) and alias.size() > 1 and
      (alias.back() == 's' or alias.back() == 'S')) {
    unit = find(alias.substr(0, alias.size() - 1));
  }

  // Unknown entries only come from operator[] lookups that were never
  // assigned and must not reach a token
  if (unit == RelativeTimeUnit::Unknown) {
    return std::nullopt;
  }
  return unit;
}

auto
UnitVocabulary::contains(std::string_view alias) const -> bool
{
  return mUnits.contains(fold(alias));
}

auto
UnitVocabulary::size() const -> std::size_t
{
  return mUnits.size();
}

auto
UnitVocabulary::empty() const -> bool
{
  return mUnits.empty();
}

void
UnitVocabulary::clear()
{
  mUnits.clear();
}

void
UnitVocabulary::seed_defaults()
{
  for (const auto& [alias, unit] : DEFAULT_ALIASES) {
    set(alias, unit);
  }
}

}
