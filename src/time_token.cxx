#include <reltime/exceptions.hxx>
#include <reltime/time_token.hxx>
#include <charconv>
#include <numeric>
#include <utility>

namespace reltime {

TimeToken::TimeToken(std::string source,
                     std::optional<std::string> raw,
                     std::string value,
                     RelativeTimeUnit unit)
  : mSource(std::move(source))
  , mRaw(std::move(raw))
  , mValue(std::move(value))
  , mUnit(unit)
{
}

auto
TimeToken::source() const -> const std::string&
{
  return mSource;
}

auto
TimeToken::raw() const -> const std::optional<std::string>&
{
  return mRaw;
}

auto
TimeToken::value() const -> const std::string&
{
  return mValue;
}

auto
TimeToken::unit() const -> RelativeTimeUnit
{
  return mUnit;
}

auto
TimeToken::magnitude() const -> int64_t
{
  const auto* first = mValue.data();
  const auto* last = mValue.data() + mValue.size();

  // from_chars takes no leading '+'
  if (first != last and *first == '+') {
    ++first;
  }

  int64_t result = 0;
  const auto [ptr, ec] = std::from_chars(first, last, result);
  if (mValue.empty() or ec != std::errc{} or ptr != last) {
    throw FormatError(fmt::format("Invalid magnitude <{}>", mValue));
  }
  return result;
}

auto
to_string(const TimeToken& token) -> std::string
{
  return fmt::format("[{}:{}]", token.unit(), token.value());
}

auto
to_string(const std::vector<TimeToken>& tokens) -> std::string
{
  return std::accumulate(tokens.begin(),
                         tokens.end(),
                         std::string{},
                         [](std::string acc, const TimeToken& token) {
                           return acc + to_string(token);
                         });
}

}
