#include "expression_reader.hxx"
#include <Poco/Ascii.h>
#include <Poco/UTF8String.h>
#include <charconv>
#include <limits>
#include <string>
#include <utility>

namespace reltime {

ExpressionReader::ExpressionReader(std::string_view input,
                                   std::string_view source,
                                   const UnitVocabulary& units)
  : mInput(input)
  , mSource(source)
  , mUnits(units)
{
}

auto
ExpressionReader::at_end() const -> bool
{
  return mPos >= mInput.size();
}

auto
ExpressionReader::peek() const -> char
{
  return at_end() ? '\0' : mInput[mPos];
}

auto
ExpressionReader::skip_space() -> bool
{
  const auto start = mPos;
  while (not at_end() and Poco::Ascii::isSpace(peek())) {
    ++mPos;
  }
  return mPos != start;
}

auto
ExpressionReader::read_word() -> std::string_view
{
  const auto start = mPos;
  while (not at_end() and not Poco::Ascii::isSpace(peek())) {
    ++mPos;
  }
  return mInput.substr(start, mPos - start);
}

auto
ExpressionReader::read_sign() -> int
{
  switch (peek()) {
    case '+':
      ++mPos;
      return 1;
    case '-':
      ++mPos;
      return -1;
    default:
      return 0;
  }
}

auto
ExpressionReader::read_digits() -> std::optional<std::string_view>
{
  const auto start = mPos;
  while (not at_end() and Poco::Ascii::isDigit(peek())) {
    ++mPos;
  }
  if (mPos == start) {
    return std::nullopt;
  }
  return mInput.substr(start, mPos - start);
}

auto
ExpressionReader::read_ago() -> bool
{
  const auto start = mPos;
  if (skip_space()) {
    const std::string word{ read_word() };
    if (Poco::UTF8::icompare(word, std::string{ AGO }) == 0) {
      return true;
    }
  }
  mPos = start;
  return false;
}

auto
ExpressionReader::read_occurrence() -> std::optional<TimeToken>
{
  const auto start = mPos;

  // a sign binds to what follows it, never across whitespace
  const int sign = read_sign();
  const auto digits = read_digits();

  if (digits) {
    skip_space();
  }

  const auto alias = read_word();
  if (alias.empty()) {
    return std::nullopt;
  }

  const auto unit = mUnits.resolve(alias);
  if (not unit) {
    mPos = start;
    return std::nullopt;
  }

  const bool ago = read_ago();

  const auto magnitude =
    signed_magnitude(digits.value_or(std::string_view{}), sign, ago);
  if (not magnitude) {
    mPos = start;
    return std::nullopt;
  }

  return TimeToken(std::string{ mSource },
                   std::string{ mInput.substr(start, mPos - start) },
                   std::to_string(*magnitude),
                   *unit);
}

auto
ExpressionReader::read() -> std::vector<TimeToken>
{
  std::vector<TimeToken> tokens;
  mPos = 0;

  while (not at_end()) {
    if (not tokens.empty() and not skip_space()) {
      break;
    }

    auto token = read_occurrence();
    if (not token) {
      break;
    }
    tokens.emplace_back(std::move(*token));
  }

  if (not at_end() or tokens.empty()) {
    mFailedAt = mPos;
    return {};
  }
  return tokens;
}

auto
ExpressionReader::failed_at() const -> std::size_t
{
  return mFailedAt;
}

auto
signed_magnitude(std::string_view digits, int sign, bool ago)
  -> std::optional<int64_t>
{
  uint64_t value = 1;

  if (not digits.empty()) {
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} or ptr != last) {
      return std::nullopt;
    }
  }

  constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  const bool negative = (sign < 0) != ago;

  // the negative range reaches one further than the positive one
  if (value > (negative ? max + 1 : max)) {
    return std::nullopt;
  }
  if (not negative) {
    return static_cast<int64_t>(value);
  }
  return static_cast<int64_t>(~value + 1);
}

}
