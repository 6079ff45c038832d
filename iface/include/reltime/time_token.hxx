#ifndef RELTIME_TIME_TOKEN_HXX
#define RELTIME_TIME_TOKEN_HXX

#include "time_unit.hxx"
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reltime {

/**
 * One recognized occurrence of a relative time expression.
 *
 * The magnitude is kept as the decimal text of a signed integer; the raw text
 * is the exact input slice the occurrence was read from, and is absent for
 * tokens built by hand.
 */
class TimeToken
{
private:
  std::string mSource;
  std::optional<std::string> mRaw;
  std::string mValue;
  RelativeTimeUnit mUnit;

public:
  TimeToken(std::string,                // source key
            std::optional<std::string>, // raw matched text
            std::string,                // magnitude text
            RelativeTimeUnit);

  [[nodiscard]] auto source() const -> const std::string&;

  [[nodiscard]] auto raw() const -> const std::optional<std::string>&;

  [[nodiscard]] auto value() const -> const std::string&;

  [[nodiscard]] auto unit() const -> RelativeTimeUnit;

  // Throws FormatError if value() is not a signed 64-bit integer.
  [[nodiscard]] auto magnitude() const -> int64_t;

  auto operator==(const TimeToken&) const -> bool = default;
};

// "[Years:15]"
auto
to_string(const TimeToken&) -> std::string;

// "[Years:15][Months:3]", or "" for no tokens
auto
to_string(const std::vector<TimeToken>&) -> std::string;

}

template<>
struct fmt::formatter<reltime::TimeToken> : fmt::formatter<std::string_view>
{
  template<typename FormatContext>
  auto format(const reltime::TimeToken& token, FormatContext& ctx) const
  {
    return fmt::formatter<std::string_view>::format(reltime::to_string(token),
                                                    ctx);
  }
};

#endif
