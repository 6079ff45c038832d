#ifndef RELTIME_TIME_UNIT_HXX
#define RELTIME_TIME_UNIT_HXX

#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>

namespace reltime {

enum class RelativeTimeUnit : uint8_t
{
  Seconds = 0,
  Minutes = 1,
  Hours = 2,
  Days = 3,
  Weeks = 4,
  Fortnights = 5,
  Months = 6,
  Years = 7,
  // never produced by tokenization
  Unknown = 8,
};

auto
to_string(RelativeTimeUnit) -> std::string;

// Case-insensitive inverse of to_string(). Unknown is not accepted.
auto
parse_unit(std::string_view) -> std::optional<RelativeTimeUnit>;

}

template<>
struct fmt::formatter<reltime::RelativeTimeUnit> : fmt::formatter<std::string_view>
{
  template<typename FormatContext>
  auto format(reltime::RelativeTimeUnit unit, FormatContext& ctx) const
  {
    return fmt::formatter<std::string_view>::format(reltime::to_string(unit), ctx);
  }
};

#endif
