#include <reltime/time_unit.hxx>
#include <Poco/String.h>
#include <array>
#include <cstddef>

namespace reltime {

namespace {

constexpr std::array<std::string_view, 9> UNIT_NAMES{
  "Seconds", "Minutes", "Hours",  "Days",    "Weeks",
  "Fortnights", "Months", "Years", "Unknown",
};

}

auto
to_string(RelativeTimeUnit unit) -> std::string
{
  const auto index = static_cast<std::size_t>(unit);
  if (index >= UNIT_NAMES.size()) {
    return std::string{ UNIT_NAMES.back() };
  }
  return std::string{ UNIT_NAMES[index] };
}

auto
parse_unit(std::string_view name) -> std::optional<RelativeTimeUnit>
{
  const std::string wanted{ Poco::trim(std::string{ name }) };

  for (std::size_t index = 0; index + 1 < UNIT_NAMES.size(); ++index) {
    if (Poco::icompare(wanted, std::string{ UNIT_NAMES[index] }) == 0) {
      return static_cast<RelativeTimeUnit>(index);
    }
  }
  return std::nullopt;
}

}
