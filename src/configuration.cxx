#include <Poco/Exception.h>
#include <fmt/format.h>
#include <reltime/configuration.hxx>
#include <string>

namespace reltime {

void
load_units(const Poco::Util::AbstractConfiguration& config,
           UnitVocabulary& units)
{
  Poco::Util::AbstractConfiguration::Keys aliases;
  config.keys(std::string{ UNITS_CONFIG_ROOT }, aliases);

  for (const auto& alias : aliases) {
    const auto name =
      config.getString(fmt::format("{}.{}", UNITS_CONFIG_ROOT, alias));
    const auto unit = parse_unit(name);
    if (not unit) {
      throw Poco::InvalidArgumentException(
        fmt::format("Unknown unit <{}> for alias <{}>", name, alias));
    }
    units.set(alias, *unit);
  }
}

}
