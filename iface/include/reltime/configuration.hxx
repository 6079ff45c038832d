#ifndef RELTIME_CONFIGURATION_HXX
#define RELTIME_CONFIGURATION_HXX

#include "unit_vocabulary.hxx"
#include <Poco/Util/AbstractConfiguration.h>
#include <string_view>

namespace reltime {

// Aliases are configured as "units.<alias> = <Unit>", e.g. units.heure = Hours
inline constexpr std::string_view UNITS_CONFIG_ROOT{ "units" };

// Copies every units.* entry of config into units. Throws
// Poco::InvalidArgumentException for a value that does not name a unit.
void
load_units(const Poco::Util::AbstractConfiguration& config,
           UnitVocabulary& units);

}

#endif
