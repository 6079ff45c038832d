#ifndef RELTIME_COMMAND_LINE
#define RELTIME_COMMAND_LINE

#include <Poco/Util/AbstractConfiguration.h>
#include <Poco/Util/LayeredConfiguration.h>
#include <optional>
#include <reltime/date_utils.hxx>
#include <string>
#include <vector>

namespace reltime {

// Stores "alias=Unit" as units.alias = Unit. Throws
// Poco::Util::InvalidArgumentException when there is no alias.
void
apply_unit_option(Poco::Util::AbstractConfiguration&, const std::string&);

// Layers a properties file under the command line settings. Throws
// Poco::FileException when the file cannot be read.
void
add_units_file(Poco::Util::LayeredConfiguration&, const std::string&);

auto
join_expression(const std::vector<std::string>&) -> std::string;

/**
 * Tokenizes expression with the units configured in config.
 *
 * Returns the tokens as "[Unit:n]..." when printTokens is set, the shifted
 * base otherwise, and std::nullopt when nothing was recognized.
 */
auto
run_expression(const Poco::Util::AbstractConfiguration& config,
               const std::string& expression,
               timestamp base,
               bool printTokens) -> std::optional<std::string>;

}

#endif
