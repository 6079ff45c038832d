#include "command_line.hxx"
#include <Poco/Logger.h>
#include <Poco/String.h>
#include <Poco/Util/Application.h>
#include <Poco/Util/OptionException.h>
#include <Poco/Util/PropertyFileConfiguration.h>
#include <algorithm>
#include <fmt/format.h>
#include <reltime/arithmetic_time_plugin.hxx>
#include <reltime/configuration.hxx>

namespace reltime {

void
apply_unit_option(Poco::Util::AbstractConfiguration& config,
                  const std::string& value)
{
  const auto separator = value.find('=');
  const auto alias =
    Poco::trim(value.substr(0, std::min(separator, value.size())));

  if (separator == std::string::npos or alias.empty()) {
    throw Poco::Util::InvalidArgumentException(
      fmt::format("Expected <alias=Unit>, got <{}>", value));
  }

  config.setString(fmt::format("{}.{}", UNITS_CONFIG_ROOT, alias),
                   Poco::trim(value.substr(separator + 1)));
}

void
add_units_file(Poco::Util::LayeredConfiguration& config,
               const std::string& path)
{
  config.add(new Poco::Util::PropertyFileConfiguration(path),
             Poco::Util::Application::PRIO_DEFAULT);
}

auto
join_expression(const std::vector<std::string>& args) -> std::string
{
  return Poco::cat(std::string{ " " }, args.begin(), args.end());
}

auto
run_expression(const Poco::Util::AbstractConfiguration& config,
               const std::string& expression,
               timestamp base,
               bool printTokens) -> std::optional<std::string>
{
  auto& logger = Poco::Logger::get("reltime.cli");

  ArithmeticTimePlugin plugin;
  load_units(config, plugin.units());

  const auto tokens = plugin.tokenize(expression);
  if (tokens.empty()) {
    return std::nullopt;
  }

  if (printTokens) {
    return to_string(tokens);
  }

  auto result = base;
  for (const auto& token : tokens) {
    result = plugin.apply(token, result);
    logger.debug(fmt::format(
      "{} applied: {}", to_string(token), format_timestamp(result)));
  }
  return format_timestamp(result);
}

}
