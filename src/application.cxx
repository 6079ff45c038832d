#include "application.hxx"
#include "command_line.hxx"
#include <Poco/Exception.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionCallback.h>
#include <Poco/Util/OptionSet.h>
#include <fmt/format.h>
#include <iostream>
#include <reltime/reltime.hxx>

namespace reltime {

void
Application::display_help()
{
  Poco::Util::HelpFormatter helpFormatter(options());
  helpFormatter.setCommand(commandName());
  helpFormatter.setUsage("OPTIONS [--] EXPRESSION...");
  helpFormatter.setHeader(fmt::format(
    "{}: shift a timestamp by a relative time expression such as "
    "\"15 years -12 months 2 fortnights ago\"",
    reltime::usage()));
  helpFormatter.setFooter(
    "Put -- before an expression that starts with a sign.");
  helpFormatter.format(std::cout);
}

void
Application::initialize(Poco::Util::Application& self)
{
  loadConfiguration();
  Poco::Util::Application::initialize(self);
  logger().debug("Starting up");
}

void
Application::uninitialize()
{
  logger().debug("Shutting down");
  Poco::Util::Application::uninitialize();
}

void
Application::defineOptions(Poco::Util::OptionSet& options)
{
  Poco::Util::Application::defineOptions(options);

  options.addOption(
    Poco::Util::Option(
      "help", "h", "display help information on command line arguments")
      .required(false)
      .repeatable(false)
      .callback(Poco::Util::OptionCallback<Application>(
        this, &Application::handle_help)));

  options.addOption(
    Poco::Util::Option("version", "v", "display the program version")
      .required(false)
      .repeatable(false)
      .callback(Poco::Util::OptionCallback<Application>(
        this, &Application::handle_version)));

  options.addOption(
    Poco::Util::Option(
      "base", "b", "timestamp to shift, YYYY-MM-DDTHH:MM:SS (default: now)")
      .required(false)
      .repeatable(false)
      .argument("<timestamp>", true)
      .callback(
        Poco::Util::OptionCallback<Application>(this, &Application::set_base)));

  options.addOption(
    Poco::Util::Option("tokens", "t", "print the recognized tokens only")
      .required(false)
      .repeatable(false)
      .callback(Poco::Util::OptionCallback<Application>(
        this, &Application::set_print_tokens)));

  options.addOption(
    Poco::Util::Option("unit", "u", "add a unit alias, e.g. heure=Hours")
      .required(false)
      .repeatable(true)
      .argument("<alias=Unit>", true)
      .callback(
        Poco::Util::OptionCallback<Application>(this, &Application::set_unit)));

  options.addOption(
    Poco::Util::Option(
      "units-file", "f", "properties file with units.<alias> = <Unit> entries")
      .required(false)
      .repeatable(true)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<Application>(
        this, &Application::set_units_file)));
}

void
Application::handle_help(const std::string& name, const std::string& value)
{
  mInfoRequested = true;
  display_help();
  stopOptionsProcessing();
}

void
Application::handle_version(const std::string& name, const std::string& value)
{
  mInfoRequested = true;
  std::cout << reltime::usage() << std::endl;
  stopOptionsProcessing();
}

void
Application::set_base(const std::string& name, const std::string& value)
{
  mBase = value;
}

void
Application::set_print_tokens(const std::string& name,
                              const std::string& value)
{
  mPrintTokens = true;
}

void
Application::set_unit(const std::string& name, const std::string& value)
{
  apply_unit_option(config(), value);
}

void
Application::set_units_file(const std::string& name, const std::string& value)
{
  add_units_file(config(), value);
}

auto
Application::main(const ArgVec& args) -> int
{
  if (mInfoRequested) {
    return Poco::Util::Application::EXIT_OK;
  }

  if (args.empty()) {
    display_help();
    return Poco::Util::Application::EXIT_USAGE;
  }

  const auto expression = join_expression(args);

  try {
    const timestamp base =
      mBase ? parse_timestamp(*mBase)
            : date::floor<seconds>(std::chrono::system_clock::now());

    const auto output = run_expression(config(), expression, base, mPrintTokens);
    if (not output) {
      logger().error(fmt::format("Unrecognized expression <{}>", expression));
      return Poco::Util::Application::EXIT_DATAERR;
    }

    std::cout << *output << std::endl;
  } catch (const Poco::Exception& exc) {
    logger().error(exc.displayText());
    return Poco::Util::Application::EXIT_DATAERR;
  }

  return Poco::Util::Application::EXIT_OK;
}

}

POCO_APP_MAIN(reltime::Application)
