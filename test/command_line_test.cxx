#include "command_line.hxx"
#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/TemporaryFile.h>
#include <Poco/Util/LayeredConfiguration.h>
#include <Poco/Util/MapConfiguration.h>
#include <Poco/Util/OptionException.h>
#include <fstream>
#include <gtest/gtest.h>
#include <reltime/exceptions.hxx>

using namespace reltime;

namespace {

auto
make_config() -> Poco::AutoPtr<Poco::Util::LayeredConfiguration>
{
  Poco::AutoPtr<Poco::Util::LayeredConfiguration> config(
    new Poco::Util::LayeredConfiguration);
  config->addWriteable(new Poco::Util::MapConfiguration, -100);
  return config;
}

}

TEST(CommandLine, UnitOptionSetsConfigKey)
{
  auto config = make_config();
  apply_unit_option(*config, "heure=Hours");
  apply_unit_option(*config, " jour = Days ");

  EXPECT_EQ(config->getString("units.heure"), "Hours");
  EXPECT_EQ(config->getString("units.jour"), "Days");
}

TEST(CommandLine, MalformedUnitOptionThrows)
{
  auto config = make_config();
  EXPECT_THROW(apply_unit_option(*config, "heure"),
               Poco::Util::InvalidArgumentException);
  EXPECT_THROW(apply_unit_option(*config, "=Hours"),
               Poco::Util::InvalidArgumentException);
  EXPECT_THROW(apply_unit_option(*config, " =Hours"),
               Poco::Util::InvalidArgumentException);
  EXPECT_THROW(apply_unit_option(*config, ""),
               Poco::Util::InvalidArgumentException);
}

TEST(CommandLine, UnknownUnitNameFailsOnRun)
{
  auto config = make_config();
  apply_unit_option(*config, "eon=Eons");

  EXPECT_THROW(
    run_expression(*config, "2 eons", parse_timestamp("2020-01-01"), false),
    Poco::InvalidArgumentException);
}

TEST(CommandLine, UnitsFileSeedsVocabulary)
{
  Poco::TemporaryFile file;
  {
    std::ofstream out(file.path());
    out << "units.jour = Days\n"
        << "units.semaine = Weeks\n";
  }

  auto config = make_config();
  add_units_file(*config, file.path());

  EXPECT_EQ(
    run_expression(*config, "3 jours 1 semaine ago", timestamp{}, true),
    "[Days:3][Weeks:-1]");
}

TEST(CommandLine, UnitOptionOverridesUnitsFile)
{
  Poco::TemporaryFile file;
  {
    std::ofstream out(file.path());
    out << "units.heure = Days\n";
  }

  auto config = make_config();
  add_units_file(*config, file.path());
  apply_unit_option(*config, "heure=Hours");

  EXPECT_EQ(run_expression(*config, "2 heures", timestamp{}, true),
            "[Hours:2]");
}

TEST(CommandLine, MissingUnitsFileThrows)
{
  Poco::TemporaryFile file;
  auto config = make_config();

  EXPECT_THROW(add_units_file(*config, file.path()), Poco::FileException);
}

TEST(CommandLine, JoinsArgumentsWithSpaces)
{
  EXPECT_EQ(join_expression({ "-15", "years", "ago" }), "-15 years ago");
  EXPECT_EQ(join_expression({ "2 days", "ago" }), "2 days ago");
  EXPECT_EQ(join_expression({}), "");
}

TEST(CommandLine, PrintsTokens)
{
  auto config = make_config();
  EXPECT_EQ(
    run_expression(*config, "15 years -12 months 2 fortnights ago",
                   timestamp{}, true),
    "[Years:15][Months:-12][Fortnights:-2]");
}

TEST(CommandLine, PrintsShiftedBase)
{
  auto config = make_config();
  const auto base = parse_timestamp("2019-01-31T10:00:00");

  EXPECT_EQ(run_expression(*config, "1 year 1 month 2 hours", base, false),
            "2020-02-29T12:00:00");
  EXPECT_EQ(run_expression(*config, "0 days", base, false),
            "2019-01-31T10:00:00");
}

TEST(CommandLine, UnrecognizedExpressionIsEmpty)
{
  auto config = make_config();
  EXPECT_FALSE(
    run_expression(*config, "four eggs ago", timestamp{}, false).has_value());
  EXPECT_FALSE(run_expression(*config, "", timestamp{}, true).has_value());
}

TEST(CommandLine, OverflowPropagates)
{
  auto config = make_config();
  EXPECT_THROW(
    run_expression(*config, "40000 years", parse_timestamp("2020-01-01"), false),
    TimeOverflowError);
}
