#ifndef RELTIME_ARITHMETIC_TIME_PLUGIN_HXX
#define RELTIME_ARITHMETIC_TIME_PLUGIN_HXX

#include "plugin.hxx"
#include "unit_vocabulary.hxx"
#include <Poco/Logger.h>

namespace reltime {

/**
 * GNU date style relative offsets: "15 years -12 months 2 fortnights ago".
 *
 * An expression is one or more occurrences of
 *
 *   [+|-][count] unit [ago]
 *
 * separated by whitespace, where a missing count means 1 and "ago" negates
 * its occurrence. The whole input must match or nothing is returned.
 *
 * The vocabulary is per instance and may be localized before tokenizing.
 * Nothing here is synchronized.
 */
class ArithmeticTimePlugin : public Plugin
{
private:
  UnitVocabulary mUnits;

  auto logger() const -> Poco::Logger&;

public:
  static constexpr std::string_view KEY{ "arithmetic" };

  ArithmeticTimePlugin() = default;

  explicit ArithmeticTimePlugin(UnitVocabulary);

  ~ArithmeticTimePlugin() override = default;

  auto units() -> UnitVocabulary&;

  [[nodiscard]] auto units() const -> const UnitVocabulary&;

  [[nodiscard]] auto key() const -> std::string_view override;

  [[nodiscard]] auto tokenize(std::string_view) const
    -> std::vector<TimeToken> override;

  // Throws NullInputError for nullptr.
  [[nodiscard]] auto tokenize(const char*) const
    -> std::vector<TimeToken> override;

  // Throws FormatError for Unknown units and TimeOverflowError when the
  // result is not representable.
  [[nodiscard]] auto apply(const TimeToken&, timestamp) const
    -> timestamp override;
};

}

#endif
