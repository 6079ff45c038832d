#ifndef RELTIME_UNIT_VOCABULARY_HXX
#define RELTIME_UNIT_VOCABULARY_HXX

#include "time_unit.hxx"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace reltime {

/**
 * Case-insensitive mapping of unit aliases ("sec", "mins", "heure") to units.
 *
 * Keys are folded with UTF-8 aware lower-casing on both insertion and lookup,
 * so "ANNÉE" and "année" name the same entry. A fresh vocabulary holds the
 * English GNU date aliases.
 */
class UnitVocabulary
{
private:
  std::unordered_map<std::string, RelativeTimeUnit> mUnits;

  static auto fold(std::string_view) -> std::string;

public:
  UnitVocabulary();

  // Inserts or overwrites an alias.
  void set(std::string_view, RelativeTimeUnit);

  // Inserts the alias as Unknown when absent, like std::map::operator[].
  auto operator[](std::string_view) -> RelativeTimeUnit&;

  [[nodiscard]] auto find(std::string_view) const
    -> std::optional<RelativeTimeUnit>;

  // find(), then retried without a plural 's' suffix
  [[nodiscard]] auto resolve(std::string_view) const
    -> std::optional<RelativeTimeUnit>;

  [[nodiscard]] auto contains(std::string_view) const -> bool;

  [[nodiscard]] auto size() const -> std::size_t;

  [[nodiscard]] auto empty() const -> bool;

  void clear();

  void seed_defaults();
};

}

#endif
