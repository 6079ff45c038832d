#ifndef RELTIME_EXPRESSION_READER
#define RELTIME_EXPRESSION_READER

#include <reltime/time_token.hxx>
#include <reltime/unit_vocabulary.hxx>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace reltime {

/**
 * Left to right reader for
 *
 *   expression = occurrence { space occurrence }
 *   occurrence = [ sign ] [ digits ] [ space ] alias [ space "ago" ]
 *
 * over input that was already trimmed. read() yields every occurrence or,
 * at the first position that does not fit, nothing at all.
 */
class ExpressionReader
{
private:
  std::string_view mInput;
  std::string_view mSource;
  const UnitVocabulary& mUnits;
  std::size_t mPos = 0;
  std::size_t mFailedAt = 0;

  [[nodiscard]] auto at_end() const -> bool;

  [[nodiscard]] auto peek() const -> char;

  // Skips whitespace and reports whether any was skipped.
  auto skip_space() -> bool;

  // Maximal run of characters up to the next whitespace.
  auto read_word() -> std::string_view;

  auto read_sign() -> int;

  auto read_digits() -> std::optional<std::string_view>;

  auto read_ago() -> bool;

  auto read_occurrence() -> std::optional<TimeToken>;

public:
  static constexpr std::string_view AGO{ "ago" };

  ExpressionReader(std::string_view,     // trimmed input
                   std::string_view,     // source key
                   const UnitVocabulary& // aliases
  );

  auto read() -> std::vector<TimeToken>;

  // Offset of the first rejected character after a failed read().
  [[nodiscard]] auto failed_at() const -> std::size_t;
};

// Signed magnitude of one occurrence, or std::nullopt when it does not fit
// in 64 bits.
auto
signed_magnitude(std::string_view digits, int sign, bool ago)
  -> std::optional<int64_t>;

}

#endif
