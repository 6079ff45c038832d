#ifndef RELTIME_PLUGIN_HXX
#define RELTIME_PLUGIN_HXX

#include "date_utils.hxx"
#include "time_token.hxx"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reltime {

/**
 * Contract between a host parser and one kind of time expression.
 *
 * tokenize() returns an empty sequence for input the plugin does not
 * recognize; apply() shifts a timestamp by a token the plugin produced.
 */
class Plugin
{
public:
  virtual ~Plugin() = default;

  [[nodiscard]] virtual auto key() const -> std::string_view = 0;

  [[nodiscard]] virtual auto tokenize(std::string_view) const
    -> std::vector<TimeToken> = 0;

  [[nodiscard]] virtual auto tokenize(const char*) const
    -> std::vector<TimeToken> = 0;

  [[nodiscard]] virtual auto apply(const TimeToken&, timestamp) const
    -> timestamp = 0;
};

// Tokenizes text and threads base through every token in order.
// Returns std::nullopt when nothing was recognized.
auto
evaluate(const Plugin&, std::string_view, timestamp)
  -> std::optional<timestamp>;

}

#endif
