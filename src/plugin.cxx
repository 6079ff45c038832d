#include <reltime/plugin.hxx>
#include <numeric>

namespace reltime {

auto
evaluate(const Plugin& plugin, std::string_view text, timestamp base)
  -> std::optional<timestamp>
{
  const auto tokens = plugin.tokenize(text);
  if (tokens.empty()) {
    return std::nullopt;
  }

  return std::accumulate(tokens.begin(),
                         tokens.end(),
                         base,
                         [&plugin](timestamp acc, const TimeToken& token) {
                           return plugin.apply(token, acc);
                         });
}

}
