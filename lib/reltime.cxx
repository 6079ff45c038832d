#include <fmt/format.h>
#include <reltime/reltime.hxx>
#include <reltime/version.hxx>

namespace reltime {

auto
project() -> const char*
{
  return build::NAME;
}

auto
version() -> std::string
{
  return fmt::format(
    "{}.{}.{}", build::VERSION_MAJOR, build::VERSION_MINOR, build::VERSION_PATCH);
}

auto
usage() -> std::string
{
  return fmt::format("{}-{}", project(), version());
}

}
