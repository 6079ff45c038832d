#ifndef RELTIME_RELTIME_HXX
#define RELTIME_RELTIME_HXX

#include <string>

namespace reltime {

auto
project() -> const char*;

// MAJOR.MINOR.PATCH
auto
version() -> std::string;

// name-version, e.g. "reltime-1.0.0"
auto
usage() -> std::string;

}

#endif
