#ifndef RELTIME_EXCEPTIONS_HXX
#define RELTIME_EXCEPTIONS_HXX

#include <Poco/Exception.h>

namespace reltime {

// Raised by tokenize() when handed a null input reference.
POCO_DECLARE_EXCEPTION(, NullInputError, Poco::NullPointerException)

// Raised by apply() for an Unknown unit or an unparseable magnitude.
POCO_DECLARE_EXCEPTION(, FormatError, Poco::DataFormatException)

// Raised when a shifted timestamp leaves the representable range.
POCO_DECLARE_EXCEPTION(, TimeOverflowError, Poco::RangeException)

}

#endif
