#include <reltime/exceptions.hxx>
#include <typeinfo>

namespace reltime {

POCO_IMPLEMENT_EXCEPTION(NullInputError,
                         Poco::NullPointerException,
                         "Null input")

POCO_IMPLEMENT_EXCEPTION(FormatError,
                         Poco::DataFormatException,
                         "Unrecognized time format")

POCO_IMPLEMENT_EXCEPTION(TimeOverflowError,
                         Poco::RangeException,
                         "Time out of range")

}
