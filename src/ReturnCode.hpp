#ifndef HEADER_ReturnCode_hpp_ALREADY_INCLUDED
#define HEADER_ReturnCode_hpp_ALREADY_INCLUDED

#include <ostream>

enum class ReturnCode
{
    Ok,
    Error,

    InvalidSpan,
    Overflow,
    Underflow,

    OutOfBounds,
    InvalidUtf8,

    InvalidArgument,
};
std::ostream &operator<<(std::ostream &os, ReturnCode rc);

#endif
