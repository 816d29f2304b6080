#include <ReturnCode.hpp>

std::ostream &operator<<(std::ostream &os, ReturnCode rc)
{
    switch (rc)
    {
        case ReturnCode::Ok: os << "Ok"; break;
        case ReturnCode::Error: os << "Error"; break;
        case ReturnCode::InvalidSpan: os << "InvalidSpan"; break;
        case ReturnCode::Overflow: os << "Overflow"; break;
        case ReturnCode::Underflow: os << "Underflow"; break;
        case ReturnCode::OutOfBounds: os << "OutOfBounds"; break;
        case ReturnCode::InvalidUtf8: os << "InvalidUtf8"; break;
        case ReturnCode::InvalidArgument: os << "InvalidArgument"; break;
    }
    return os;
}
