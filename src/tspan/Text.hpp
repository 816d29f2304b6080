#ifndef HEADER_tspan_Text_hpp_ALREADY_INCLUDED
#define HEADER_tspan_Text_hpp_ALREADY_INCLUDED

#include <tspan/Span.hpp>

#include <ReturnCode.hpp>

#include <string_view>

namespace tspan {

    // Offsets are byte indices into text
    ReturnCode apply_bytes(std::string_view &dst, std::string_view text, const Span &span);

    // Offsets are UTF-8 code point indices into text
    ReturnCode apply_chars(std::string_view &dst, std::string_view text, const Span &span);

} // namespace tspan

#endif
