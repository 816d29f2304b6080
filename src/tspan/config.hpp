#ifndef HEADER_tspan_config_hpp_ALREADY_INCLUDED
#define HEADER_tspan_config_hpp_ALREADY_INCLUDED

#include <cstdint>

// Exactly one TSPAN_SPAN_VALUE_* must be defined, normally by the build system
#if defined(TSPAN_SPAN_VALUE_U8) + defined(TSPAN_SPAN_VALUE_U16) + defined(TSPAN_SPAN_VALUE_U32) + defined(TSPAN_SPAN_VALUE_U64) == 0
#error "tspan: no span value width selected, define one of TSPAN_SPAN_VALUE_U8, _U16, _U32 or _U64"
#endif
#if defined(TSPAN_SPAN_VALUE_U8) + defined(TSPAN_SPAN_VALUE_U16) + defined(TSPAN_SPAN_VALUE_U32) + defined(TSPAN_SPAN_VALUE_U64) > 1
#error "tspan: more than one span value width selected"
#endif

namespace tspan {

#if defined(TSPAN_SPAN_VALUE_U8)
    using SpanValue = std::uint8_t;
#elif defined(TSPAN_SPAN_VALUE_U16)
    using SpanValue = std::uint16_t;
#elif defined(TSPAN_SPAN_VALUE_U32)
    using SpanValue = std::uint32_t;
#elif defined(TSPAN_SPAN_VALUE_U64)
    using SpanValue = std::uint64_t;
#endif

} // namespace tspan

#endif
