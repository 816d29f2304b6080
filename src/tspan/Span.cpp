#include <tspan/Span.hpp>

namespace tspan {

    template class BasicSpan<SpanValue>;

} // namespace tspan
