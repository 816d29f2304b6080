#include <tspan/Diag.hpp>

namespace tspan {

    static_assert(sizeof(std::size_t) >= sizeof(SpanValue), "std::size_t cannot hold every SpanValue");

    std::pair<std::size_t, std::size_t> to_external_range(const Span &span)
    {
        return {static_cast<std::size_t>(span.start()), static_cast<std::size_t>(span.end())};
    }

    namespace diag {

        std::ostream &operator<<(std::ostream &os, const Range &range)
        {
            if (!range.source.empty())
                os << range.source << ':';
            os << range.start << '-' << range.end;
            return os;
        }

        Range make_range(const Span &span, std::string source)
        {
            const auto [start, end] = to_external_range(span);
            return Range{.source = std::move(source), .start = start, .end = end};
        }

    } // namespace diag

} // namespace tspan
