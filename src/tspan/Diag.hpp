#ifndef HEADER_tspan_Diag_hpp_ALREADY_INCLUDED
#define HEADER_tspan_Diag_hpp_ALREADY_INCLUDED

#ifndef TSPAN_WITH_DIAG
#error "tspan: the diagnostic interop adapter is disabled, configure with TSPAN_WITH_DIAG=ON"
#endif

#include <tspan/Span.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

namespace tspan {

    // [start, end) widened to the std::size_t pair diagnostic renderers index text with
    std::pair<std::size_t, std::size_t> to_external_range(const Span &span);

    namespace diag {

        // Region of interest as handed to a diagnostic renderer
        struct Range
        {
            std::string source;
            std::size_t start{};
            std::size_t end{};

            std::size_t size() const { return end - start; }

            bool operator==(const Range &) const = default;
        };
        std::ostream &operator<<(std::ostream &os, const Range &range);

        Range make_range(const Span &span, std::string source = {});

    } // namespace diag

} // namespace tspan

#endif
