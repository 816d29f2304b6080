#ifndef HEADER_cli_App_hpp_ALREADY_INCLUDED
#define HEADER_cli_App_hpp_ALREADY_INCLUDED

#include <cli/Options.hpp>

#include <tspan/Span.hpp>

#include <ReturnCode.hpp>

#include <cstddef>
#include <ostream>
#include <string>

namespace cli {

    class App
    {
    public:
        App(const Options &options, std::ostream &os)
            : options_(options), os_(os) {}

        ReturnCode run();

    private:
        ReturnCode expect_args_(std::size_t count) const;
        ReturnCode parse_value_(tspan::SpanValue &dst, const std::string &str) const;
        ReturnCode parse_delta_(tspan::Delta &dst, const std::string &str) const;
        // Span from the bounds at args[ix] and args[ix+1]
        ReturnCode parse_span_(tspan::Span &dst, std::size_t ix) const;

        ReturnCode info_() const;
        ReturnCode len_() const;
        ReturnCode union_() const;
        ReturnCode intersect_() const;
        ReturnCode overlaps_() const;
        ReturnCode contains_() const;
        ReturnCode translate_() const;
        ReturnCode show_() const;

        const Options &options_;
        std::ostream &os_;
    };

} // namespace cli

#endif
