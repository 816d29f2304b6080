#include <cli/App.hpp>

#include <tspan/Text.hpp>
#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/macro/capture.hpp>
#include <rubr/mss.hpp>

#include <charconv>
#include <cstdint>
#include <string_view>

namespace cli {

    namespace log = util::log;

    ReturnCode App::run()
    {
        MSS_BEGIN(ReturnCode);

        MSS(!!options_.command, log::error() << "No command given, see '" << options_.exe_name << " --help'" << std::endl);

        switch (*options_.command)
        {
            case Command::Info: MSS(info_()); break;
            case Command::Len: MSS(len_()); break;
            case Command::Union: MSS(union_()); break;
            case Command::Intersect: MSS(intersect_()); break;
            case Command::Overlaps: MSS(overlaps_()); break;
            case Command::Contains: MSS(contains_()); break;
            case Command::Translate: MSS(translate_()); break;
            case Command::Show: MSS(show_()); break;
        }

        MSS_END();
    }

    ReturnCode App::expect_args_(std::size_t count) const
    {
        MSS_BEGIN(ReturnCode);
        const auto size = options_.args.size();
        MSS(size == count, log::error() << "Expected " << count << " arguments, got " << size << std::endl);
        MSS_END();
    }

    ReturnCode App::parse_value_(tspan::SpanValue &dst, const std::string &str) const
    {
        std::uint64_t value{};
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec == std::errc::result_out_of_range)
        {
            log::error() << "Offset '" << str << "' does not fit" << std::endl;
            return ReturnCode::Overflow;
        }
        if (ec != std::errc{} || ptr != str.data() + str.size())
        {
            log::error() << "Invalid offset '" << str << "'" << std::endl;
            return ReturnCode::InvalidArgument;
        }
        if (value > tspan::max_value<tspan::SpanValue>())
        {
            log::error() << "Offset " << value << " exceeds the configured maximum " << +tspan::max_value<tspan::SpanValue>() << std::endl;
            return ReturnCode::Overflow;
        }
        dst = static_cast<tspan::SpanValue>(value);
        return ReturnCode::Ok;
    }

    ReturnCode App::parse_delta_(tspan::Delta &dst, const std::string &str) const
    {
        MSS_BEGIN(ReturnCode);
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), dst);
        MSS(ec == std::errc{} && ptr == str.data() + str.size(), log::error() << "Invalid delta '" << str << "'" << std::endl);
        MSS_END();
    }

    ReturnCode App::parse_span_(tspan::Span &dst, std::size_t ix) const
    {
        MSS_BEGIN(ReturnCode);

        tspan::SpanValue start{}, end{};
        MSS(parse_value_(start, options_.args[ix]));
        MSS(parse_value_(end, options_.args[ix + 1]));

        const auto rc = tspan::Span::from_bounds(dst, start, end);
        MSS(rc == ReturnCode::Ok, log::error() << "Cannot create span from " << options_.args[ix] << " and " << options_.args[ix + 1] << ": " << rc << std::endl);
        log::debug() << C(dst) << std::endl;

        MSS_END();
    }

    ReturnCode App::info_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(2));

        tspan::Span span;
        MSS(parse_span_(span, 0));

        os_ << span << " len " << +span.len() << " empty " << std::boolalpha << span.is_empty() << std::endl;

        MSS_END();
    }

    ReturnCode App::len_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(2));

        tspan::SpanValue start{}, len{};
        MSS(parse_value_(start, options_.args[0]));
        MSS(parse_value_(len, options_.args[1]));

        tspan::Span span;
        const auto rc = tspan::Span::from_offset_len(span, start, len);
        MSS(rc == ReturnCode::Ok, log::error() << "Cannot create span at " << +start << " with length " << +len << ": " << rc << std::endl);

        os_ << span << std::endl;

        MSS_END();
    }

    ReturnCode App::union_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(4));

        tspan::Span a, b;
        MSS(parse_span_(a, 0));
        MSS(parse_span_(b, 2));

        os_ << a.union_with(b) << std::endl;

        MSS_END();
    }

    ReturnCode App::intersect_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(4));

        tspan::Span a, b;
        MSS(parse_span_(a, 0));
        MSS(parse_span_(b, 2));

        if (const auto intersection = a.intersect(b))
            os_ << *intersection << std::endl;
        else
            os_ << "none" << std::endl;

        MSS_END();
    }

    ReturnCode App::overlaps_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(4));

        tspan::Span a, b;
        MSS(parse_span_(a, 0));
        MSS(parse_span_(b, 2));

        os_ << std::boolalpha << a.overlaps(b) << std::endl;

        MSS_END();
    }

    ReturnCode App::contains_() const
    {
        MSS_BEGIN(ReturnCode);

        const auto size = options_.args.size();
        MSS(size == 3 || size == 4, log::error() << "Expected 3 or 4 arguments, got " << size << std::endl);

        tspan::Span span;
        MSS(parse_span_(span, 0));

        if (size == 3)
        {
            tspan::SpanValue pos{};
            MSS(parse_value_(pos, options_.args[2]));
            os_ << std::boolalpha << span.contains_offset(pos) << std::endl;
        }
        else
        {
            tspan::Span other;
            MSS(parse_span_(other, 2));
            os_ << std::boolalpha << span.contains_span(other) << std::endl;
        }

        MSS_END();
    }

    ReturnCode App::translate_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(3));

        tspan::Span span;
        MSS(parse_span_(span, 0));

        tspan::Delta delta{};
        MSS(parse_delta_(delta, options_.args[2]));

        tspan::Span shifted;
        const auto rc = span.translate(shifted, delta);
        MSS(rc == ReturnCode::Ok, log::error() << "Cannot translate " << span << " by " << delta << ": " << rc << std::endl);

        os_ << shifted << std::endl;

        MSS_END();
    }

    ReturnCode App::show_() const
    {
        MSS_BEGIN(ReturnCode);
        MSS(expect_args_(2));
        MSS(!!options_.filepath, log::error() << "Command 'show' needs a file, pass it with --file" << std::endl);

        tspan::Span span;
        MSS(parse_span_(span, 0));

        std::string content;
        MSS(rubr::fs::read(content, *options_.filepath), log::error() << "Could not read " << *options_.filepath << std::endl);
        log::debug() << C(content.size()) << std::endl;

        std::string_view text;
        const auto rc = options_.use_chars ? tspan::apply_chars(text, content, span) : tspan::apply_bytes(text, content, span);
        MSS(rc == ReturnCode::Ok, log::error() << "Cannot apply " << span << " to " << *options_.filepath << ": " << rc << std::endl);

        os_ << text << std::endl;

        MSS_END();
    }

} // namespace cli
