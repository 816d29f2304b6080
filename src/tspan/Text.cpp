#include <tspan/Text.hpp>

#include <cstddef>
#include <cstdint>

namespace tspan {

    namespace {

        // Sequence length and allowed range of the second byte per RFC 3629,
        // which excludes overlong forms, surrogates and code points above U+10FFFF
        struct Lead
        {
            std::size_t size = 1;
            unsigned char second_min = 0x80;
            unsigned char second_max = 0xbf;
        };

        ReturnCode parse_lead(Lead &lead, unsigned char ch)
        {
            if (ch < 0x80)
                lead = Lead{.size = 1};
            else if (ch >= 0xc2 && ch <= 0xdf)
                lead = Lead{.size = 2};
            else if (ch == 0xe0)
                lead = Lead{.size = 3, .second_min = 0xa0};
            else if (ch == 0xed)
                lead = Lead{.size = 3, .second_max = 0x9f};
            else if (ch >= 0xe1 && ch <= 0xef)
                lead = Lead{.size = 3};
            else if (ch == 0xf0)
                lead = Lead{.size = 4, .second_min = 0x90};
            else if (ch == 0xf4)
                lead = Lead{.size = 4, .second_max = 0x8f};
            else if (ch >= 0xf1 && ch <= 0xf3)
                lead = Lead{.size = 4};
            else
                return ReturnCode::InvalidUtf8;
            return ReturnCode::Ok;
        }

        // Moves ix forward over count code points
        ReturnCode advance(std::size_t &ix, std::string_view text, std::uint64_t count)
        {
            for (; count > 0; --count)
            {
                if (ix >= text.size())
                    return ReturnCode::OutOfBounds;

                Lead lead;
                if (const auto rc = parse_lead(lead, static_cast<unsigned char>(text[ix])); rc != ReturnCode::Ok)
                    return rc;
                if (lead.size > text.size() - ix)
                    return ReturnCode::InvalidUtf8;
                if (lead.size > 1)
                {
                    const auto second = static_cast<unsigned char>(text[ix + 1]);
                    if (second < lead.second_min || second > lead.second_max)
                        return ReturnCode::InvalidUtf8;
                }
                for (std::size_t i = 2; i < lead.size; ++i)
                    if ((static_cast<unsigned char>(text[ix + i]) & 0xc0) != 0x80)
                        return ReturnCode::InvalidUtf8;

                ix += lead.size;
            }
            return ReturnCode::Ok;
        }

    } // namespace

    ReturnCode apply_bytes(std::string_view &dst, std::string_view text, const Span &span)
    {
        if (static_cast<std::uint64_t>(span.end()) > text.size())
            return ReturnCode::OutOfBounds;
        dst = text.substr(span.start(), span.len());
        return ReturnCode::Ok;
    }

    ReturnCode apply_chars(std::string_view &dst, std::string_view text, const Span &span)
    {
        std::size_t begin = 0;
        if (const auto rc = advance(begin, text, span.start()); rc != ReturnCode::Ok)
            return rc;

        std::size_t end = begin;
        if (const auto rc = advance(end, text, span.len()); rc != ReturnCode::Ok)
            return rc;

        dst = text.substr(begin, end - begin);
        return ReturnCode::Ok;
    }

} // namespace tspan
