#ifndef HEADER_tspan_Span_hpp_ALREADY_INCLUDED
#define HEADER_tspan_Span_hpp_ALREADY_INCLUDED

#include <tspan/Value.hpp>
#include <tspan/config.hpp>

#include <ReturnCode.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <optional>
#include <ostream>

namespace tspan {

    // Half-open interval [start, end) over offsets into some caller-owned text.
    // start <= end holds for every instance: the only way to set the bounds is through the
    // checked factories, which leave dst untouched on failure.
    template<std::unsigned_integral T>
    class BasicSpan
    {
    public:
        using Value = T;

        // Empty span at offset 0
        BasicSpan() = default;

        static ReturnCode from_bounds(BasicSpan &dst, T start, T end)
        {
            if (start > end)
                return ReturnCode::InvalidSpan;
            dst = BasicSpan{start, end};
            return ReturnCode::Ok;
        }

        static ReturnCode from_offset_len(BasicSpan &dst, T start, T len)
        {
            T end{};
            if (const auto rc = checked_add(end, start, len); rc != ReturnCode::Ok)
                return rc;
            dst = BasicSpan{start, end};
            return ReturnCode::Ok;
        }

        // Zero-width cursor at pos
        static BasicSpan at(T pos) { return BasicSpan{pos, pos}; }

        T start() const { return start_; }
        T end() const { return end_; }

        T len() const { return static_cast<T>(end_ - start_); }
        bool is_empty() const { return start_ == end_; }

        bool contains_offset(T pos) const { return start_ <= pos && pos < end_; }
        bool contains_span(const BasicSpan &other) const { return start_ <= other.start_ && other.end_ <= end_; }
        // Touching endpoints do not overlap
        bool overlaps(const BasicSpan &other) const { return start_ < other.end_ && other.start_ < end_; }

        // Smallest span enclosing both, also when they are disjoint
        BasicSpan union_with(const BasicSpan &other) const
        {
            return BasicSpan{std::min(start_, other.start_), std::max(end_, other.end_)};
        }

        // Touching spans intersect in an empty span at the touching point
        std::optional<BasicSpan> intersect(const BasicSpan &other) const
        {
            const T start = std::max(start_, other.start_);
            const T end = std::min(end_, other.end_);
            if (start > end)
                return std::nullopt;
            return BasicSpan{start, end};
        }

        ReturnCode translate(BasicSpan &dst, Delta delta) const
        {
            T start{}, end{};
            if (const auto rc = checked_shift(start, start_, delta); rc != ReturnCode::Ok)
                return rc;
            if (const auto rc = checked_shift(end, end_, delta); rc != ReturnCode::Ok)
                return rc;
            dst = BasicSpan{start, end};
            return ReturnCode::Ok;
        }

        // Moves end up by amount
        ReturnCode grow_front(BasicSpan &dst, T amount) const
        {
            T end{};
            if (const auto rc = checked_add(end, end_, amount); rc != ReturnCode::Ok)
                return rc;
            dst = BasicSpan{start_, end};
            return ReturnCode::Ok;
        }
        // Moves start back by amount
        ReturnCode grow_back(BasicSpan &dst, T amount) const
        {
            T start{};
            if (const auto rc = checked_sub(start, start_, amount); rc != ReturnCode::Ok)
                return rc;
            dst = BasicSpan{start, end_};
            return ReturnCode::Ok;
        }
        // Moves start up by amount
        ReturnCode shrink_back(BasicSpan &dst, T amount) const
        {
            if (amount > len())
                return ReturnCode::InvalidSpan;
            dst = BasicSpan{static_cast<T>(start_ + amount), end_};
            return ReturnCode::Ok;
        }
        // Moves end back by amount
        ReturnCode shrink_front(BasicSpan &dst, T amount) const
        {
            if (amount > len())
                return ReturnCode::InvalidSpan;
            dst = BasicSpan{start_, static_cast<T>(end_ - amount)};
            return ReturnCode::Ok;
        }

        bool operator==(const BasicSpan &) const = default;

        // Ordered only when both bounds agree, or when one of them is equal
        std::partial_ordering operator<=>(const BasicSpan &other) const
        {
            const auto s = start_ <=> other.start_;
            const auto e = end_ <=> other.end_;
            if (s == e || e == 0)
                return s;
            if (s == 0)
                return e;
            return std::partial_ordering::unordered;
        }

    private:
        BasicSpan(T start, T end): start_(start), end_(end) {}

        T start_{};
        T end_{};
    };

    // Returns span and collapses it to the empty span at its end,
    // so the next token can start accumulating from there
    template<std::unsigned_integral T>
    BasicSpan<T> reset(BasicSpan<T> &span)
    {
        const auto old = span;
        span = BasicSpan<T>::at(old.end());
        return old;
    }

    template<std::unsigned_integral T>
    std::ostream &operator<<(std::ostream &os, const BasicSpan<T> &span)
    {
        os << '[' << +span.start() << ", " << +span.end() << ')';
        return os;
    }

    using Span = BasicSpan<SpanValue>;

    extern template class BasicSpan<SpanValue>;

} // namespace tspan

#endif
