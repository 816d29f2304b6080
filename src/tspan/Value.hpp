#ifndef HEADER_tspan_Value_hpp_ALREADY_INCLUDED
#define HEADER_tspan_Value_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <concepts>
#include <cstdint>
#include <limits>

namespace tspan {

    // Signed shift amount used by translate(), wide enough for every supported width
    using Delta = std::int64_t;

    template<std::unsigned_integral T>
    constexpr T zero_value() { return T{0}; }

    template<std::unsigned_integral T>
    constexpr T max_value() { return std::numeric_limits<T>::max(); }

    // dst is only written when a + b fits in T
    template<std::unsigned_integral T>
    ReturnCode checked_add(T &dst, T a, T b)
    {
        if (b > max_value<T>() - a)
            return ReturnCode::Overflow;
        dst = static_cast<T>(a + b);
        return ReturnCode::Ok;
    }

    // dst is only written when a - b stays at or above zero
    template<std::unsigned_integral T>
    ReturnCode checked_sub(T &dst, T a, T b)
    {
        if (b > a)
            return ReturnCode::Underflow;
        dst = static_cast<T>(a - b);
        return ReturnCode::Ok;
    }

    template<std::unsigned_integral T>
    ReturnCode checked_shift(T &dst, T value, Delta delta)
    {
        if (delta < 0)
        {
            // -(delta + 1) + 1 avoids negating the minimum of Delta
            const std::uint64_t magnitude = static_cast<std::uint64_t>(-(delta + 1)) + 1u;
            if (magnitude > value)
                return ReturnCode::Underflow;
            dst = static_cast<T>(value - magnitude);
            return ReturnCode::Ok;
        }

        const std::uint64_t magnitude = static_cast<std::uint64_t>(delta);
        if (magnitude > static_cast<std::uint64_t>(max_value<T>() - value))
            return ReturnCode::Overflow;
        dst = static_cast<T>(value + magnitude);
        return ReturnCode::Ok;
    }

} // namespace tspan

#endif
