#pragma once

#include <cstddef>
#include <cstdint>

#include <compare>
#include <concepts>
#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <capped/disappointment.hpp>

namespace capped
{

template <typename T, typename... Ts>
concept none_of = (!std::same_as<T, Ts> && ...);

template <typename T>
concept unsigned_integer = std::unsigned_integral<T>
                           && none_of<std::remove_cv_t<T>,
                                      bool,
                                      char,
                                      wchar_t,
                                      char8_t,
                                      char16_t,
                                      char32_t>;

/**
 * @brief An unsigned integer within [0, N).
 *
 * Construction either checks the range (try_new()) or reduces modulo N
 * (new_wrap()); the arithmetic wraps around N.
 */
template <unsigned_integer T, T N>
    requires(N > 0U)
class cap_uint
{
    T mValue{};

    explicit constexpr cap_uint(T value) noexcept
        : mValue(value)
    {
    }

public:
    using value_type = T;
    static constexpr value_type bound = N;

    constexpr cap_uint() noexcept = default;

    [[nodiscard]] static auto try_new(T value) noexcept
            -> bounded_result<cap_uint>
    {
        if (value >= N)
        {
            return range_exceeded{value, N};
        }
        return cap_uint(value);
    }
    //! other unsigned types are compared before narrowing
    template <unsigned_integer U>
        requires(!std::same_as<U, T>)
    [[nodiscard]] static auto try_new(U value) noexcept
            -> bounded_result<cap_uint>
    {
        if (std::cmp_greater_equal(value, N))
        {
            return range_exceeded{value, N};
        }
        return cap_uint(static_cast<T>(value));
    }
    template <std::signed_integral U>
    static auto try_new(U value) noexcept -> bounded_result<cap_uint>
            = delete;

    [[nodiscard]] static constexpr auto new_wrap(T value) noexcept -> cap_uint
    {
        return cap_uint(static_cast<T>(value % N));
    }
    template <unsigned_integer U>
        requires(!std::same_as<U, T>)
    [[nodiscard]] static constexpr auto new_wrap(U value) noexcept -> cap_uint
    {
        using common = std::common_type_t<U, T>;
        return cap_uint(static_cast<T>(static_cast<common>(value)
                                       % static_cast<common>(N)));
    }
    template <std::signed_integral U>
    static constexpr auto new_wrap(U value) noexcept -> cap_uint = delete;

    //! the bounds as a half open interval
    [[nodiscard]] static constexpr auto range() noexcept -> std::pair<T, T>
    {
        return {T{}, N};
    }

    [[nodiscard]] constexpr auto wrapping_add(T rhs) const noexcept -> cap_uint
    {
        auto const addend = static_cast<T>(rhs % N);
        // mValue + addend may overflow T
        auto const headroom = static_cast<T>(N - mValue);
        return cap_uint(addend >= headroom ? static_cast<T>(addend - headroom)
                                           : static_cast<T>(mValue + addend));
    }

    //! returns the current value and advances to the next one
    constexpr auto take_increment() noexcept -> cap_uint
    {
        auto const current = *this;
        *this = wrapping_add(1U);
        return current;
    }

    [[nodiscard]] constexpr auto value() const noexcept -> T
    {
        return mValue;
    }

    friend constexpr auto operator==(cap_uint, cap_uint) noexcept -> bool
            = default;
    friend constexpr auto operator<=>(cap_uint, cap_uint) noexcept
            = default;

    friend constexpr auto operator==(cap_uint lhs, T rhs) noexcept -> bool
    {
        return lhs.mValue == rhs;
    }
    friend constexpr auto operator<=>(cap_uint lhs, T rhs) noexcept
            -> std::strong_ordering
    {
        return lhs.mValue <=> rhs;
    }
};

template <std::uint8_t N>
using cap_u8 = cap_uint<std::uint8_t, N>;
template <std::uint16_t N>
using cap_u16 = cap_uint<std::uint16_t, N>;
template <std::uint32_t N>
using cap_u32 = cap_uint<std::uint32_t, N>;
template <std::uint64_t N>
using cap_u64 = cap_uint<std::uint64_t, N>;
template <std::size_t N>
using cap_usize = cap_uint<std::size_t, N>;

template <unsigned_integer T, T N>
    requires(N > 0U)
inline auto operator<<(std::ostream &s, cap_uint<T, N> const &value)
        -> std::ostream &
{
    // promote, otherwise std::uint8_t is printed as a character
    return s << +value.value();
}

} // namespace capped

namespace std
{
template <capped::unsigned_integer T, T N>
    requires(N > 0U)
struct hash<capped::cap_uint<T, N>>
{
    auto operator()(capped::cap_uint<T, N> const &value) const noexcept
            -> std::size_t
    {
        return std::hash<T>{}(value.value());
    }
};
} // namespace std

namespace fmt
{
template <capped::unsigned_integer T, T N>
    requires(N > 0U)
struct formatter<capped::cap_uint<T, N>> : formatter<T>
{
    template <typename FormatContext>
    auto format(capped::cap_uint<T, N> const &value, FormatContext &ctx) const
    {
        return formatter<T>::format(value.value(), ctx);
    }
};
} // namespace fmt
