#pragma once

#include <cstddef>

#include <compare>
#include <concepts>
#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <capped/capacity_traits.hpp>
#include <capped/disappointment.hpp>
#include <capped/utf8.hpp>

namespace capped
{

namespace detail
{

template <std::size_t Limit>
class limit_storage
{
public:
    constexpr limit_storage() noexcept = default;

    [[nodiscard]] static constexpr auto limit() noexcept -> std::size_t
    {
        return Limit;
    }
};

template <>
class limit_storage<dynamic_limit>
{
    std::size_t mLimit{0};

public:
    constexpr limit_storage() noexcept = default;
    explicit constexpr limit_storage(std::size_t limit) noexcept
        : mLimit(limit)
    {
    }

    [[nodiscard]] constexpr auto limit() const noexcept -> std::size_t
    {
        return mLimit;
    }
};

struct no_text_view
{
};

template <typename T>
struct text_view
{
    using type = no_text_view;
};
template <typename CharT, typename Traits, typename Allocator>
struct text_view<std::basic_string<CharT, Traits, Allocator>>
{
    using type = std::basic_string_view<CharT, Traits>;
};

template <typename T>
using text_view_t = typename text_view<T>::type;

} // namespace detail

/**
 * @brief A container whose size never exceeds a limit.
 *
 * The limit is either part of the type or, with Limit == dynamic_limit,
 * fixed during construction. Sizes are measured with
 * capacity_traits<T>::size_of(), i.e. in code units for strings and in
 * elements for sequences. Every operation which could grow the container
 * checks the limit upfront and leaves the instance untouched if it would
 * be exceeded; only the new_truncated*() factories shorten their input.
 */
template <cappable T, std::size_t Limit = dynamic_limit>
class basic_capped : private detail::limit_storage<Limit>
{
    using limit_base = detail::limit_storage<Limit>;
    using traits = capacity_traits<T>;

    template <cappable U, std::size_t OtherLimit>
    friend class basic_capped;

public:
    using inner_type = T;
    using value_type = typename T::value_type;
    using size_type = std::size_t;
    using reference = typename T::reference;
    using const_reference = typename T::const_reference;
    using iterator = typename T::iterator;
    using const_iterator = typename T::const_iterator;
    using view_type = detail::text_view_t<T>;

    static constexpr bool has_static_limit = Limit != dynamic_limit;
    static constexpr size_type static_limit = Limit;

private:
    T mInner;

    constexpr basic_capped(T &&inner, limit_base limit) noexcept(
            std::is_nothrow_move_constructible_v<T>)
        : limit_base(limit)
        , mInner(std::move(inner))
    {
    }

    static auto checked(T &&value, limit_base limit)
            -> capped_result<basic_capped>
    {
        auto const size = traits::size_of(value);
        if (size > limit.limit())
        {
            return capacity_exceeded{size, limit.limit()};
        }
        return basic_capped(std::move(value), limit);
    }

    static auto truncated(T &&value, limit_base limit) -> basic_capped
    {
        traits::truncate(value, limit.limit());
        return basic_capped(std::move(value), limit);
    }

    [[nodiscard]] auto check_growth(size_type addition) const noexcept
            -> capped_result<void>
    {
        if (addition > remaining())
        {
            constexpr auto max = std::numeric_limits<size_type>::max();
            auto const attempted
                    = addition > max - size() ? max : size() + addition;
            return capacity_exceeded{attempted, capacity()};
        }
        return oc::success();
    }

public:
    //! constructs an empty instance; a dynamic limit defaults to 0
    constexpr basic_capped() noexcept(
            std::is_nothrow_default_constructible_v<T>) = default;

    explicit constexpr basic_capped(size_type limit) noexcept(
            std::is_nothrow_default_constructible_v<T>)
        requires(!has_static_limit)
        : limit_base(limit)
        , mInner()
    {
    }

    //! widens a statically smaller limit, which can't fail
    template <std::size_t OtherLimit>
        requires(has_static_limit && OtherLimit < Limit)
    explicit constexpr basic_capped(basic_capped<T, OtherLimit> other) noexcept(
            std::is_nothrow_move_constructible_v<T>)
        : limit_base()
        , mInner(std::move(other.mInner))
    {
    }

    basic_capped(basic_capped const &) = default;
    basic_capped(basic_capped &&) noexcept(
            std::is_nothrow_move_constructible_v<T>) = default;
    auto operator=(basic_capped const &) -> basic_capped & = default;
    auto operator=(basic_capped &&) noexcept(
            std::is_nothrow_move_assignable_v<T>) -> basic_capped & = default;
    ~basic_capped() = default;

    [[nodiscard]] static auto try_new(T value) -> capped_result<basic_capped>
        requires has_static_limit
    {
        return checked(std::move(value), limit_base{});
    }
    [[nodiscard]] static auto try_new(T value, size_type limit)
            -> capped_result<basic_capped>
        requires(!has_static_limit)
    {
        return checked(std::move(value), limit_base{limit});
    }

    //! Shortens the value to the first Limit units if necessary. Text is
    //! cut at the unit boundary even if that splits a code point, see
    //! new_truncated_on_boundary().
    [[nodiscard]] static auto new_truncated(T value) -> basic_capped
        requires has_static_limit
    {
        return truncated(std::move(value), limit_base{});
    }
    [[nodiscard]] static auto new_truncated(T value, size_type limit)
            -> basic_capped
        requires(!has_static_limit)
    {
        return truncated(std::move(value), limit_base{limit});
    }

    //! Like new_truncated(), but backs off to the preceding code point
    //! boundary, i.e. valid UTF-8 stays valid.
    [[nodiscard]] static auto new_truncated_on_boundary(T value)
            -> basic_capped
        requires has_static_limit && utf8_text_container<T>
    {
        auto const cut = utf8::floor_boundary(view_type(value), Limit);
        traits::truncate(value, cut);
        return basic_capped(std::move(value), limit_base{});
    }
    [[nodiscard]] static auto new_truncated_on_boundary(T value,
                                                        size_type limit)
            -> basic_capped
        requires(!has_static_limit) && utf8_text_container<T>
    {
        auto const cut = utf8::floor_boundary(view_type(value), limit);
        traits::truncate(value, cut);
        return basic_capped(std::move(value), limit_base{limit});
    }

    //! re-checks a value bounded by another limit
    template <std::size_t OtherLimit>
    [[nodiscard]] static auto try_from(basic_capped<T, OtherLimit> const &other)
            -> capped_result<basic_capped>
        requires has_static_limit
    {
        return checked(T(other.mInner), limit_base{});
    }
    template <std::size_t OtherLimit>
    [[nodiscard]] static auto try_from(basic_capped<T, OtherLimit> const &other,
                                       size_type limit)
            -> capped_result<basic_capped>
        requires(!has_static_limit)
    {
        return checked(T(other.mInner), limit_base{limit});
    }

    auto try_set(T value) -> capped_result<void>
    {
        auto const size = traits::size_of(value);
        if (size > capacity())
        {
            return capacity_exceeded{size, capacity()};
        }
        mInner = std::move(value);
        return oc::success();
    }

    auto try_append(view_type addition) -> capped_result<void>
        requires text_container<T>
    {
        CAPPED_TRY(check_growth(addition.size()));
        mInner.append(addition);
        return oc::success();
    }

    template <std::ranges::sized_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>,
                                     value_type>
                 && (!text_container<T>
                     || !std::convertible_to<R, detail::text_view_t<T>>)
    auto try_append(R &&addition) -> capped_result<void>
    {
        CAPPED_TRY(check_growth(
                static_cast<size_type>(std::ranges::size(addition))));
        traits::append(mInner, std::forward<R>(addition));
        return oc::success();
    }

    auto try_push_back(value_type element) -> capped_result<void>
    {
        CAPPED_TRY(check_growth(1U));
        mInner.push_back(std::move(element));
        return oc::success();
    }

    //! Appends the UTF-8 encoding of cp. Invalid code points are replaced
    //! with U+FFFD.
    auto try_push_code_point(char32_t cp) -> capped_result<void>
        requires utf8_text_container<T>
    {
        auto const encoded = utf8::encode(cp);
        CAPPED_TRY(check_growth(encoded.size));
        for (std::size_t i = 0; i < encoded.size; ++i)
        {
            mInner.push_back(static_cast<value_type>(encoded.units[i]));
        }
        return oc::success();
    }

    void clear() noexcept
    {
        mInner.clear();
    }

    //! shrinks the value to size units, no effect if it already is smaller
    void truncate(size_type size)
    {
        traits::truncate(mInner, size);
    }

    auto pop_back() -> std::optional<value_type>
    {
        if (mInner.empty())
        {
            return std::nullopt;
        }
        std::optional<value_type> last{std::move(mInner.back())};
        mInner.pop_back();
        return last;
    }

    auto pop_code_point() -> std::optional<char32_t>
        requires utf8_text_container<T>
    {
        if (mInner.empty())
        {
            return std::nullopt;
        }
        auto const last = utf8::decode_last(view());
        traits::truncate(mInner, size() - last.size);
        return last.value;
    }

    [[nodiscard]] constexpr auto as_inner() const & noexcept -> T const &
    {
        return mInner;
    }
    [[nodiscard]] constexpr auto into_inner() && noexcept(
            std::is_nothrow_move_constructible_v<T>) -> T
    {
        return std::move(mInner);
    }
    [[nodiscard]] auto view() const noexcept -> view_type
        requires text_container<T>
    {
        return view_type(mInner);
    }

    [[nodiscard]] constexpr auto capacity() const noexcept -> size_type
    {
        return limit_base::limit();
    }
    [[nodiscard]] constexpr auto size() const noexcept -> size_type
    {
        return traits::size_of(mInner);
    }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool
    {
        return size() == 0U;
    }
    [[nodiscard]] constexpr auto remaining() const noexcept -> size_type
    {
        return capacity() - size();
    }

    auto operator[](size_type pos) noexcept -> reference
    {
        return mInner[pos];
    }
    auto operator[](size_type pos) const noexcept -> const_reference
    {
        return mInner[pos];
    }
    [[nodiscard]] auto data() const noexcept
        requires std::ranges::contiguous_range<T>
    {
        return mInner.data();
    }

    auto begin() noexcept -> iterator
    {
        return mInner.begin();
    }
    auto begin() const noexcept -> const_iterator
    {
        return mInner.begin();
    }
    auto cbegin() const noexcept -> const_iterator
    {
        return mInner.cbegin();
    }
    auto end() noexcept -> iterator
    {
        return mInner.end();
    }
    auto end() const noexcept -> const_iterator
    {
        return mInner.end();
    }
    auto cend() const noexcept -> const_iterator
    {
        return mInner.cend();
    }

    friend constexpr auto operator==(basic_capped const &lhs,
                                     basic_capped const &rhs) -> bool
        requires std::equality_comparable<T>
    {
        return lhs.mInner == rhs.mInner;
    }
    friend constexpr auto operator==(basic_capped const &lhs, T const &rhs)
            -> bool
        requires std::equality_comparable<T>
    {
        return lhs.mInner == rhs;
    }
    friend constexpr auto operator<=>(basic_capped const &lhs,
                                      basic_capped const &rhs)
        requires std::three_way_comparable<T>
    {
        return lhs.mInner <=> rhs.mInner;
    }
};

template <std::size_t Limit = dynamic_limit>
using cap_string = basic_capped<std::string, Limit>;

template <std::size_t Limit = dynamic_limit>
using cap_u8string = basic_capped<std::u8string, Limit>;

template <typename T, std::size_t Limit = dynamic_limit>
using cap_vector = basic_capped<std::vector<T>, Limit>;

template <typename Traits, typename Allocator, std::size_t Limit>
inline auto operator<<(
        std::ostream &s,
        basic_capped<std::basic_string<char, Traits, Allocator>, Limit> const
                &value) -> std::ostream &
{
    return s << std::string_view(value.data(), value.size());
}

} // namespace capped

namespace std
{
template <typename T, std::size_t Limit>
    requires requires(T const &value) { std::hash<T>{}(value); }
struct hash<capped::basic_capped<T, Limit>>
{
    auto operator()(capped::basic_capped<T, Limit> const &value) const
            noexcept(noexcept(std::hash<T>{}(value.as_inner())))
            -> std::size_t
    {
        return std::hash<T>{}(value.as_inner());
    }
};
} // namespace std

namespace fmt
{
template <typename Traits, typename Allocator, std::size_t Limit>
struct formatter<
        capped::basic_capped<std::basic_string<char, Traits, Allocator>, Limit>>
    : formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(capped::basic_capped<std::basic_string<char, Traits, Allocator>,
                                     Limit> const &value,
                FormatContext &ctx) const
    {
        return formatter<std::string_view>::format(
                std::string_view(value.data(), value.size()), ctx);
    }
};
} // namespace fmt
