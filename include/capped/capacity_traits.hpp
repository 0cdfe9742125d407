#pragma once

#include <cstddef>

#include <concepts>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace capped
{

inline constexpr std::size_t dynamic_limit = std::dynamic_extent;

namespace detail
{
template <typename T>
struct is_basic_string : std::false_type
{
};
template <typename CharT, typename Traits, typename Allocator>
struct is_basic_string<std::basic_string<CharT, Traits, Allocator>>
    : std::true_type
{
};
} // namespace detail

//! std::basic_string specializations; they are measured in storage units
//! (code units) and get the text specific operations.
template <typename T>
concept text_container = detail::is_basic_string<T>::value;

template <typename T>
concept utf8_text_container
        = text_container<T>
          && (std::same_as<typename T::value_type, char>
              || std::same_as<typename T::value_type, char8_t>)
          && std::same_as<typename T::traits_type,
                          std::char_traits<typename T::value_type>>;

//! The size metric and the primitive mutations of a wrapped container.
//!
//! Specialize this for containers which don't model the std container
//! interface. size_of() must be consistent with truncate() and append(),
//! i.e. truncate(v, n) yields size_of(v) == n for n <= size_of(v) and
//! append(v, r) adds exactly std::ranges::size(r) units.
template <typename T>
struct capacity_traits
{
    static constexpr auto size_of(T const &value) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::size(value));
    }

    static constexpr void truncate(T &value, std::size_t size)
    {
        if (size < size_of(value))
        {
            value.erase(
                    std::ranges::next(
                            value.begin(),
                            static_cast<std::ranges::range_difference_t<T>>(
                                    size)),
                    value.end());
        }
    }

    //! appends all or nothing, an exception thrown by an element leaves
    //! value as it was
    template <std::ranges::input_range R>
    static constexpr void append(T &value, R &&addition)
    {
        auto const before = size_of(value);
        if constexpr (std::ranges::sized_range<R>
                      && requires(T &v, std::size_t n) { v.reserve(n); })
        {
            value.reserve(before
                          + static_cast<std::size_t>(
                                  std::ranges::size(addition)));
        }
        try
        {
            if constexpr (std::ranges::common_range<R>)
            {
                value.insert(value.end(), std::ranges::begin(addition),
                             std::ranges::end(addition));
            }
            else
            {
                for (auto &&element : addition)
                {
                    value.push_back(
                            static_cast<decltype(element) &&>(element));
                }
            }
        }
        catch (...)
        {
            truncate(value, before);
            throw;
        }
    }
};

template <typename T>
concept cappable
        = std::ranges::sized_range<T> && std::default_initializable<T>
          && std::movable<T>
          && requires(T &value, T const &cvalue, std::size_t size) {
                 {
                     capacity_traits<T>::size_of(cvalue)
                 } -> std::same_as<std::size_t>;
                 capacity_traits<T>::truncate(value, size);
                 value.clear();
                 value.push_back(std::declval<typename T::value_type>());
                 value.pop_back();
             };

} // namespace capped
