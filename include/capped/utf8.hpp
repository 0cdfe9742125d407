#pragma once

#include <cstddef>
#include <cstdint>

#include <array>
#include <string_view>

namespace capped::utf8
{

inline constexpr char32_t code_point_max = 0x10FFFF;
inline constexpr char32_t replacement_character = 0xFFFD;

// high surrogates: 0xd800 - 0xdbff
// low surrogates:  0xdc00 - 0xdfff
inline constexpr char32_t surrogate_min = 0xD800;
inline constexpr char32_t surrogate_max = 0xDFFF;

constexpr auto is_trail(char8_t codeUnit) noexcept -> bool
{
    return static_cast<std::uint8_t>(codeUnit) >> 6 == 0x2;
}

//! the number of code units of the sequence introduced by the given lead
//! code unit, 0 if it can't start a sequence
constexpr auto sequence_length(char8_t leadUnit) noexcept -> std::size_t
{
    auto const lead = static_cast<std::uint8_t>(leadUnit);
    if (lead < 0x80U)
    {
        return 1U;
    }
    if (lead < 0xC0U)
    {
        return 0U;
    }
    if (lead < 0xE0U)
    {
        return 2U;
    }
    if (lead < 0xF0U)
    {
        return 3U;
    }
    if (lead < 0xF8U)
    {
        return 4U;
    }
    return 0U;
}

constexpr auto is_code_point_valid(char32_t cp) noexcept -> bool
{
    return cp <= code_point_max && !(surrogate_min <= cp && cp <= surrogate_max);
}

constexpr auto encoded_length(char32_t cp) noexcept -> std::size_t
{
    if (!is_code_point_valid(cp))
    {
        cp = replacement_character;
    }
    if (cp < 0x80U)
    {
        return 1U;
    }
    if (cp < 0x800U)
    {
        return 2U;
    }
    if (cp < 0x10000U)
    {
        return 3U;
    }
    return 4U;
}

struct encoded_code_point
{
    std::array<char8_t, 4> units;
    std::size_t size;

    [[nodiscard]] constexpr auto view() const noexcept -> std::u8string_view
    {
        return {units.data(), size};
    }
};

struct decoded_code_point
{
    char32_t value;
    std::size_t size;
};

//! Encodes the code point as UTF-8. Invalid code points (surrogates and
//! values beyond U+10FFFF) are encoded as U+FFFD.
auto encode(char32_t cp) noexcept -> encoded_code_point;

//! Returns the greatest position <= pos which doesn't point into the middle
//! of a multi unit sequence. Positions beyond the end yield text.size().
auto floor_boundary(std::u8string_view text, std::size_t pos) noexcept
        -> std::size_t;
auto floor_boundary(std::string_view text, std::size_t pos) noexcept
        -> std::size_t;

//! Decodes the last code point of a non empty text. A malformed tail is
//! reported as a one unit U+FFFD.
auto decode_last(std::u8string_view text) noexcept -> decoded_code_point;
auto decode_last(std::string_view text) noexcept -> decoded_code_point;

} // namespace capped::utf8
