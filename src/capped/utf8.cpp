#include <capped/utf8.hpp>

#include <cassert>

namespace capped::utf8
{

namespace
{

constexpr std::size_t max_sequence_length = 4U;

template <typename CharT>
constexpr auto unit(CharT c) noexcept -> char8_t
{
    return static_cast<char8_t>(c);
}

template <typename CharT>
auto floor_boundary_impl(std::basic_string_view<CharT> text,
                         std::size_t pos) noexcept -> std::size_t
{
    if (pos >= text.size())
    {
        return text.size();
    }
    auto boundary = pos;
    for (std::size_t i = 0; i < max_sequence_length - 1 && boundary > 0
                            && is_trail(unit(text[boundary]));
         ++i)
    {
        --boundary;
    }
    // more trail units than any sequence may have or the sequence ended
    // before pos, i.e. malformed input; cut at the unit
    if (is_trail(unit(text[boundary]))
        || sequence_length(unit(text[boundary])) <= pos - boundary)
    {
        return pos;
    }
    return boundary;
}

template <typename CharT>
auto decode_last_impl(std::basic_string_view<CharT> text) noexcept
        -> decoded_code_point
{
    assert(!text.empty());

    auto start = text.size() - 1;
    for (std::size_t i = 0;
         i < max_sequence_length - 1 && start > 0 && is_trail(unit(text[start]));
         ++i)
    {
        --start;
    }

    auto const length = text.size() - start;
    auto const lead = static_cast<char32_t>(unit(text[start]));
    if (sequence_length(unit(text[start])) != length)
    {
        return {replacement_character, 1U};
    }

    char32_t cp{};
    switch (length)
    {
    case 1U:
        return {lead, 1U};
    case 2U:
        cp = lead & 0x1FU;
        break;
    case 3U:
        cp = lead & 0x0FU;
        break;
    default:
        cp = lead & 0x07U;
        break;
    }
    for (auto i = start + 1; i < text.size(); ++i)
    {
        cp = (cp << 6) | (static_cast<char32_t>(unit(text[i])) & 0x3FU);
    }

    // overlong encodings and encoded surrogates are malformed
    if (encoded_length(cp) != length || !is_code_point_valid(cp))
    {
        return {replacement_character, 1U};
    }
    return {cp, length};
}

} // namespace

auto encode(char32_t cp) noexcept -> encoded_code_point
{
    if (!is_code_point_valid(cp))
    {
        cp = replacement_character;
    }

    encoded_code_point encoded{};
    encoded.size = encoded_length(cp);
    switch (encoded.size)
    {
    case 1U:
        encoded.units[0] = static_cast<char8_t>(cp);
        break;

    case 2U:
        encoded.units[0] = static_cast<char8_t>(0xC0U | (cp >> 6));
        encoded.units[1] = static_cast<char8_t>(0x80U | (cp & 0x3FU));
        break;

    case 3U:
        encoded.units[0] = static_cast<char8_t>(0xE0U | (cp >> 12));
        encoded.units[1] = static_cast<char8_t>(0x80U | ((cp >> 6) & 0x3FU));
        encoded.units[2] = static_cast<char8_t>(0x80U | (cp & 0x3FU));
        break;

    default:
        encoded.units[0] = static_cast<char8_t>(0xF0U | (cp >> 18));
        encoded.units[1] = static_cast<char8_t>(0x80U | ((cp >> 12) & 0x3FU));
        encoded.units[2] = static_cast<char8_t>(0x80U | ((cp >> 6) & 0x3FU));
        encoded.units[3] = static_cast<char8_t>(0x80U | (cp & 0x3FU));
        break;
    }
    return encoded;
}

auto floor_boundary(std::u8string_view text, std::size_t pos) noexcept
        -> std::size_t
{
    return floor_boundary_impl(text, pos);
}
auto floor_boundary(std::string_view text, std::size_t pos) noexcept
        -> std::size_t
{
    return floor_boundary_impl(text, pos);
}

auto decode_last(std::u8string_view text) noexcept -> decoded_code_point
{
    return decode_last_impl(text);
}
auto decode_last(std::string_view text) noexcept -> decoded_code_point
{
    return decode_last_impl(text);
}

} // namespace capped::utf8
