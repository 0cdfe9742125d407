#include <capped/basic_capped.codec.hpp>

#include <cstddef>
#include <cstdint>

#include <array>

#include <string>
#include <vector>

#include "../dp-test-utils.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

BOOST_AUTO_TEST_SUITE(basic_capped_codec_tests)

BOOST_AUTO_TEST_CASE(encodes_like_the_inner_value)
{
    auto const subject = capped::cap_u8string<5>::try_new(u8"hi"s).value();

    auto const cappedBytes = capped_tests::encode_to_bytes(subject);
    TEST_RESULT_REQUIRE(cappedBytes);
    auto const plain = capped_tests::encode_to_bytes(u8"hi"s);
    TEST_RESULT_REQUIRE(plain);

    BOOST_TEST(cappedBytes.assume_value() == plain.assume_value(),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(round_trip)
{
    auto const subject = capped::cap_vector<std::uint32_t, 4>::try_new(
                                 std::vector<std::uint32_t>{1, 300, 70000})
                                 .value();

    auto const encoded = capped_tests::encode_to_bytes(subject);
    TEST_RESULT_REQUIRE(encoded);

    capped::cap_vector<std::uint32_t, 4> decoded;
    TEST_RESULT_REQUIRE(
            capped_tests::decode_from_bytes(encoded.assume_value(), decoded));
    BOOST_TEST((decoded == subject));
}

BOOST_AUTO_TEST_CASE(decode_accepts_values_within_the_limit)
{
    auto const encoded = capped_tests::encode_to_bytes(u8"hi"s);
    TEST_RESULT_REQUIRE(encoded);

    capped::cap_u8string<5> decoded;
    TEST_RESULT_REQUIRE(
            capped_tests::decode_from_bytes(encoded.assume_value(), decoded));
    BOOST_TEST(decoded.size() == 2U);
    BOOST_TEST((decoded.view() == u8"hi"sv));
}

BOOST_AUTO_TEST_CASE(decode_rejects_oversized_values)
{
    auto const encoded = capped_tests::encode_to_bytes(u8"hello!"s);
    TEST_RESULT_REQUIRE(encoded);

    capped::cap_u8string<5> decoded;
    auto const rx
            = capped_tests::decode_from_bytes(encoded.assume_value(), decoded);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == capped::capped_errc::capacity_exceeded);
    BOOST_TEST(rx.assume_error() == capped::errc::value_too_large);
    BOOST_TEST(decoded.empty());
}

BOOST_AUTO_TEST_CASE(decode_into_dynamic_limit)
{
    auto const encoded = capped_tests::encode_to_bytes(
            std::vector<std::uint32_t>{1, 2, 3});
    TEST_RESULT_REQUIRE(encoded);

    capped::cap_vector<std::uint32_t> tooSmall(2U);
    auto const rx
            = capped_tests::decode_from_bytes(encoded.assume_value(), tooSmall);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == capped::capped_errc::capacity_exceeded);

    capped::cap_vector<std::uint32_t> largeEnough(3U);
    TEST_RESULT_REQUIRE(capped_tests::decode_from_bytes(encoded.assume_value(),
                                                        largeEnough));
    BOOST_TEST(largeEnough.size() == 3U);
    BOOST_TEST(largeEnough.capacity() == 3U);
}

BOOST_AUTO_TEST_CASE(text_round_trip)
{
    auto const subject
            = capped::cap_string<16>::try_new("hello world"s).value();

    auto const encoded = capped_tests::encode_to_bytes(subject);
    TEST_RESULT_REQUIRE(encoded);

    capped::cap_string<16> decoded;
    TEST_RESULT_REQUIRE(
            capped_tests::decode_from_bytes(encoded.assume_value(), decoded));
    BOOST_TEST(decoded == subject);
    BOOST_TEST(decoded.view() == "hello world"sv);
}

BOOST_AUTO_TEST_CASE(decode_text_into_capacity_five)
{
    auto const tooLong = capped_tests::encode_to_bytes("hello world"s);
    TEST_RESULT_REQUIRE(tooLong);

    capped::cap_string<5> decoded;
    auto const rx
            = capped_tests::decode_from_bytes(tooLong.assume_value(), decoded);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == capped::capped_errc::capacity_exceeded);

    auto const fits = capped_tests::encode_to_bytes("hi"s);
    TEST_RESULT_REQUIRE(fits);
    TEST_RESULT_REQUIRE(
            capped_tests::decode_from_bytes(fits.assume_value(), decoded));
    BOOST_TEST(decoded.size() == 2U);
    BOOST_TEST(decoded.view() == "hi"sv);
}

BOOST_AUTO_TEST_CASE(decode_rejects_announced_size_before_reading_content)
{
    // text string head announcing 0x7fff'ffff units, without any content
    std::array<std::byte, 5> const hugeText{std::byte{0x7A}, std::byte{0x7F},
                                            std::byte{0xFF}, std::byte{0xFF},
                                            std::byte{0xFF}};
    capped::cap_string<5> text;
    auto const textRx = capped_tests::decode_from_bytes(hugeText, text);
    BOOST_TEST_REQUIRE(textRx.has_error());
    BOOST_TEST(textRx.assume_error() == capped::capped_errc::capacity_exceeded);
    BOOST_TEST(text.empty());

    // array head announcing 0x7fff'ffff elements, without any content
    std::array<std::byte, 5> const hugeArray{std::byte{0x9A}, std::byte{0x7F},
                                             std::byte{0xFF}, std::byte{0xFF},
                                             std::byte{0xFF}};
    capped::cap_vector<std::uint32_t, 4> sequence;
    auto const arrayRx = capped_tests::decode_from_bytes(hugeArray, sequence);
    BOOST_TEST_REQUIRE(arrayRx.has_error());
    BOOST_TEST(arrayRx.assume_error()
               == capped::capped_errc::capacity_exceeded);
    BOOST_TEST(sequence.empty());
}

BOOST_AUTO_TEST_SUITE_END()
