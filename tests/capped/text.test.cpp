#include <capped/basic_capped.hpp>

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "../test-utils.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

BOOST_AUTO_TEST_SUITE(capped_text_tests)

BOOST_AUTO_TEST_CASE(size_is_measured_in_code_units)
{
    auto const subject = capped::cap_u8string<8>::try_new(u8"aé"s).value();
    BOOST_TEST(subject.size() == 3U);
    BOOST_TEST(subject.remaining() == 5U);
}

BOOST_AUTO_TEST_CASE(multi_unit_code_points_count_fully)
{
    // 'a' 'b' and a four unit emoji
    auto rx = capped::cap_u8string<3>::try_new(u8"ab\U0001F603"s);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == (capped::capacity_exceeded{6U, 3U}));
}

BOOST_AUTO_TEST_CASE(new_truncated_may_split_a_code_point)
{
    auto const subject
            = capped::cap_u8string<3>::new_truncated(u8"ab\U0001F603"s);
    BOOST_TEST_REQUIRE(subject.size() == 3U);
    BOOST_TEST((subject.view().substr(0, 2) == u8"ab"sv));
    BOOST_TEST(static_cast<unsigned>(subject[2]) == 0xF0U);
}

BOOST_AUTO_TEST_CASE(new_truncated_on_boundary_keeps_code_points_intact)
{
    auto const subject
            = capped::cap_u8string<3>::new_truncated_on_boundary(
                    u8"ab\U0001F603"s);
    BOOST_TEST((subject.view() == u8"ab"sv));
    BOOST_TEST(subject.capacity() == 3U);

    auto const exact = capped::cap_u8string<6>::new_truncated_on_boundary(
            u8"ab\U0001F603"s);
    BOOST_TEST((exact.view() == u8"ab\U0001F603"sv));

    auto const dynamic = capped::cap_string<>::new_truncated_on_boundary(
            "\xC3\xA9\xC3\xA9"s, 3U);
    BOOST_TEST(dynamic.view() == "\xC3\xA9"sv);
    BOOST_TEST(dynamic.capacity() == 3U);
}

BOOST_AUTO_TEST_CASE(try_push_code_point)
{
    capped::cap_u8string<5> subject;
    TEST_RESULT(subject.try_push_code_point(U'a'));
    TEST_RESULT(subject.try_push_code_point(U'é'));
    BOOST_TEST((subject.view() == u8"aé"sv));

    auto rx = subject.try_push_code_point(U'\U0001F603');
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == (capped::capacity_exceeded{7U, 5U}));
    BOOST_TEST(subject.size() == 3U);

    TEST_RESULT(subject.try_push_code_point(U'b'));
    BOOST_TEST(subject.size() == 4U);
}

BOOST_AUTO_TEST_CASE(try_push_code_point_replaces_invalid_code_points)
{
    capped::cap_string<8> subject;
    TEST_RESULT(subject.try_push_code_point(static_cast<char32_t>(0xD800)));
    BOOST_TEST(subject.view() == "\xEF\xBF\xBD"sv);
}

BOOST_AUTO_TEST_CASE(pop_code_point)
{
    auto subject = capped::cap_u8string<8>::try_new(u8"aé"s).value();

    auto const last = subject.pop_code_point();
    BOOST_TEST_REQUIRE(last.has_value());
    BOOST_TEST((*last == U'é'));
    BOOST_TEST((subject.view() == u8"a"sv));

    BOOST_TEST((subject.pop_code_point() == U'a'));
    BOOST_TEST(!subject.pop_code_point().has_value());
}

BOOST_AUTO_TEST_CASE(pop_code_point_of_malformed_tail)
{
    auto subject = capped::cap_string<8>::try_new("a\xC3"s).value();

    auto const last = subject.pop_code_point();
    BOOST_TEST_REQUIRE(last.has_value());
    BOOST_TEST((*last == capped::utf8::replacement_character));
    BOOST_TEST(subject.view() == "a"sv);
}

BOOST_AUTO_TEST_CASE(manipulate_text)
{
    auto subject = capped::cap_string<10>::try_new("Hello"s).value();

    TEST_RESULT(subject.try_append(", W"sv));
    BOOST_TEST(subject.view() == "Hello, W"sv);

    auto rx = subject.try_append("orld"sv);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(fmt::format("{}", rx.assume_error())
               == "capacity exceeded: size 12 must be in range 0..=10"s);
    BOOST_TEST(subject.view() == "Hello, W"sv);

    subject.truncate(5U);
    TEST_RESULT(subject.try_push_back('!'));
    BOOST_TEST(fmt::format("{}", subject) == "Hello!"s);
}

BOOST_AUTO_TEST_SUITE_END()
