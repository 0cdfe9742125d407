#pragma once

#include <cstddef>
#include <cstdint>

#include <exception>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <boost/predef.h>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(push, 3)
#pragma warning(disable : 6285)
#endif

#include <outcome/bad_access.hpp>
#include <outcome/experimental/status_result.hpp>
#include <outcome/try.hpp>
#include <status-code/error.hpp>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(pop)
#endif

#include <capped/disappointment/errc.hpp>

namespace capped
{
namespace outcome = OUTCOME_V2_NAMESPACE;
namespace oc = OUTCOME_V2_NAMESPACE;

using oc::failure;
using oc::success;

//! A would-be value or mutation which does not fit into the capacity of a
//! capped container. attempted_size is measured with the size metric of the
//! wrapped container, i.e. the size the value would have had.
struct capacity_exceeded
{
    std::size_t attempted_size;
    std::size_t limit;

    friend constexpr auto operator==(capacity_exceeded const &,
                                     capacity_exceeded const &) noexcept
            -> bool = default;
};

//! An integer which doesn't lie within [0, bound).
struct range_exceeded
{
    std::uint64_t value;
    std::uint64_t bound;

    friend constexpr auto operator==(range_exceeded const &,
                                     range_exceeded const &) noexcept
            -> bool = default;
};

// the payloads are dropped during erasure, only the error kind survives
constexpr auto make_status_code(capacity_exceeded) noexcept -> capped_code
{
    return make_status_code(capped_errc::capacity_exceeded);
}
constexpr auto make_status_code(range_exceeded) noexcept -> capped_code
{
    return make_status_code(capped_errc::value_out_of_range);
}

class capacity_error final : public std::exception
{
public:
    capacity_error() = delete;
    explicit capacity_error(capacity_exceeded violation) noexcept;

    [[nodiscard]] auto violation() const noexcept -> capacity_exceeded const &
    {
        return mViolation;
    }

    auto what() const noexcept -> char const * override;

private:
    capacity_exceeded mViolation;
    mutable std::string mDesc;
};

inline capacity_error::capacity_error(capacity_exceeded violation) noexcept
    : mViolation{violation}
    , mDesc{}
{
}

class range_error final : public std::exception
{
public:
    range_error() = delete;
    explicit range_error(range_exceeded violation) noexcept;

    [[nodiscard]] auto violation() const noexcept -> range_exceeded const &
    {
        return mViolation;
    }

    auto what() const noexcept -> char const * override;

private:
    range_exceeded mViolation;
    mutable std::string mDesc;
};

inline range_error::range_error(range_exceeded violation) noexcept
    : mViolation{violation}
    , mDesc{}
{
}

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                // moving lvalues is expected in this case.
                // NOLINTNEXTLINE(bugprone-move-forwarding-reference)
                base::_error(std::move(self)).throw_exception();
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

//! Like result_no_value_policy, but for plain violation payloads which
//! can't throw themselves; wraps them into Exception instead.
template <typename Exception>
class violation_policy : public outcome::policy::base
{
public:
    using base::narrow_error_check;
    using base::narrow_value_check;

    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                throw Exception(base::_error(self));
            }
            throw outcome::bad_result_access("no value");
        }
    }

    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

} // namespace detail

template <typename R, typename E = system_error::error>
using result = oc::basic_result<R, E, detail::result_no_value_policy>;

template <typename R>
using capped_result
        = oc::basic_result<R,
                           capacity_exceeded,
                           detail::violation_policy<capacity_error>>;

template <typename R>
using bounded_result
        = oc::basic_result<R,
                           range_exceeded,
                           detail::violation_policy<range_error>>;

inline auto operator<<(std::ostream &s, capacity_exceeded const &v)
        -> std::ostream &
{
    return s << "{attempted_size: " << v.attempted_size
             << ", limit: " << v.limit << '}';
}
inline auto operator<<(std::ostream &s, range_exceeded const &v)
        -> std::ostream &
{
    return s << "{value: " << v.value << ", bound: " << v.bound << '}';
}

} // namespace capped

namespace fmt
{
template <>
struct formatter<capped::capacity_exceeded>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(capped::capacity_exceeded const &v, FormatContext &ctx) const
    {
        using namespace std::string_view_literals;
        return fmt::format_to(ctx.out(),
                              "capacity exceeded: size {} must be in range 0..={}"sv,
                              v.attempted_size, v.limit);
    }
};

template <>
struct formatter<capped::range_exceeded>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(capped::range_exceeded const &v, FormatContext &ctx) const
    {
        using namespace std::string_view_literals;
        return fmt::format_to(ctx.out(), "value {} is not in range 0..{}"sv,
                              v.value, v.bound);
    }
};
} // namespace fmt

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define CAPPED_TRY(...) OUTCOME_TRY(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
