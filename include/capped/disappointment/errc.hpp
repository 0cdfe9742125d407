#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <status-code/error.hpp>
#include <status-code/generic_code.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace capped
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

using errc = system_error::errc;

enum class capped_errc : int
{
    success = 0,
    capacity_exceeded = 1,
    value_out_of_range,
};

class capped_domain_type;
using capped_code = system_error::status_code<capped_domain_type>;

class capped_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "6C1E2B84-7A53-4E0F-9B6D-3F58A21C90D4";

    constexpr ~capped_domain_type() noexcept = default;
    constexpr capped_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr capped_domain_type(capped_domain_type const &) noexcept
            = default;
    constexpr auto operator=(capped_domain_type const &) noexcept
            -> capped_domain_type & = default;

    using value_type = capped_errc;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("capped-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(capped_domain_type *),
                std::max(alignof(value_type), alignof(capped_domain_type *))};
    }

    static constexpr auto get() noexcept -> capped_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<capped_code const &>(code).value()
               != capped_errc::success;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum capped_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case capacity_exceeded:
            return sys_errc::value_too_large;

        case value_out_of_range:
            return sys_errc::argument_out_of_domain;

        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum capped_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case success:
            return "success"sv;

        case capacity_exceeded:
            return "the value does not fit into the declared capacity"sv;

        case value_out_of_range:
            return "the value lies outside of the declared range"sv;

        default:
            return "unknown capped error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &clhs = static_cast<capped_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return clhs.value()
                   == static_cast<capped_code const &>(rhs).value();
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(clhs.value()) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<capped_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const cappedCode = static_cast<capped_code const &>(code);
        auto const message = map_to_message(cappedCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<capped_domain_type>(
                static_cast<capped_code const &>(code).clone());
    }
};
inline constexpr capped_domain_type capped_domain{};

constexpr auto capped_domain_type::get() noexcept
        -> capped_domain_type const &
{
    return capped_domain;
}

constexpr auto make_status_code(capped_errc c) noexcept -> capped_code
{
    return capped_code(system_error::in_place, c);
}

} // namespace capped

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
