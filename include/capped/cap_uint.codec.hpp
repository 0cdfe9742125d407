#pragma once

#include <cstdint>

#include <dplx/dp/api.hpp>
#include <dplx/dp/codecs/core.hpp>
#include <dplx/dp/disappointment.hpp>
#include <dplx/dp/fwd.hpp>

#include <capped/cap_uint.hpp>

namespace dplx::dp
{

template <capped::unsigned_integer T, T N>
    requires(N > 0U)
class codec<capped::cap_uint<T, N>>
{
    using value_type = capped::cap_uint<T, N>;

public:
    static auto size_of(emit_context &ctx, value_type const &value) noexcept
            -> std::uint64_t
    {
        return dp::encoded_size_of(ctx, value.value());
    }
    static auto encode(emit_context &ctx, value_type const &value) noexcept
            -> result<void>
    {
        return dp::encode(ctx, value.value());
    }
    static auto decode(parse_context &ctx, value_type &value) noexcept
            -> result<void>
    {
        DPLX_TRY(auto const plain, dp::decode(as_value<T>, ctx));

        auto checked = value_type::try_new(plain);
        if (checked.has_error())
        {
            return capped::make_status_code(checked.assume_error());
        }
        value = checked.assume_value();
        return oc::success();
    }
};

} // namespace dplx::dp
