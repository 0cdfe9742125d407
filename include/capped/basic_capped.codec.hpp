#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <utility>

#include <dplx/dp/api.hpp>
#include <dplx/dp/codecs/core.hpp>
#include <dplx/dp/codecs/std-container.hpp>
#include <dplx/dp/codecs/std-string.hpp>
#include <dplx/dp/disappointment.hpp>
#include <dplx/dp/fwd.hpp>
#include <dplx/dp/items/parse_core.hpp>
#include <dplx/dp/streams/memory_input_stream.hpp>

#include <capped/basic_capped.hpp>

namespace capped::detail
{

//! Inspects the buffered head of the next item without consuming it. A
//! definite length byte string, text string or array announcing more than
//! limit units is rejected before anything gets allocated. Everything else,
//! including a head which isn't fully buffered yet, is left to the decoder
//! of the wrapped type.
inline auto precheck_announced_size(dplx::dp::parse_context &ctx,
                                    std::size_t limit) noexcept
        -> dplx::dp::result<void>
{
    using namespace dplx;

    if (ctx.in.size() == 0U)
    {
        return oc::success();
    }
    std::span<std::byte const> buffered(ctx.in.data(), ctx.in.size());
    // NOLINTNEXTLINE(performance-move-const-arg)
    auto &&peekBuffer = dp::get_input_buffer(std::move(buffered));
    dp::parse_context peekCtx{peekBuffer};

    auto head = dp::parse_item_head(peekCtx);
    if (head.has_error() || head.assume_value().indefinite())
    {
        return oc::success();
    }
    auto const &info = head.assume_value();
    if ((info.type == dp::type_code::binary || info.type == dp::type_code::text
         || info.type == dp::type_code::array)
        && info.value > limit)
    {
        return make_status_code(capped_errc::capacity_exceeded);
    }
    return oc::success();
}

} // namespace capped::detail

namespace dplx::dp
{

// the wire representation is the one of the wrapped container, the limit is
// a property of the decoding side
template <typename T, std::size_t Limit>
class codec<capped::basic_capped<T, Limit>>
{
    using value_type = capped::basic_capped<T, Limit>;

public:
    static auto size_of(emit_context &ctx, value_type const &value) noexcept
            -> std::uint64_t
    {
        return dp::encoded_size_of(ctx, value.as_inner());
    }
    static auto encode(emit_context &ctx, value_type const &value) noexcept
            -> result<void>
    {
        return dp::encode(ctx, value.as_inner());
    }
    static auto decode(parse_context &ctx, value_type &value) noexcept
            -> result<void>
    {
        DPLX_TRY(capped::detail::precheck_announced_size(ctx,
                                                         value.capacity()));
        DPLX_TRY(auto &&plain, dp::decode(as_value<T>, ctx));

        // a dynamic limit is taken from the instance being decoded into
        auto checked = [&] {
            if constexpr (value_type::has_static_limit)
            {
                return value_type::try_new(std::move(plain));
            }
            else
            {
                return value_type::try_new(std::move(plain), value.capacity());
            }
        }();
        if (checked.has_error())
        {
            return capped::make_status_code(checked.assume_error());
        }
        value = std::move(checked).assume_value();
        return oc::success();
    }
};

} // namespace dplx::dp
