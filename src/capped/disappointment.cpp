#include <capped/disappointment.hpp>

#include <new>

namespace capped
{

namespace
{

template <typename Violation>
auto describe(std::string &desc,
              Violation const &violation,
              char const *fallback) noexcept -> char const *
{
    if (desc.empty())
    {
        try
        {
            desc = fmt::format("{}", violation);
        }
        catch (std::bad_alloc const &)
        {
            return fallback;
        }
    }
    return desc.c_str();
}

} // namespace

auto capacity_error::what() const noexcept -> char const *
{
    return describe(mDesc, mViolation, "capacity exceeded");
}

auto range_error::what() const noexcept -> char const *
{
    return describe(mDesc, mViolation, "value out of range");
}

} // namespace capped
