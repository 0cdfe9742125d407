#pragma once

#include <capped/basic_capped.hpp>
#include <capped/cap_uint.hpp>
#include <capped/capacity_traits.hpp>
#include <capped/disappointment.hpp>
