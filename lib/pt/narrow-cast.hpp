/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_NARROW_CAST_HPP
#define PACKTRACK_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include <utility>
#include <pt/common/error.hpp>
#include <pt/common/format.hpp>

namespace packtrack {
    // an integer conversion that throws instead of silently changing the value
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is outside of [{}, {}]", typeid(FROM).name(), from,
                typeid(TO).name(), std::numeric_limits<TO>::min(), std::numeric_limits<TO>::max()));
        return static_cast<TO>(from);
    }
}

#endif // !PACKTRACK_NARROW_CAST_HPP
