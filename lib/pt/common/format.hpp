/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_COMMON_FORMAT_HPP
#define PACKTRACK_COMMON_FORMAT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace packtrack {
    using fmt::format;
}

namespace fmt {
    // raw bytes are printed as uppercase hex without separators: DEADBEEF
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr std::string_view digits { "0123456789ABCDEF" };
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                *out_it++ = digits[v >> 4];
                *out_it++ = digits[v & 0xF];
            }
            return out_it;
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "<none>");
        }
    };
}

#endif // !PACKTRACK_COMMON_FORMAT_HPP
