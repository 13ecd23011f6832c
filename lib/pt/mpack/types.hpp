/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_TYPES_HPP
#define PACKTRACK_MPACK_TYPES_HPP

#include <cstdint>
#include <string_view>
#include <pt/common/format.hpp>

namespace packtrack::mpack {
    enum class type: uint8_t {
        missing,
        nil,
        boolean,
        int_,
        uint,
        float32,
        float64,
        str,
        bin,
        array,
        map,
        ext
    };

    enum class error_kind: uint8_t {
        ok,
        io,
        invalid,
        type,
        memory,
        other
    };

    // the kinds of open compound values
    enum class frame_kind: uint8_t {
        array,
        map,
        str,
        bin,
        ext
    };

    inline std::string_view type_name(const type t) noexcept
    {
        switch (t) {
            case type::missing: return "missing";
            case type::nil: return "nil";
            case type::boolean: return "bool";
            case type::int_: return "int";
            case type::uint: return "uint";
            case type::float32: return "float";
            case type::float64: return "double";
            case type::str: return "str";
            case type::bin: return "bin";
            case type::array: return "array";
            case type::map: return "map";
            case type::ext: return "ext";
            default: return "unknown";
        }
    }

    inline std::string_view error_kind_name(const error_kind k) noexcept
    {
        switch (k) {
            case error_kind::ok: return "ok";
            case error_kind::io: return "io";
            case error_kind::invalid: return "invalid";
            case error_kind::type: return "type";
            case error_kind::memory: return "memory";
            case error_kind::other: return "other";
            default: return "unknown";
        }
    }

    inline std::string_view frame_kind_name(const frame_kind k) noexcept
    {
        switch (k) {
            case frame_kind::array: return "array";
            case frame_kind::map: return "map";
            case frame_kind::str: return "str";
            case frame_kind::bin: return "bin";
            case frame_kind::ext: return "ext";
            default: return "unknown";
        }
    }

    inline bool frame_counts_bytes(const frame_kind k) noexcept
    {
        return k == frame_kind::str || k == frame_kind::bin || k == frame_kind::ext;
    }
}

namespace fmt {
    template<>
    struct formatter<packtrack::mpack::type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", packtrack::mpack::type_name(v));
        }
    };

    template<>
    struct formatter<packtrack::mpack::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", packtrack::mpack::error_kind_name(v));
        }
    };

    template<>
    struct formatter<packtrack::mpack::frame_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", packtrack::mpack::frame_kind_name(v));
        }
    };
}

#endif // !PACKTRACK_MPACK_TYPES_HPP
