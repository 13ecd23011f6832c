/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_TAG_HPP
#define PACKTRACK_MPACK_TAG_HPP

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <pt/common/format.hpp>
#include <pt/mpack/error.hpp>
#include <pt/mpack/types.hpp>

namespace packtrack::mpack {
    /*
     * A decoded MessagePack object header. Compound tags (str, bin, array, map, ext) carry only
     * their length or element count; the payload is consumed by subsequent reads.
     * A tag never references the buffer it was decoded from.
     */
    struct tag {
        struct missing_t {
            bool operator==(const missing_t &) const =default;
        };

        struct nil_t {
            bool operator==(const nil_t &) const =default;
        };

        struct str_t {
            uint32_t len;
            bool operator==(const str_t &) const =default;
        };

        struct bin_t {
            uint32_t len;
            bool operator==(const bin_t &) const =default;
        };

        struct array_t {
            uint32_t count;
            bool operator==(const array_t &) const =default;
        };

        struct map_t {
            uint32_t count;
            bool operator==(const map_t &) const =default;
        };

        struct ext_t {
            int8_t type_id;
            uint32_t len;
            bool operator==(const ext_t &) const =default;
        };

        // the order of the alternatives must match the order of mpack::type
        using value_type = std::variant<missing_t, nil_t, bool, int64_t, uint64_t, float, double, str_t, bin_t, array_t, map_t, ext_t>;

        static tag missing() noexcept
        {
            return tag { value_type { std::in_place_type<missing_t> } };
        }

        static tag make_nil() noexcept
        {
            return tag { value_type { std::in_place_type<nil_t> } };
        }

        static tag make_bool(const bool v) noexcept
        {
            return tag { value_type { std::in_place_type<bool>, v } };
        }

        static tag make_int(const int64_t v) noexcept
        {
            return tag { value_type { std::in_place_type<int64_t>, v } };
        }

        static tag make_uint(const uint64_t v) noexcept
        {
            return tag { value_type { std::in_place_type<uint64_t>, v } };
        }

        static tag make_float(const float v) noexcept
        {
            return tag { value_type { std::in_place_type<float>, v } };
        }

        static tag make_double(const double v) noexcept
        {
            return tag { value_type { std::in_place_type<double>, v } };
        }

        static tag make_str(const uint32_t len) noexcept
        {
            return tag { value_type { std::in_place_type<str_t>, str_t { len } } };
        }

        static tag make_bin(const uint32_t len) noexcept
        {
            return tag { value_type { std::in_place_type<bin_t>, bin_t { len } } };
        }

        static tag make_array(const uint32_t count) noexcept
        {
            return tag { value_type { std::in_place_type<array_t>, array_t { count } } };
        }

        static tag make_map(const uint32_t count) noexcept
        {
            return tag { value_type { std::in_place_type<map_t>, map_t { count } } };
        }

        static tag make_ext(const int8_t type_id, const uint32_t len) noexcept
        {
            return tag { value_type { std::in_place_type<ext_t>, ext_t { type_id, len } } };
        }

        tag() noexcept =default;

        mpack::type type() const noexcept
        {
            return static_cast<mpack::type>(_val.index());
        }

        bool is_missing() const noexcept
        {
            return type() == mpack::type::missing;
        }

        bool is_nil() const noexcept
        {
            return type() == mpack::type::nil;
        }

        bool as_bool() const
        {
            return _get<mpack::type::boolean>();
        }

        int64_t as_int() const
        {
            return _get<mpack::type::int_>();
        }

        uint64_t as_uint() const
        {
            return _get<mpack::type::uint>();
        }

        float as_float() const
        {
            return _get<mpack::type::float32>();
        }

        double as_double() const
        {
            return _get<mpack::type::float64>();
        }

        uint32_t str_length() const
        {
            return _get<mpack::type::str>().len;
        }

        uint32_t bin_length() const
        {
            return _get<mpack::type::bin>().len;
        }

        uint32_t array_count() const
        {
            return _get<mpack::type::array>().count;
        }

        uint32_t map_count() const
        {
            return _get<mpack::type::map>().count;
        }

        int8_t ext_type() const
        {
            return _get<mpack::type::ext>().type_id;
        }

        uint32_t ext_length() const
        {
            return _get<mpack::type::ext>().len;
        }

        // the kind and the size of the tracking frame this tag opens, if any
        std::optional<std::pair<frame_kind, uint64_t>> frame() const noexcept
        {
            switch (type()) {
                case mpack::type::str: return std::make_pair(frame_kind::str, uint64_t { std::get<str_t>(_val).len });
                case mpack::type::bin: return std::make_pair(frame_kind::bin, uint64_t { std::get<bin_t>(_val).len });
                case mpack::type::ext: return std::make_pair(frame_kind::ext, uint64_t { std::get<ext_t>(_val).len });
                case mpack::type::array: return std::make_pair(frame_kind::array, uint64_t { std::get<array_t>(_val).count });
                case mpack::type::map: return std::make_pair(frame_kind::map, uint64_t { std::get<map_t>(_val).count } * 2);
                default: return {};
            }
        }

        bool is_compound() const noexcept
        {
            return frame().has_value();
        }

        const value_type &value() const noexcept
        {
            return _val;
        }

        // int and uint tags holding the same non-negative value are equal since encoders may choose either
        bool operator==(const tag &o) const noexcept
        {
            if (type() == mpack::type::int_ && o.type() == mpack::type::uint)
                return std::get<int64_t>(_val) >= 0 && static_cast<uint64_t>(std::get<int64_t>(_val)) == std::get<uint64_t>(o._val);
            if (type() == mpack::type::uint && o.type() == mpack::type::int_)
                return o == *this;
            return _val == o._val;
        }
    private:
        value_type _val { missing_t {} };

        explicit tag(value_type &&v) noexcept: _val { std::move(v) }
        {
        }

        template<mpack::type TYPE>
        const std::variant_alternative_t<static_cast<size_t>(TYPE), value_type> &_get() const
        {
            if (const auto *ptr = std::get_if<static_cast<size_t>(TYPE)>(&_val); ptr) [[likely]]
                return *ptr;
            throw tag_type_error(fmt::format("expected a {} tag but got a {} tag", type_name(TYPE), type_name(type())));
        }
    };
}

namespace fmt {
    template<>
    struct formatter<packtrack::mpack::tag>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using packtrack::mpack::type;
            switch (v.type()) {
                case type::missing: return fmt::format_to(ctx.out(), "missing");
                case type::nil: return fmt::format_to(ctx.out(), "nil");
                case type::boolean: return fmt::format_to(ctx.out(), "{}", v.as_bool());
                case type::int_: return fmt::format_to(ctx.out(), "{}", v.as_int());
                case type::uint: return fmt::format_to(ctx.out(), "{}", v.as_uint());
                case type::float32: return fmt::format_to(ctx.out(), "{}f", v.as_float());
                case type::float64: return fmt::format_to(ctx.out(), "{}", v.as_double());
                case type::str: return fmt::format_to(ctx.out(), "<str of {} bytes>", v.str_length());
                case type::bin: return fmt::format_to(ctx.out(), "<bin of {} bytes>", v.bin_length());
                case type::array: return fmt::format_to(ctx.out(), "<array of {} elements>", v.array_count());
                case type::map: return fmt::format_to(ctx.out(), "<map of {} pairs>", v.map_count());
                case type::ext: return fmt::format_to(ctx.out(), "<ext {} of {} bytes>", static_cast<int>(v.ext_type()), v.ext_length());
                default: return fmt::format_to(ctx.out(), "<unknown tag type {}>", static_cast<int>(v.type()));
            }
        }
    };
}

#endif // !PACKTRACK_MPACK_TAG_HPP
