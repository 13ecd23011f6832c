/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <array>
#include <limits>
#include <new>
#include <pt/narrow-cast.hpp>
#include <pt/mpack/reader.hpp>

namespace packtrack::mpack {
    uint64_t reader::expect_uint_range(const uint64_t min, const uint64_t max)
    {
        const auto t = read_tag();
        uint64_t val;
        switch (t.type()) {
            case type::uint:
                val = t.as_uint();
                break;
            case type::int_:
                if (t.as_int() < 0) [[unlikely]]
                    _fail(error_kind::type, fmt::format("expected an unsigned integer in [{}, {}] but got {}", min, max, t));
                val = static_cast<uint64_t>(t.as_int());
                break;
            [[unlikely]] default:
                _fail(error_kind::type, fmt::format("expected an unsigned integer but got {} tag", t.type()));
        }
        if (val < min || val > max) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected an unsigned integer in [{}, {}] but got {}", min, max, val));
        return val;
    }

    int64_t reader::expect_int_range(const int64_t min, const int64_t max)
    {
        const auto t = read_tag();
        int64_t val;
        switch (t.type()) {
            case type::int_:
                val = t.as_int();
                break;
            case type::uint:
                if (t.as_uint() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                    _fail(error_kind::type, fmt::format("expected an integer in [{}, {}] but got {}", min, max, t));
                val = static_cast<int64_t>(t.as_uint());
                break;
            [[unlikely]] default:
                _fail(error_kind::type, fmt::format("expected an integer but got {} tag", t.type()));
        }
        if (val < min || val > max) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected an integer in [{}, {}] but got {}", min, max, val));
        return val;
    }

    uint8_t reader::expect_u8()
    {
        return narrow_cast<uint8_t>(expect_uint_range(0, std::numeric_limits<uint8_t>::max()));
    }

    uint16_t reader::expect_u16()
    {
        return narrow_cast<uint16_t>(expect_uint_range(0, std::numeric_limits<uint16_t>::max()));
    }

    uint32_t reader::expect_u32()
    {
        return narrow_cast<uint32_t>(expect_uint_range(0, std::numeric_limits<uint32_t>::max()));
    }

    uint64_t reader::expect_u64()
    {
        return expect_uint_range(0, std::numeric_limits<uint64_t>::max());
    }

    int8_t reader::expect_i8()
    {
        return narrow_cast<int8_t>(expect_int_range(std::numeric_limits<int8_t>::min(), std::numeric_limits<int8_t>::max()));
    }

    int16_t reader::expect_i16()
    {
        return narrow_cast<int16_t>(expect_int_range(std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max()));
    }

    int32_t reader::expect_i32()
    {
        return narrow_cast<int32_t>(expect_int_range(std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));
    }

    int64_t reader::expect_i64()
    {
        return expect_int_range(std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max());
    }

    bool reader::expect_bool()
    {
        const auto t = read_tag();
        if (t.type() != type::boolean) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a bool but got {} tag", t.type()));
        return t.as_bool();
    }

    void reader::expect_nil()
    {
        const auto t = read_tag();
        if (t.type() != type::nil) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a nil but got {} tag", t.type()));
    }

    float reader::expect_float()
    {
        const auto t = read_tag();
        switch (t.type()) {
            case type::uint: return static_cast<float>(t.as_uint());
            case type::int_: return static_cast<float>(t.as_int());
            case type::float32: return t.as_float();
            case type::float64: return static_cast<float>(t.as_double());
            [[unlikely]] default:
                _fail(error_kind::type, fmt::format("expected a number but got {} tag", t.type()));
        }
    }

    double reader::expect_double()
    {
        const auto t = read_tag();
        switch (t.type()) {
            case type::uint: return static_cast<double>(t.as_uint());
            case type::int_: return static_cast<double>(t.as_int());
            case type::float32: return t.as_float();
            case type::float64: return t.as_double();
            [[unlikely]] default:
                _fail(error_kind::type, fmt::format("expected a number but got {} tag", t.type()));
        }
    }

    float reader::expect_float_strict()
    {
        const auto t = read_tag();
        if (t.type() != type::float32) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a float but got {} tag", t.type()));
        return t.as_float();
    }

    double reader::expect_double_strict()
    {
        const auto t = read_tag();
        switch (t.type()) {
            case type::float32: return t.as_float();
            case type::float64: return t.as_double();
            [[unlikely]] default:
                _fail(error_kind::type, fmt::format("expected a float or a double but got {} tag", t.type()));
        }
    }

    uint32_t reader::expect_map()
    {
        const auto t = read_tag();
        if (t.type() != type::map) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a map but got {} tag", t.type()));
        return t.map_count();
    }

    void reader::expect_map_match(const uint32_t count)
    {
        if (const auto act = expect_map(); act != count) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a map of {} pairs but got {}", count, act));
    }

    uint32_t reader::expect_map_max(const uint32_t max_count)
    {
        const auto act = expect_map();
        if (act > max_count) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a map of at most {} pairs but got {}", max_count, act));
        return act;
    }

    uint32_t reader::expect_array()
    {
        const auto t = read_tag();
        if (t.type() != type::array) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected an array but got {} tag", t.type()));
        return t.array_count();
    }

    void reader::expect_array_match(const uint32_t count)
    {
        if (const auto act = expect_array(); act != count) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected an array of {} elements but got {}", count, act));
    }

    uint32_t reader::expect_array_max(const uint32_t max_count)
    {
        const auto act = expect_array();
        if (act > max_count) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected an array of at most {} elements but got {}", max_count, act));
        return act;
    }

    uint32_t reader::expect_str_start()
    {
        const auto t = read_tag();
        if (t.type() != type::str) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a str but got {} tag", t.type()));
        return t.str_length();
    }

    uint32_t reader::expect_bin_start()
    {
        const auto t = read_tag();
        if (t.type() != type::bin) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a bin but got {} tag", t.type()));
        return t.bin_length();
    }

    void reader::expect_str_length(const uint32_t len)
    {
        if (const auto act = expect_str_start(); act != len) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a str of {} bytes but got {}", len, act));
    }

    void reader::expect_str_match(const std::string_view expected)
    {
        const auto len = expect_str_start();
        const std::string_view act = read_bytes_inplace(len);
        done_str();
        if (act != expected) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected a str '{}' but got '{}'", expected, act));
    }

    std::string_view reader::expect_str_buf(const write_buffer buf)
    {
        const auto len = expect_str_start();
        if (len > buf.size()) [[unlikely]] {
            skip_bytes(len);
            done_str();
            _fail(error_kind::type, fmt::format("a str of {} bytes does not fit into a buffer of {} bytes", len, buf.size()));
        }
        read_bytes_into(buf.subspan(0, len));
        done_str();
        return { reinterpret_cast<const char *>(buf.data()), len };
    }

    std::pmr::string reader::expect_str_alloc(const size_t max_len, std::pmr::memory_resource *mr)
    {
        const auto len = expect_str_start();
        if (len > max_len) [[unlikely]] {
            skip_bytes(len);
            done_str();
            _fail(error_kind::type, fmt::format("a str of {} bytes is longer than the limit of {}", len, max_len));
        }
        std::pmr::string res { mr };
        try {
            res.resize(len);
        } catch (const std::bad_alloc &) {
            _fail(error_kind::memory, fmt::format("failed to allocate {} bytes", len));
        }
        read_bytes_into(write_buffer { reinterpret_cast<uint8_t *>(res.data()), res.size() });
        done_str();
        return res;
    }

    std::pmr::vector<uint8_t> reader::expect_bin_alloc(const size_t max_len, std::pmr::memory_resource *mr)
    {
        const auto len = expect_bin_start();
        if (len > max_len) [[unlikely]] {
            skip_bytes(len);
            done_bin();
            _fail(error_kind::type, fmt::format("a bin of {} bytes is longer than the limit of {}", len, max_len));
        }
        auto res = read_bytes_alloc(len, mr);
        done_bin();
        return res;
    }

    size_t reader::expect_enum(const std::span<const std::string_view> names)
    {
        _check();
        size_t max_len = 0;
        for (const auto &n: names)
            max_len = std::max(max_len, n.size());
        if (max_len > max_enum_name) [[unlikely]]
            throw error(fmt::format("expect_enum supports names of up to {} bytes but a candidate has {}", max_enum_name, max_len));
        const auto len = expect_str_start();
        if (len > max_len) {
            skip_bytes(len);
            done_str();
            throw unexpected_name_error(fmt::format("a name of {} bytes is longer than any of the {} candidates", len, names.size()));
        }
        std::array<char, max_enum_name> name_buf;
        read_bytes_into(write_buffer { reinterpret_cast<uint8_t *>(name_buf.data()), len });
        done_str();
        const std::string_view name { name_buf.data(), len };
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name)
                return i;
        }
        throw unexpected_name_error(fmt::format("unexpected name '{}'", name));
    }

    void reader::expect_tag(const tag &expected)
    {
        if (const auto t = read_tag(); t != expected) [[unlikely]]
            _fail(error_kind::type, fmt::format("expected {} but got {}", expected, t));
    }
}
