/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_COMMON_BYTES_HPP
#define PACKTRACK_COMMON_BYTES_HPP

#include <algorithm>
#include <bit>
#include <compare>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace packtrack {
    typedef std::span<uint8_t> write_buffer;

    // MessagePack stores all multi-byte values in the big-endian (network) byte order
    template <typename T>
    constexpr T host_to_net(T value) noexcept
    {
        if constexpr (std::endian::native == std::endian::little) {
            auto *ptr = reinterpret_cast<uint8_t *>(&value);
            std::reverse(ptr, ptr + sizeof(T));
        }
        return value;
    }

    // the caller guarantees that at least sizeof(T) bytes are available at ptr
    template <typename T>
    T load_net(const uint8_t *ptr) noexcept
    {
        T value;
        memcpy(&value, ptr, sizeof(T));
        return host_to_net(value);
    }

    // a non-owning view of bytes, usually of the input being decoded
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size() * sizeof(T) }
        {
        }

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        buffer &operator=(const buffer &o) =default;

        // the object representation of a trivially copyable value
        template<typename M>
        static buffer from(const M &val)
        {
            return buffer { reinterpret_cast<const uint8_t *>(&val), sizeof(val) };
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            if (const auto min_sz = std::min(size(), o.size()); min_sz) {
                if (const auto cmp = memcmp(data(), o.data(), min_sz); cmp != 0)
                    return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return (*this <=> o) == std::strong_ordering::equal;
        }
    };

    // an owning byte vector: the output of the writer and the contents of files read whole
    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("a hex string must have an even number of characters but got {}", hex.size()));
            uint8_vector data(hex.size() / 2);
            for (size_t i = 0; i < data.size(); ++i)
                data[i] = _nibble(hex[i * 2]) << 4 | _nibble(hex[i * 2 + 1]);
            return data;
        }

        uint8_vector() =default;

        uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }
    private:
        static uint8_t _nibble(const char k)
        {
            if (k >= '0' && k <= '9')
                return k - '0';
            if (k >= 'A' && k <= 'F')
                return k - 'A' + 10;
            if (k >= 'a' && k <= 'f')
                return k - 'a' + 10;
            throw error(fmt::format("unexpected character in a hex string: '{}'", k));
        }
    };

    static_assert(std::is_convertible_v<uint8_vector, buffer>);

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.emplace_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<packtrack::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<packtrack::uint8_vector>: formatter<std::span<const uint8_t>> {
    };
}

#endif // !PACKTRACK_COMMON_BYTES_HPP
