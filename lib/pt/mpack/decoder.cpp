/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <bit>
#include <pt/mpack/decoder.hpp>

namespace packtrack::mpack {
    size_t header_size(const uint8_t prefix) noexcept
    {
        if (prefix <= 0xBF || prefix >= 0xE0)
            return 1;
        switch (prefix) {
            case 0xC0: return 1;
            case 0xC1: return 0;
            case 0xC2: return 1;
            case 0xC3: return 1;
            case 0xC4: return 2;
            case 0xC5: return 3;
            case 0xC6: return 5;
            case 0xC7: return 3;
            case 0xC8: return 4;
            case 0xC9: return 6;
            case 0xCA: return 5;
            case 0xCB: return 9;
            case 0xCC: return 2;
            case 0xCD: return 3;
            case 0xCE: return 5;
            case 0xCF: return 9;
            case 0xD0: return 2;
            case 0xD1: return 3;
            case 0xD2: return 5;
            case 0xD3: return 9;
            case 0xD4:
            case 0xD5:
            case 0xD6:
            case 0xD7:
            case 0xD8:
                return 2;
            case 0xD9: return 2;
            case 0xDA: return 3;
            case 0xDB: return 5;
            case 0xDC: return 3;
            case 0xDD: return 5;
            case 0xDE: return 3;
            case 0xDF: return 5;
            [[unlikely]] default: return 0;
        }
    }

    decode_result decode_tag(const buffer avail) noexcept
    {
        if (avail.empty()) [[unlikely]]
            return { tag::missing(), 0, error_kind::io };
        const uint8_t *p = avail.data();
        const auto hdr_sz = header_size(p[0]);
        if (hdr_sz == 0) [[unlikely]]
            return { tag::missing(), 0, error_kind::invalid };
        if (avail.size() < hdr_sz) [[unlikely]]
            return { tag::missing(), 0, error_kind::io };
        if (p[0] <= 0x7F)
            return { tag::make_uint(p[0]), 1 };
        if (p[0] <= 0x8F)
            return { tag::make_map(p[0] & 0x0F), 1 };
        if (p[0] <= 0x9F)
            return { tag::make_array(p[0] & 0x0F), 1 };
        if (p[0] <= 0xBF)
            return { tag::make_str(p[0] & 0x1F), 1 };
        if (p[0] >= 0xE0)
            return { tag::make_int(static_cast<int8_t>(p[0])), 1 };
        switch (p[0]) {
            case 0xC0: return { tag::make_nil(), hdr_sz };
            case 0xC2: return { tag::make_bool(false), hdr_sz };
            case 0xC3: return { tag::make_bool(true), hdr_sz };
            case 0xC4: return { tag::make_bin(p[1]), hdr_sz };
            case 0xC5: return { tag::make_bin(load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xC6: return { tag::make_bin(load_net<uint32_t>(p + 1)), hdr_sz };
            case 0xC7: return { tag::make_ext(static_cast<int8_t>(p[2]), p[1]), hdr_sz };
            case 0xC8: return { tag::make_ext(static_cast<int8_t>(p[3]), load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xC9: return { tag::make_ext(static_cast<int8_t>(p[5]), load_net<uint32_t>(p + 1)), hdr_sz };
            case 0xCA: return { tag::make_float(std::bit_cast<float>(load_net<uint32_t>(p + 1))), hdr_sz };
            case 0xCB: return { tag::make_double(std::bit_cast<double>(load_net<uint64_t>(p + 1))), hdr_sz };
            case 0xCC: return { tag::make_uint(p[1]), hdr_sz };
            case 0xCD: return { tag::make_uint(load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xCE: return { tag::make_uint(load_net<uint32_t>(p + 1)), hdr_sz };
            case 0xCF: return { tag::make_uint(load_net<uint64_t>(p + 1)), hdr_sz };
            case 0xD0: return { tag::make_int(static_cast<int8_t>(p[1])), hdr_sz };
            case 0xD1: return { tag::make_int(static_cast<int16_t>(load_net<uint16_t>(p + 1))), hdr_sz };
            case 0xD2: return { tag::make_int(static_cast<int32_t>(load_net<uint32_t>(p + 1))), hdr_sz };
            case 0xD3: return { tag::make_int(static_cast<int64_t>(load_net<uint64_t>(p + 1))), hdr_sz };
            case 0xD4: return { tag::make_ext(static_cast<int8_t>(p[1]), 1), hdr_sz };
            case 0xD5: return { tag::make_ext(static_cast<int8_t>(p[1]), 2), hdr_sz };
            case 0xD6: return { tag::make_ext(static_cast<int8_t>(p[1]), 4), hdr_sz };
            case 0xD7: return { tag::make_ext(static_cast<int8_t>(p[1]), 8), hdr_sz };
            case 0xD8: return { tag::make_ext(static_cast<int8_t>(p[1]), 16), hdr_sz };
            case 0xD9: return { tag::make_str(p[1]), hdr_sz };
            case 0xDA: return { tag::make_str(load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xDB: return { tag::make_str(load_net<uint32_t>(p + 1)), hdr_sz };
            case 0xDC: return { tag::make_array(load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xDD: return { tag::make_array(load_net<uint32_t>(p + 1)), hdr_sz };
            case 0xDE: return { tag::make_map(load_net<uint16_t>(p + 1)), hdr_sz };
            case 0xDF: return { tag::make_map(load_net<uint32_t>(p + 1)), hdr_sz };
            [[unlikely]] default:
                return { tag::missing(), 0, error_kind::invalid };
        }
    }
}
