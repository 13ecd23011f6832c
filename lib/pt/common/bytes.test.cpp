/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/common/bytes.hpp>
#include <pt/common/test.hpp>

using namespace packtrack;

suite bytes_suite = [] {
    "bytes"_test = [] {
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("00a1FF");
            test_same(size_t { 3 }, v.size());
            test_same(uint8_t { 0xA1 }, v[1]);
            test_same(uint8_t { 0xFF }, v[2]);
            expect(uint8_vector::from_hex("").empty());
            expect(throws<packtrack::error>([] { uint8_vector::from_hex("ABC"); }));
            expect(throws<packtrack::error>([] { uint8_vector::from_hex("0G"); }));
        };
        "network byte order"_test = [] {
            const auto v = uint8_vector::from_hex("0102030405060708");
            test_same(uint16_t { 0x0102 }, load_net<uint16_t>(v.data()));
            test_same(uint32_t { 0x01020304 }, load_net<uint32_t>(v.data()));
            test_same(uint64_t { 0x0102030405060708ULL }, load_net<uint64_t>(v.data()));
            uint8_vector out {};
            out << buffer::from(host_to_net(uint32_t { 0x01020304 }));
            test_same(uint8_vector::from_hex("01020304"), out);
        };
        "compare"_test = [] {
            const auto a = uint8_vector::from_hex("0102");
            const auto b = uint8_vector::from_hex("010203");
            expect(buffer { a } < buffer { b });
            expect(buffer { b } > buffer { a });
            expect(a == buffer { std::string_view { "\x01\x02" } });
            expect(buffer {} == buffer {});
        };
        "format"_test = [] {
            test_same(std::string { "DEADBEEF" }, fmt::format("{}", uint8_vector::from_hex("deadbeef")));
            test_same(std::string { "" }, fmt::format("{}", buffer {}));
        };
    };
};
