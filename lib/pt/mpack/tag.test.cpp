/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/common/test.hpp>
#include <pt/mpack/tag.hpp>

using namespace packtrack;
using namespace packtrack::mpack;

suite mpack_tag_suite = [] {
    "mpack::tag"_test = [] {
        "default is missing"_test = [] {
            const mpack::tag t {};
            expect(t.is_missing());
            test_same(type::missing, t.type());
            expect(t == mpack::tag::missing());
        };
        "accessors"_test = [] {
            test_same(true, mpack::tag::make_bool(true).as_bool());
            test_same(int64_t { -5 }, mpack::tag::make_int(-5).as_int());
            test_same(uint64_t { 240 }, mpack::tag::make_uint(240).as_uint());
            test_same(1.5F, mpack::tag::make_float(1.5F).as_float());
            test_same(2.25, mpack::tag::make_double(2.25).as_double());
            test_same(uint32_t { 3 }, mpack::tag::make_str(3).str_length());
            test_same(uint32_t { 4 }, mpack::tag::make_bin(4).bin_length());
            test_same(uint32_t { 5 }, mpack::tag::make_array(5).array_count());
            test_same(uint32_t { 6 }, mpack::tag::make_map(6).map_count());
            const auto ext = mpack::tag::make_ext(-1, 12);
            test_same(int8_t { -1 }, ext.ext_type());
            test_same(uint32_t { 12 }, ext.ext_length());
            expect(mpack::tag::make_nil().is_nil());
        };
        "mismatched accessor throws a type error"_test = [] {
            expect(throws<tag_type_error>([] { mpack::tag::make_uint(7).as_int(); }));
            expect(throws<tag_type_error>([] { mpack::tag::make_str(1).bin_length(); }));
            expect(throws<tag_type_error>([] { mpack::tag::missing().as_bool(); }));
            bool thrown = false;
            try {
                mpack::tag::make_nil().as_double();
            } catch (const tag_type_error &ex) {
                thrown = true;
                test_same(error_kind::type, ex.kind());
                test_same(std::string_view { "expected a double tag but got a nil tag" }, std::string_view { ex.what() });
            }
            expect(thrown);
        };
        "equality"_test = [] {
            expect(mpack::tag::make_uint(7) == mpack::tag::make_uint(7));
            expect(mpack::tag::make_uint(7) != mpack::tag::make_uint(8));
            expect(mpack::tag::make_uint(7) == mpack::tag::make_int(7));
            expect(mpack::tag::make_int(7) == mpack::tag::make_uint(7));
            expect(mpack::tag::make_int(-7) != mpack::tag::make_uint(7));
            expect(mpack::tag::make_str(3) != mpack::tag::make_bin(3));
            expect(mpack::tag::make_ext(1, 4) != mpack::tag::make_ext(2, 4));
            expect(mpack::tag::make_float(1.0F) != mpack::tag::make_double(1.0));
        };
        "frames"_test = [] {
            expect(!mpack::tag::make_uint(1).frame());
            expect(!mpack::tag::make_nil().is_compound());
            using fr = std::pair<frame_kind, uint64_t>;
            expect(mpack::tag::make_array(3).frame() == fr { frame_kind::array, 3 });
            expect(mpack::tag::make_map(3).frame() == fr { frame_kind::map, 6 });
            expect(mpack::tag::make_str(9).frame() == fr { frame_kind::str, 9 });
            expect(mpack::tag::make_bin(0).frame() == fr { frame_kind::bin, 0 });
            expect(mpack::tag::make_ext(5, 2).frame() == fr { frame_kind::ext, 2 });
        };
        "format"_test = [] {
            test_same(std::string { "nil" }, fmt::format("{}", mpack::tag::make_nil()));
            test_same(std::string { "true" }, fmt::format("{}", mpack::tag::make_bool(true)));
            test_same(std::string { "-3" }, fmt::format("{}", mpack::tag::make_int(-3)));
            test_same(std::string { "1.5f" }, fmt::format("{}", mpack::tag::make_float(1.5F)));
            test_same(std::string { "<str of 3 bytes>" }, fmt::format("{}", mpack::tag::make_str(3)));
            test_same(std::string { "<map of 2 pairs>" }, fmt::format("{}", mpack::tag::make_map(2)));
            test_same(std::string { "<ext 5 of 1 bytes>" }, fmt::format("{}", mpack::tag::make_ext(5, 1)));
            test_same(std::string { "missing" }, fmt::format("{}", mpack::tag::missing()));
        };
    };
};
