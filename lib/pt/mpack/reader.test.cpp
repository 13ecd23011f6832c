/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <array>
#include <memory_resource>
#include <pt/common/test.hpp>
#include <pt/mpack/reader.hpp>

using namespace packtrack;
using namespace packtrack::mpack;

namespace {
    const reader_config tracked { .read_tracking = true, .strict_debug_asserts = false, .max_depth = 1024 };
    const reader_config strict { .read_tracking = true, .strict_debug_asserts = true, .max_depth = 1024 };
    const reader_config untracked { .read_tracking = false, .strict_debug_asserts = false, .max_depth = 1024 };
}

suite mpack_reader_suite = [] {
    "mpack::reader"_test = [] {
        "scalars"_test = [] {
            const auto bytes = uint8_vector::from_hex("07CCF0C0C3");
            reader r { bytes, tracked };
            test_same(mpack::tag::make_uint(7), r.read_tag());
            test_same(mpack::tag::make_uint(240), r.read_tag());
            expect(r.read_tag().is_nil());
            expect(r.read_tag().as_bool());
            expect(r.done());
            test_same(size_t { 5 }, r.position());
            test_same(size_t { 0 }, r.remaining());
            expect(nothrow([&] { r.destroy(); }));
        };
        "peek does not advance"_test = [] {
            const auto bytes = uint8_vector::from_hex("CCF0");
            reader r { bytes, tracked };
            test_same(mpack::tag::make_uint(240), r.peek_tag());
            test_same(size_t { 0 }, r.position());
            test_same(mpack::tag::make_uint(240), r.read_tag());
            test_same(size_t { 2 }, r.position());
        };
        "str"_test = [] {
            const auto bytes = uint8_vector::from_hex("A3616263");
            reader r { bytes, tracked };
            test_same(uint32_t { 3 }, r.read_tag().str_length());
            std::array<uint8_t, 3> dst {};
            r.read_bytes_into(dst);
            test_same(std::string_view { "abc" }, std::string_view { reinterpret_cast<const char *>(dst.data()), dst.size() });
            r.done_str();
            expect(r.done());
            r.destroy();
        };
        "bytes in place"_test = [] {
            const auto bytes = uint8_vector::from_hex("C403010203D4010A");
            reader r { bytes, tracked };
            test_same(uint32_t { 3 }, r.read_tag().bin_length());
            test_same(uint8_vector::from_hex("0102"), uint8_vector { r.read_bytes_inplace(2) });
            test_same(uint8_vector::from_hex("03"), uint8_vector { r.read_bytes_inplace(1) });
            r.done_bin();
            const auto ext = r.read_tag();
            test_same(int8_t { 1 }, ext.ext_type());
            test_same(uint8_vector::from_hex("0A"), uint8_vector { r.read_bytes_inplace(ext.ext_length()) });
            r.done_ext();
            r.destroy();
        };
        "utf8"_test = [] {
            {
                const auto bytes = uint8_vector::from_hex("A4D0BFD18F");
                reader r { bytes, tracked };
                const auto len = r.read_tag().str_length();
                test_same(std::string_view { "\xD0\xBF\xD1\x8F" }, r.read_utf8_inplace(len));
                r.done_str();
                r.destroy();
            }
            {
                const auto bytes = uint8_vector::from_hex("A2C328");
                reader r { bytes, tracked };
                const auto len = r.read_tag().str_length();
                expect_reader_error(error_kind::invalid, [&] { r.read_utf8_inplace(len); });
            }
        };
        "bytes alloc"_test = [] {
            const auto bytes = uint8_vector::from_hex("C403010203");
            {
                std::array<std::byte, 256> storage {};
                std::pmr::monotonic_buffer_resource mr { storage.data(), storage.size() };
                reader r { bytes, tracked };
                const auto len = r.read_tag().bin_length();
                const auto data = r.read_bytes_alloc(len, &mr);
                test_same(size_t { 3 }, data.size());
                test_same(uint8_t { 3 }, data.at(2));
                r.done_bin();
                r.destroy();
            }
            {
                reader r { bytes, tracked };
                const auto len = r.read_tag().bin_length();
                expect_reader_error(error_kind::memory, [&] { r.read_bytes_alloc(len, std::pmr::null_memory_resource()); });
                test_same(error_kind::memory, r.error_info());
            }
        };
        "truncated payload"_test = [] {
            const auto bytes = uint8_vector::from_hex("A5616263");
            reader r { bytes, tracked };
            expect_reader_error(error_kind::io, [&] { r.read_tag(); });
            test_same(size_t { 0 }, r.position());
        };
        "truncated header"_test = [] {
            const auto bytes = uint8_vector::from_hex("CD01");
            reader r { bytes, tracked };
            expect_reader_error(error_kind::io, [&] { r.read_tag(); });
        };
        "reading past the end"_test = [] {
            const auto bytes = uint8_vector::from_hex("01");
            reader r { bytes, tracked };
            r.read_tag();
            expect_reader_error(error_kind::io, [&] { r.read_tag(); });
        };
        "reserved byte"_test = [] {
            const auto bytes = uint8_vector::from_hex("C1");
            reader r { bytes, tracked };
            expect_reader_error(error_kind::invalid, [&] { r.read_tag(); });
        };
        "faulted state is sticky"_test = [] {
            const auto bytes = uint8_vector::from_hex("07C10708");
            reader r { bytes, tracked };
            test_same(uint8_t { 7 }, r.expect_u8());
            expect_reader_error(error_kind::invalid, [&] { r.read_tag(); });
            const auto pos = r.position();
            for (size_t i = 0; i < 3; ++i) {
                expect_reader_error(error_kind::invalid, [&] { r.read_tag(); });
                expect_reader_error(error_kind::invalid, [&] { r.expect_u8(); });
                expect_reader_error(error_kind::invalid, [&] { r.skip_bytes(1); });
                test_same(pos, r.position());
            }
            expect(r.peek_tag().is_missing());
            test_same(error_kind::invalid, r.error_info());
            expect(!r.ok());
            r.flag_error(error_kind::io);
            test_same(error_kind::invalid, r.error_info());
            expect_reader_error(error_kind::invalid, [&] { r.destroy(); });
        };
        "peek latches malformed headers"_test = [] {
            const auto bytes = uint8_vector::from_hex("C1");
            reader r { bytes, tracked };
            expect(r.peek_tag().is_missing());
            test_same(error_kind::invalid, r.error_info());
        };
        "flag_error"_test = [] {
            const auto bytes = uint8_vector::from_hex("07");
            reader r { bytes, tracked };
            r.flag_error(error_kind::ok);
            expect(r.ok());
            r.flag_error(error_kind::other);
            expect_reader_error(error_kind::other, [&] { r.read_tag(); });
            test_same(size_t { 0 }, r.position());
        };
        "map read partially"_test = [] {
            const auto bytes = uint8_vector::from_hex("81A16101");
            {
                reader r { bytes, tracked };
                test_same(uint32_t { 1 }, r.read_tag().map_count());
                const auto key_len = r.read_tag().str_length();
                r.skip_bytes(key_len);
                r.done_str();
                expect_reader_error(error_kind::invalid, [&] { r.done_map(); });
            }
            {
                reader r { bytes, strict };
                r.read_tag();
                r.skip_bytes(r.read_tag().str_length());
                r.done_str();
                expect_reader_error(error_kind::other, [&] { r.done_map(); });
            }
            {
                reader r { bytes, untracked };
                r.read_tag();
                r.skip_bytes(r.read_tag().str_length());
                r.done_str();
                expect(nothrow([&] { r.done_map(); }));
            }
        };
        "map read fully"_test = [] {
            const auto bytes = uint8_vector::from_hex("81A16101");
            reader r { bytes, tracked };
            test_same(uint32_t { 1 }, r.read_tag().map_count());
            r.skip_bytes(r.read_tag().str_length());
            r.done_str();
            test_same(mpack::tag::make_uint(1), r.read_tag());
            test_same(size_t { 1 }, r.depth());
            r.done_map();
            test_same(size_t { 0 }, r.depth());
            r.destroy();
        };
        "wrong done kind"_test = [] {
            const auto bytes = uint8_vector::from_hex("90");
            reader r { bytes, tracked };
            r.read_tag();
            expect_reader_error(error_kind::invalid, [&] { r.done_map(); });
        };
        "too many elements"_test = [] {
            const auto bytes = uint8_vector::from_hex("910102");
            reader r { bytes, tracked };
            r.read_tag();
            r.read_tag();
            expect_reader_error(error_kind::other, [&] { r.read_tag(); });
        };
        "too many bytes"_test = [] {
            const auto bytes = uint8_vector::from_hex("A1616263");
            reader r { bytes, tracked };
            r.read_tag();
            expect_reader_error(error_kind::other, [&] { r.read_bytes_inplace(2); });
        };
        "max depth"_test = [] {
            const auto bytes = uint8_vector::from_hex("91919190");
            reader r { bytes, reader_config { .read_tracking = true, .strict_debug_asserts = false, .max_depth = 2 } };
            r.read_tag();
            r.read_tag();
            expect_reader_error(error_kind::memory, [&] { r.read_tag(); });
        };
        "skip_bytes"_test = [] {
            const auto bytes = uint8_vector::from_hex("A3616263");
            {
                reader r { bytes, tracked };
                r.read_tag();
                r.skip_bytes(1);
                r.skip_bytes(2);
                r.done_str();
                r.destroy();
            }
            {
                reader r { bytes, tracked };
                expect_reader_error(error_kind::io, [&] { r.skip_bytes(5); });
            }
            {
                reader r { bytes, untracked };
                r.skip_bytes(4);
                expect(r.done());
            }
        };
        "discard"_test = [] {
            const auto bytes = uint8_vector::from_hex("9281A161930102" "03C0" "07");
            for (const auto &cfg: { tracked, untracked }) {
                reader r { bytes, cfg };
                r.discard();
                test_same(size_t { 9 }, r.position());
                test_same(size_t { 0 }, r.depth());
                test_same(uint8_t { 7 }, r.expect_u8());
                expect(r.done());
                r.destroy();
            }
        };
        "discard scalars and empty compounds"_test = [] {
            const auto bytes = uint8_vector::from_hex("0790" "80" "A0" "D40105" "C3");
            reader r { bytes, tracked };
            size_t values = 0;
            while (!r.done()) {
                r.discard();
                ++values;
            }
            test_same(size_t { 6 }, values);
            r.destroy();
        };
        "discard truncated"_test = [] {
            const auto bytes = uint8_vector::from_hex("930102");
            reader r { bytes, tracked };
            expect_reader_error(error_kind::io, [&] { r.discard(); });
        };
        "destroy with open frames"_test = [] {
            const auto bytes = uint8_vector::from_hex("9101");
            {
                reader r { bytes, tracked };
                r.read_tag();
                r.read_tag();
                expect_reader_error(error_kind::invalid, [&] { r.destroy(); });
                test_same(error_kind::invalid, r.error_info());
            }
            {
                reader r { bytes, strict };
                r.read_tag();
                r.read_tag();
                expect_reader_error(error_kind::other, [&] { r.destroy(); });
            }
            {
                reader r { bytes, untracked };
                r.read_tag();
                expect(nothrow([&] { r.destroy(); }));
            }
        };
        "destroyed"_test = [] {
            const auto bytes = uint8_vector::from_hex("0102");
            reader r { bytes, tracked };
            r.read_tag();
            r.destroy();
            expect(r.destroyed());
            expect_reader_error(error_kind::other, [&] { r.read_tag(); });
            expect_reader_error(error_kind::other, [&] { r.peek_tag(); });
            expect_reader_error(error_kind::other, [&] { r.discard(); });
            expect_reader_error(error_kind::other, [&] { r.destroy(); });
            test_same(size_t { 1 }, r.position());
        };
        "empty buffer"_test = [] {
            reader r { buffer {}, tracked };
            expect(r.done());
            expect(nothrow([&] { r.destroy(); }));
        };
    };
};
