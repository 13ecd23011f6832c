/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/common/test.hpp>
#include <pt/mpack/track.hpp>

using namespace packtrack;
using namespace packtrack::mpack;

suite mpack_track_suite = [] {
    "mpack::tracking_stack"_test = [] {
        "balanced"_test = [] {
            tracking_stack ts {};
            test_same(error_kind::ok, ts.push(frame_kind::map, 2));
            test_same(size_t { 1 }, ts.depth());
            test_same(error_kind::ok, ts.element());
            test_same(error_kind::ok, ts.push(frame_kind::str, 3));
            test_same(error_kind::ok, ts.bytes(2));
            test_same(error_kind::ok, ts.bytes(1));
            test_same(error_kind::ok, ts.pop(frame_kind::str));
            test_same(error_kind::ok, ts.element());
            test_same(error_kind::ok, ts.pop(frame_kind::map));
            test_same(error_kind::ok, ts.check_empty());
            test_same(size_t { 0 }, ts.depth());
        };
        "top"_test = [] {
            tracking_stack ts {};
            expect(!ts.top());
            test_same(error_kind::ok, ts.push(frame_kind::bin, 4));
            test_same(error_kind::ok, ts.bytes(1));
            expect(ts.top() == frame { frame_kind::bin, 3 });
        };
        "elements outside of any frame are allowed"_test = [] {
            tracking_stack ts {};
            test_same(error_kind::ok, ts.element());
            test_same(error_kind::ok, ts.element());
        };
        "protocol violations"_test = [] {
            tracking_stack ts {};
            test_same(error_kind::invalid, ts.pop(frame_kind::array));
            test_same(error_kind::invalid, ts.bytes(1));
            test_same(error_kind::ok, ts.push(frame_kind::array, 1));
            test_same(error_kind::invalid, ts.pop(frame_kind::array));
            test_same(error_kind::invalid, ts.pop(frame_kind::map));
            test_same(error_kind::invalid, ts.bytes(1));
            test_same(error_kind::invalid, ts.check_empty());
            test_same(error_kind::ok, ts.element());
            test_same(error_kind::ok, ts.pop(frame_kind::array));
        };
        "too many children or bytes"_test = [] {
            tracking_stack ts {};
            test_same(error_kind::ok, ts.push(frame_kind::array, 1));
            test_same(error_kind::ok, ts.element());
            test_same(error_kind::other, ts.element());
            test_same(error_kind::ok, ts.push(frame_kind::str, 2));
            test_same(error_kind::other, ts.bytes(3));
            test_same(error_kind::invalid, ts.element());
        };
        "strict mode reports other"_test = [] {
            tracking_stack ts { true, 8, true };
            expect(ts.strict());
            test_same(error_kind::other, ts.pop(frame_kind::array));
            test_same(error_kind::ok, ts.push(frame_kind::map, 1));
            test_same(error_kind::other, ts.pop(frame_kind::map));
        };
        "max depth"_test = [] {
            tracking_stack ts { true, 2 };
            test_same(error_kind::ok, ts.push(frame_kind::array, 1));
            test_same(error_kind::ok, ts.push(frame_kind::array, 1));
            test_same(error_kind::memory, ts.push(frame_kind::array, 1));
            test_same(size_t { 2 }, ts.depth());
        };
        "disabled"_test = [] {
            tracking_stack ts { false };
            expect(!ts.enabled());
            test_same(error_kind::ok, ts.pop(frame_kind::array));
            test_same(error_kind::ok, ts.push(frame_kind::map, 1));
            test_same(error_kind::ok, ts.bytes(100));
            test_same(error_kind::ok, ts.check_empty());
            test_same(size_t { 0 }, ts.depth());
        };
        "format"_test = [] {
            test_same(std::string { "map with 4 elements left" }, fmt::format("{}", frame { frame_kind::map, 4 }));
            test_same(std::string { "str with 2 bytes left" }, fmt::format("{}", frame { frame_kind::str, 2 }));
        };
    };
};
