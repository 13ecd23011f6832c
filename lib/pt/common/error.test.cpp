/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cerrno>
#include <optional>
#include <pt/common/test.hpp>
#include <pt/common/error.hpp>
#include <pt/mpack/error.hpp>

using namespace packtrack;

namespace {
    template<typename F>
    void expect_throws_msg(const F &f, const std::string &match, const std::source_location &src_loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const packtrack::error &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), src_loc) << "no exception has been thrown";
        if (msg)
            expect(msg->starts_with(match), src_loc) << fmt::format("'{}' does not start with '{}'", *msg, match);
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "message"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", 123)); }, "Hello 123!");
        };
        "buffer"_test = [] {
            const auto buf = uint8_vector::from_hex("DEADBEEF");
            expect_throws_msg([&] { throw error(fmt::format("Hello {}!", buf)); }, "Hello DEADBEEF!");
        };
        "error_sys"_test = [] {
            expect_throws_msg([] { errno = 2; throw error_sys("open"); }, "open errno: 2 strerror: No such file or directory");
            test_same(13, error_sys(13, "write").code());
        };
        "stacktrace"_test = [] {
            const error err { "traced" };
            expect(!err.stacktrace().empty());
            test_same(std::string_view { "traced" }, std::string_view { err.what() });
        };
        "message without trace logging"_test = [] {
            for (size_t i = 0; i < 100; ++i) {
                const error err { fmt::format("quiet {}", i) };
                test_same(fmt::format("quiet {}", i), std::string { err.what() });
            }
            const error err { "quiet" };
            err.what();
            expect(!err.stacktrace().empty());
        };
        "kind"_test = [] {
            try {
                throw mpack::reader_error(mpack::error_kind::io, "truncated");
            } catch (const packtrack::error &ex) {
                const auto *kex = dynamic_cast<const mpack::kind_error *>(&ex);
                expect(kex != nullptr);
                if (kex)
                    test_same(mpack::error_kind::io, kex->kind());
                test_same(std::string_view { "truncated" }, std::string_view { ex.what() });
            }
            test_same(mpack::error_kind::type, mpack::tag_type_error { "x" }.kind());
        };
        "error_state"_test = [] {
            mpack::error_state st {};
            expect(st.ok());
            st.set(mpack::error_kind::ok);
            expect(st.ok());
            st.set(mpack::error_kind::invalid);
            st.set(mpack::error_kind::io);
            expect(!st.ok());
            test_same(mpack::error_kind::invalid, st.get());
        };
    };
};
