/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_COMMON_TEST_HPP
#define PACKTRACK_COMMON_TEST_HPP

#include <cmath>
#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <pt/common/bytes.hpp>
#include <pt/common/format.hpp>
#include <pt/mpack/error.hpp>

namespace packtrack {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", buffer { std::span<const uint8_t> { t } });
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    void test_close(const T &exp, const T &act, T eps=1e-4, const std::source_location &loc=std::source_location::current())
    {
        if (exp) {
            const auto e = std::fabs(act - exp) / act;
            expect(e <= eps, loc) << fmt::format("eps {} is too big for {} and {}", e, exp, act);
        } else {
            const auto d = std::fabs(act - exp);
            expect(d <= eps, loc) << fmt::format("delta {} is too big for {} and {}", d, exp, act);
        }
    }

    template<typename T, typename Y>
    bool test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // runs the action and checks that it throws an mpack error of the given kind
    template<typename E=mpack::reader_error, typename F>
    bool expect_reader_error(const mpack::error_kind kind, const F &action, const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
        } catch (const E &ex) {
            const auto res = ex.kind() == kind;
            expect(res, loc) << fmt::format("expected a {} error but got {}: {}", kind, ex.kind(), ex.what());
            return res;
        }
        expect(false, loc) << fmt::format("expected a {} error but no exception was thrown", kind);
        return false;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<packtrack::test_printer>> {};

#endif // !PACKTRACK_COMMON_TEST_HPP
