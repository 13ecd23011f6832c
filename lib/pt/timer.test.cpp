/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <thread>
#include <pt/common/test.hpp>
#include <pt/timer.hpp>

using namespace packtrack;

suite timer_suite = [] {
    "timer"_test = [] {
        "duration"_test = [] {
            timer t { "sleep", logger::level::trace };
            std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
            t.processed(1'000'000);
            expect(t.duration() >= 0.02) << t.duration();
        };
        "failed scope"_test = [] {
            expect(throws<packtrack::error>([] {
                timer t { "failing", logger::level::trace };
                throw packtrack::error("failed");
            }));
        };
    };
};
