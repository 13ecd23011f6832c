/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_TIMER_HPP
#define PACKTRACK_TIMER_HPP

#include <chrono>
#include <exception>
#include <pt/logger.hpp>

namespace packtrack {
    // logs the lifetime of a scope when it ends, with the throughput when the processed size is known
    struct timer {
        using clock = std::chrono::steady_clock;

        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug):
            _title { title }, _level { lev }, _start { clock::now() }
        {
        }

        timer(const timer &) =delete;

        ~timer()
        {
            const auto secs = duration();
            if (std::uncaught_exceptions() > 0)
                logger::log(_level, "{} failed after {:0.3f} secs", _title, secs);
            else if (_bytes > 0 && secs > 0)
                logger::log(_level, "{} took {:0.3f} secs: {} bytes at {:0.1f} MB/sec", _title, secs, _bytes, static_cast<double>(_bytes) / secs / 1'000'000);
            else
                logger::log(_level, "{} took {:0.3f} secs", _title, secs);
        }

        void processed(const size_t bytes) noexcept
        {
            _bytes += bytes;
        }

        double duration() const
        {
            const std::chrono::duration<double> elapsed = clock::now() - _start;
            return elapsed.count();
        }
    private:
        const std::string _title;
        const logger::level _level;
        const clock::time_point _start;
        size_t _bytes = 0;
    };
}

#endif // !PACKTRACK_TIMER_HPP
