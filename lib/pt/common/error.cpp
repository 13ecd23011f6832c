/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cerrno>
#include <cstring>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <pt/logger.hpp>

namespace packtrack {
    error::error(const std::string_view msg):
        _msg { msg }
    {
        // skips safe_dump_to and this constructor
        boost::stacktrace::safe_dump_to(2, _trace.data(), _trace.size());
    }

    std::string error::stacktrace() const
    {
        // the last byte stays zero even when the trace is cut
        std::array<char, 0x2000> buf {};
        boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        return buf.data();
    }

    const char *error::what() const noexcept
    {
        if (!_reported) {
            _reported = true;
            if (logger::enabled(logger::level::trace))
                logger::trace("{} thrown at:\n{}", _msg, stacktrace());
        }
        return _msg.c_str();
    }

    error_sys::error_sys(const std::string_view msg):
        error_sys { errno, msg }
    {
    }

    error_sys::error_sys(const int err, const std::string_view msg):
        error { fmt::format("{} errno: {} strerror: {}", msg, err, std::strerror(err)) }, _code { err }
    {
    }
}
