/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_COMMON_ERROR_HPP
#define PACKTRACK_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace packtrack {
    /*
     * The base of all exceptions thrown by packtrack.
     * The raw stack of the throw site is saved at construction and is symbolized
     * only when requested or when the message is first accessed, in which case it is logged at trace level.
     */
    struct error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit error(std::string_view msg);
        const char *what() const noexcept override;
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        mutable bool _reported = false;
    };

    // a failed system call, the message is extended with the errno value and its description
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
        explicit error_sys(int err, std::string_view msg);

        int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;
    };
}

#endif // !PACKTRACK_COMMON_ERROR_HPP
