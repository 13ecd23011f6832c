/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_CONFIG_HPP
#define PACKTRACK_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <pt/common/format.hpp>

#ifndef PACKTRACK_TRACKING
#   ifdef NDEBUG
#       define PACKTRACK_TRACKING 0
#   else
#       define PACKTRACK_TRACKING 1
#   endif
#endif

namespace packtrack {
    /*
     * The capability set that used to be selected by compile-time module flags.
     * The build provides the defaults, the environment can override them once per process,
     * and the code can override any of them per instance.
     */
    struct config {
        static constexpr size_t default_max_depth = 1024;

        bool read_tracking = PACKTRACK_TRACKING != 0;
        bool write_tracking = PACKTRACK_TRACKING != 0;
#ifdef PACKTRACK_STRICT
        bool strict_debug_asserts = true;
#else
        bool strict_debug_asserts = false;
#endif
        size_t max_depth = default_max_depth;

        // the build defaults with the PT_TRACKING, PT_STRICT, and PT_MAX_DEPTH overrides applied
        static const config &defaults();
        static config from_env(const config &base);

        bool operator==(const config &o) const =default;
    };

    struct reader_config {
        bool read_tracking = config::defaults().read_tracking;
        bool strict_debug_asserts = config::defaults().strict_debug_asserts;
        size_t max_depth = config::defaults().max_depth;

        static const reader_config &defaults()
        {
            static reader_config cfg {};
            return cfg;
        }

        bool operator==(const reader_config &o) const =default;
    };

    struct writer_config {
        bool write_tracking = config::defaults().write_tracking;
        bool strict_debug_asserts = config::defaults().strict_debug_asserts;
        size_t max_depth = config::defaults().max_depth;

        static const writer_config &defaults()
        {
            static writer_config cfg {};
            return cfg;
        }

        bool operator==(const writer_config &o) const =default;
    };

    // parses 0/1, true/false, yes/no, on/off
    extern std::optional<bool> parse_flag(std::string_view val);
}

namespace fmt {
    template<>
    struct formatter<packtrack::config>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "read_tracking: {} write_tracking: {} strict_debug_asserts: {} max_depth: {}",
                v.read_tracking, v.write_tracking, v.strict_debug_asserts, v.max_depth);
        }
    };
}

#endif // !PACKTRACK_CONFIG_HPP
