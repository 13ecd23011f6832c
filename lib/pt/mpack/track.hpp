/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_TRACK_HPP
#define PACKTRACK_MPACK_TRACK_HPP

#include <cstdint>
#include <optional>
#include <vector>
#include <pt/config.hpp>
#include <pt/mpack/types.hpp>

namespace packtrack::mpack {
    struct frame {
        frame_kind kind;
        uint64_t left;

        bool operator==(const frame &o) const =default;
    };

    /*
     * Bookkeeping of the open compound values. Array frames count elements, map frames count keys and values,
     * str, bin, and ext frames count bytes. All methods return error_kind::ok on success so that the owner
     * can latch the result into its error_state. A disabled stack accepts everything and keeps no frames.
     */
    struct tracking_stack {
        explicit tracking_stack(bool enabled=true, size_t max_depth=config::default_max_depth, bool strict=false);

        error_kind push(frame_kind kind, uint64_t count);
        error_kind pop(frame_kind kind);
        // a child header of the top array or map has been consumed
        error_kind element();
        // n payload bytes of the top str, bin, or ext have been consumed
        error_kind bytes(uint64_t n);
        error_kind check_empty() const;

        bool enabled() const noexcept
        {
            return _enabled;
        }

        bool strict() const noexcept
        {
            return _strict;
        }

        size_t max_depth() const noexcept
        {
            return _max_depth;
        }

        size_t depth() const noexcept
        {
            return _frames.size();
        }

        std::optional<frame> top() const noexcept
        {
            if (_frames.empty())
                return {};
            return _frames.back();
        }
    private:
        std::vector<frame> _frames {};
        size_t _max_depth;
        bool _enabled;
        bool _strict;

        error_kind _violation(error_kind kind, std::string_view msg) const;
    };
}

namespace fmt {
    template<>
    struct formatter<packtrack::mpack::frame>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{} with {} {} left", v.kind, v.left,
                packtrack::mpack::frame_counts_bytes(v.kind) ? "bytes" : "elements");
        }
    };
}

#endif // !PACKTRACK_MPACK_TRACK_HPP
