/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/logger.hpp>
#include <pt/mpack/track.hpp>

namespace packtrack::mpack {
    tracking_stack::tracking_stack(const bool enabled, const size_t max_depth, const bool strict):
        _max_depth { max_depth }, _enabled { enabled }, _strict { strict }
    {
    }

    error_kind tracking_stack::push(const frame_kind kind, const uint64_t count)
    {
        if (!_enabled)
            return error_kind::ok;
        if (_frames.size() >= _max_depth) [[unlikely]] {
            logger::debug("tracking: cannot open a {}: the nesting depth limit of {} has been reached", kind, _max_depth);
            return error_kind::memory;
        }
        _frames.emplace_back(frame { kind, count });
        return error_kind::ok;
    }

    error_kind tracking_stack::pop(const frame_kind kind)
    {
        if (!_enabled)
            return error_kind::ok;
        if (_frames.empty()) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("closing a {} but no compound value is open", kind));
        const auto &top = _frames.back();
        if (top.kind != kind) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("closing a {} but the open value is a {}", kind, top));
        if (top.left != 0) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("closing a {} too early", top));
        _frames.pop_back();
        return error_kind::ok;
    }

    error_kind tracking_stack::element()
    {
        if (!_enabled || _frames.empty())
            return error_kind::ok;
        auto &top = _frames.back();
        if (frame_counts_bytes(top.kind)) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("reading an element inside of a {}", top));
        if (top.left == 0) [[unlikely]]
            return _violation(error_kind::other, fmt::format("reading more elements than declared by a {}", top.kind));
        --top.left;
        return error_kind::ok;
    }

    error_kind tracking_stack::bytes(const uint64_t n)
    {
        if (!_enabled)
            return error_kind::ok;
        if (_frames.empty()) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("reading {} bytes but no str, bin, or ext is open", n));
        auto &top = _frames.back();
        if (!frame_counts_bytes(top.kind)) [[unlikely]]
            return _violation(error_kind::invalid, fmt::format("reading {} bytes inside of a {}", n, top));
        if (n > top.left) [[unlikely]]
            return _violation(error_kind::other, fmt::format("reading {} bytes from a {}", n, top));
        top.left -= n;
        return error_kind::ok;
    }

    error_kind tracking_stack::check_empty() const
    {
        if (!_enabled || _frames.empty())
            return error_kind::ok;
        return _violation(error_kind::invalid, fmt::format("{} compound values are still open, the innermost one is a {}",
            _frames.size(), _frames.back()));
    }

    error_kind tracking_stack::_violation(const error_kind kind, const std::string_view msg) const
    {
        if (_strict) {
            logger::error("tracking violation: {}", msg);
            return error_kind::other;
        }
        logger::debug("tracking violation: {}", msg);
        return kind;
    }
}
