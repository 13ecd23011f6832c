/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cstring>
#include <new>
#include <utf8.h>
#include <pt/logger.hpp>
#include <pt/mpack/decoder.hpp>
#include <pt/mpack/reader.hpp>

namespace packtrack::mpack {
    reader::reader(const buffer data, const reader_config &cfg):
        _data { data }, _cfg { cfg }, _track { cfg.read_tracking, cfg.max_depth, cfg.strict_debug_asserts }
    {
    }

    reader::~reader()
    {
        if (!_destroyed && _track.depth() > 0)
            logger::debug("a reader with {} open compound values at offset {} has not been destroyed", _track.depth(), _pos);
    }

    tag reader::peek_tag()
    {
        if (_destroyed) [[unlikely]]
            throw reader_error(error_kind::other, "the reader has been destroyed");
        if (!_err.ok())
            return tag::missing();
        const auto res = decode_tag(buffer { _data.data() + _pos, remaining() });
        if (res.err != error_kind::ok) [[unlikely]] {
            logger::debug("mpack reader: a malformed object header at offset {}: {}", _pos, res.err);
            _err.set(res.err);
        }
        return res.val;
    }

    tag reader::read_tag()
    {
        _check();
        const auto res = decode_tag(buffer { _data.data() + _pos, remaining() });
        if (res.err != error_kind::ok) [[unlikely]]
            _fail(res.err, fmt::format("a malformed object header at offset {}", _pos));
        const auto fr = res.val.frame();
        if (fr && frame_counts_bytes(fr->first) && remaining() - res.header_size < fr->second) [[unlikely]]
            _fail(error_kind::io, fmt::format("the payload of a {} at offset {} ends past the end of the buffer", res.val, _pos));
        _pos += res.header_size;
        _tracked(_track.element());
        if (fr)
            _tracked(_track.push(fr->first, fr->second));
        return res.val;
    }

    void reader::read_bytes_into(const write_buffer dest)
    {
        _check();
        const auto bytes = _take(dest.size());
        if (!bytes.empty())
            memcpy(dest.data(), bytes.data(), bytes.size());
    }

    buffer reader::read_bytes_inplace(const size_t n)
    {
        _check();
        return _take(n);
    }

    std::string_view reader::read_utf8_inplace(const size_t n)
    {
        _check();
        const std::string_view sv = _take(n);
        if (const auto it = utf8::find_invalid(sv.begin(), sv.end()); it != sv.end()) [[unlikely]]
            _fail(error_kind::invalid, fmt::format("an invalid utf8 sequence at offset {}", _pos - n + (it - sv.begin())));
        return sv;
    }

    std::pmr::vector<uint8_t> reader::read_bytes_alloc(const size_t n, std::pmr::memory_resource *mr)
    {
        _check();
        if (remaining() < n) [[unlikely]]
            _fail(error_kind::io, fmt::format("requested {} bytes at offset {} but only {} are available", n, _pos, remaining()));
        std::pmr::vector<uint8_t> res { mr };
        try {
            res.resize(n);
        } catch (const std::bad_alloc &) {
            _fail(error_kind::memory, fmt::format("failed to allocate {} bytes", n));
        }
        read_bytes_into(res);
        return res;
    }

    void reader::skip_bytes(const size_t n)
    {
        _check();
        if (const auto top = _track.top(); top && frame_counts_bytes(top->kind)) {
            _take(n);
            return;
        }
        if (remaining() < n) [[unlikely]]
            _fail(error_kind::io, fmt::format("cannot skip {} bytes at offset {}: only {} are available", n, _pos, remaining()));
        _pos += n;
    }

    void reader::discard()
    {
        _check();
        // an own stack of the values being discarded, since the tracking stack may be disabled
        std::vector<frame> open {};
        do {
            if (!open.empty()) {
                auto &f = open.back();
                if (f.left == 0) {
                    _done(f.kind);
                    open.pop_back();
                    continue;
                }
                --f.left;
            }
            const auto t = read_tag();
            switch (t.type()) {
                case type::str:
                    _take(t.str_length());
                    _done(frame_kind::str);
                    break;
                case type::bin:
                    _take(t.bin_length());
                    _done(frame_kind::bin);
                    break;
                case type::ext:
                    _take(t.ext_length());
                    _done(frame_kind::ext);
                    break;
                case type::array:
                case type::map: {
                    if (open.size() >= _cfg.max_depth) [[unlikely]]
                        _fail(error_kind::memory, fmt::format("discard: the nesting depth limit of {} has been reached at offset {}", _cfg.max_depth, _pos));
                    const auto fr = t.frame();
                    open.emplace_back(frame { fr->first, fr->second });
                    break;
                }
                default:
                    break;
            }
        } while (!open.empty());
    }

    void reader::done_array()
    {
        _check();
        _done(frame_kind::array);
    }

    void reader::done_map()
    {
        _check();
        _done(frame_kind::map);
    }

    void reader::done_str()
    {
        _check();
        _done(frame_kind::str);
    }

    void reader::done_bin()
    {
        _check();
        _done(frame_kind::bin);
    }

    void reader::done_ext()
    {
        _check();
        _done(frame_kind::ext);
    }

    void reader::flag_error(const error_kind kind) noexcept
    {
        _err.set(kind);
    }

    void reader::destroy()
    {
        if (_destroyed) [[unlikely]]
            throw reader_error(error_kind::other, "the reader has already been destroyed");
        _destroyed = true;
        if (!_err.ok())
            throw reader_error(_err.get(), fmt::format("the reader has failed with {} error", _err.get()));
        if (const auto res = _track.check_empty(); res != error_kind::ok) [[unlikely]] {
            _err.set(res);
            throw reader_error(res, fmt::format("the reader was destroyed with {} compound values still open", _track.depth()));
        }
    }

    void reader::_check() const
    {
        if (_destroyed) [[unlikely]]
            throw reader_error(error_kind::other, "the reader has been destroyed");
        if (!_err.ok()) [[unlikely]]
            throw reader_error(_err.get(), fmt::format("the reader is in a failed state: {}", _err.get()));
    }

    void reader::_fail(const error_kind kind, const std::string_view msg)
    {
        _err.set(kind);
        throw reader_error(_err.get(), fmt::format("mpack reader {} error: {}", _err.get(), msg));
    }

    void reader::_tracked(const error_kind res)
    {
        if (res != error_kind::ok) [[unlikely]]
            _fail(res, fmt::format("read tracking violation at offset {}", _pos));
    }

    void reader::_done(const frame_kind kind)
    {
        _tracked(_track.pop(kind));
    }

    buffer reader::_take(const size_t n)
    {
        _tracked(_track.bytes(n));
        if (remaining() < n) [[unlikely]]
            _fail(error_kind::io, fmt::format("requested {} bytes at offset {} but only {} are available", n, _pos, remaining()));
        const buffer res { _data.data() + _pos, n };
        _pos += n;
        return res;
    }
}
