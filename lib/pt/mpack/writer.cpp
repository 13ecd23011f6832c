/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <bit>
#include <limits>
#include <pt/logger.hpp>
#include <pt/mpack/writer.hpp>

namespace packtrack::mpack {
    writer::writer(const writer_config &cfg):
        _track { cfg.write_tracking, cfg.max_depth, cfg.strict_debug_asserts }
    {
    }

    writer::~writer()
    {
        if (!_destroyed && _track.depth() > 0)
            logger::debug("a writer with {} unfinished compound values at offset {} has not been destroyed", _track.depth(), _buf.size());
    }

    writer &writer::write_nil()
    {
        _element();
        _buf << 0xC0;
        return *this;
    }

    writer &writer::write_bool(const bool val)
    {
        _element();
        _buf << (val ? 0xC3 : 0xC2);
        return *this;
    }

    writer &writer::write_uint(const uint64_t val)
    {
        _element();
        if (val <= 0x7F) {
            _buf << static_cast<uint8_t>(val);
        } else if (val <= std::numeric_limits<uint8_t>::max()) {
            _encode(0xCC, static_cast<uint8_t>(val));
        } else if (val <= std::numeric_limits<uint16_t>::max()) {
            _encode(0xCD, static_cast<uint16_t>(val));
        } else if (val <= std::numeric_limits<uint32_t>::max()) {
            _encode(0xCE, static_cast<uint32_t>(val));
        } else {
            _encode(0xCF, val);
        }
        return *this;
    }

    writer &writer::write_int(const int64_t val)
    {
        if (val >= 0)
            return write_uint(static_cast<uint64_t>(val));
        _element();
        if (val >= -32) {
            _buf << static_cast<uint8_t>(static_cast<int8_t>(val));
        } else if (val >= std::numeric_limits<int8_t>::min()) {
            _encode(0xD0, static_cast<uint8_t>(static_cast<int8_t>(val)));
        } else if (val >= std::numeric_limits<int16_t>::min()) {
            _encode(0xD1, static_cast<uint16_t>(static_cast<int16_t>(val)));
        } else if (val >= std::numeric_limits<int32_t>::min()) {
            _encode(0xD2, static_cast<uint32_t>(static_cast<int32_t>(val)));
        } else {
            _encode(0xD3, static_cast<uint64_t>(val));
        }
        return *this;
    }

    writer &writer::write_float(const float val)
    {
        _element();
        _encode(0xCA, std::bit_cast<uint32_t>(val));
        return *this;
    }

    writer &writer::write_double(const double val)
    {
        _element();
        _encode(0xCB, std::bit_cast<uint64_t>(val));
        return *this;
    }

    writer &writer::write_str(const std::string_view sv)
    {
        start_str(sv.size());
        write_bytes(sv);
        return finish_str();
    }

    writer &writer::write_bin(const buffer buf)
    {
        start_bin(buf.size());
        write_bytes(buf);
        return finish_bin();
    }

    writer &writer::write_tag(const tag &t)
    {
        switch (t.type()) {
            case type::nil: return write_nil();
            case type::boolean: return write_bool(t.as_bool());
            case type::int_: return write_int(t.as_int());
            case type::uint: return write_uint(t.as_uint());
            case type::float32: return write_float(t.as_float());
            case type::float64: return write_double(t.as_double());
            case type::str: return start_str(t.str_length());
            case type::bin: return start_bin(t.bin_length());
            case type::array: return start_array(t.array_count());
            case type::map: return start_map(t.map_count());
            case type::ext: return start_ext(t.ext_type(), t.ext_length());
            [[unlikely]] default:
                _check();
                _fail(error_kind::invalid, fmt::format("cannot write a {} tag", t.type()));
        }
    }

    writer &writer::start_str(const uint64_t len)
    {
        _element();
        const auto sz = _length(len, frame_kind::str);
        if (sz < 32) {
            _buf << static_cast<uint8_t>(0xA0 | sz);
        } else if (sz <= std::numeric_limits<uint8_t>::max()) {
            _encode(0xD9, static_cast<uint8_t>(sz));
        } else if (sz <= std::numeric_limits<uint16_t>::max()) {
            _encode(0xDA, static_cast<uint16_t>(sz));
        } else {
            _encode(0xDB, sz);
        }
        _start(frame_kind::str, sz);
        return *this;
    }

    writer &writer::start_bin(const uint64_t len)
    {
        _element();
        const auto sz = _length(len, frame_kind::bin);
        if (sz <= std::numeric_limits<uint8_t>::max()) {
            _encode(0xC4, static_cast<uint8_t>(sz));
        } else if (sz <= std::numeric_limits<uint16_t>::max()) {
            _encode(0xC5, static_cast<uint16_t>(sz));
        } else {
            _encode(0xC6, sz);
        }
        _start(frame_kind::bin, sz);
        return *this;
    }

    writer &writer::start_ext(const int8_t type_id, const uint64_t len)
    {
        _element();
        const auto sz = _length(len, frame_kind::ext);
        switch (sz) {
            case 1: _buf << 0xD4; break;
            case 2: _buf << 0xD5; break;
            case 4: _buf << 0xD6; break;
            case 8: _buf << 0xD7; break;
            case 16: _buf << 0xD8; break;
            default:
                if (sz <= std::numeric_limits<uint8_t>::max())
                    _encode(0xC7, static_cast<uint8_t>(sz));
                else if (sz <= std::numeric_limits<uint16_t>::max())
                    _encode(0xC8, static_cast<uint16_t>(sz));
                else
                    _encode(0xC9, sz);
                break;
        }
        _buf << static_cast<uint8_t>(type_id);
        _start(frame_kind::ext, sz);
        return *this;
    }

    writer &writer::start_array(const uint64_t count)
    {
        _element();
        const auto sz = _length(count, frame_kind::array);
        if (sz < 16) {
            _buf << static_cast<uint8_t>(0x90 | sz);
        } else if (sz <= std::numeric_limits<uint16_t>::max()) {
            _encode(0xDC, static_cast<uint16_t>(sz));
        } else {
            _encode(0xDD, sz);
        }
        _start(frame_kind::array, sz);
        return *this;
    }

    writer &writer::start_map(const uint64_t count)
    {
        _element();
        const auto sz = _length(count, frame_kind::map);
        if (sz < 16) {
            _buf << static_cast<uint8_t>(0x80 | sz);
        } else if (sz <= std::numeric_limits<uint16_t>::max()) {
            _encode(0xDE, static_cast<uint16_t>(sz));
        } else {
            _encode(0xDF, sz);
        }
        _start(frame_kind::map, uint64_t { sz } * 2);
        return *this;
    }

    writer &writer::write_bytes(const buffer buf)
    {
        _check();
        _tracked(_track.bytes(buf.size()));
        _buf << buf;
        return *this;
    }

    writer &writer::finish_str()
    {
        _finish(frame_kind::str);
        return *this;
    }

    writer &writer::finish_bin()
    {
        _finish(frame_kind::bin);
        return *this;
    }

    writer &writer::finish_ext()
    {
        _finish(frame_kind::ext);
        return *this;
    }

    writer &writer::finish_array()
    {
        _finish(frame_kind::array);
        return *this;
    }

    writer &writer::finish_map()
    {
        _finish(frame_kind::map);
        return *this;
    }

    void writer::destroy()
    {
        if (_destroyed) [[unlikely]]
            throw writer_error(error_kind::other, "the writer has already been destroyed");
        _destroyed = true;
        if (!_err.ok())
            throw writer_error(_err.get(), fmt::format("the writer has failed with {} error", _err.get()));
        if (const auto res = _track.check_empty(); res != error_kind::ok) [[unlikely]] {
            _err.set(res);
            throw writer_error(res, fmt::format("the writer was destroyed with {} compound values unfinished", _track.depth()));
        }
    }

    void writer::_check() const
    {
        if (_destroyed) [[unlikely]]
            throw writer_error(error_kind::other, "the writer has been destroyed");
        if (!_err.ok()) [[unlikely]]
            throw writer_error(_err.get(), fmt::format("the writer is in a failed state: {}", _err.get()));
    }

    void writer::_fail(const error_kind kind, const std::string_view msg)
    {
        _err.set(kind);
        throw writer_error(_err.get(), fmt::format("mpack writer {} error: {}", _err.get(), msg));
    }

    void writer::_tracked(const error_kind res)
    {
        if (res != error_kind::ok) [[unlikely]]
            _fail(res, fmt::format("write tracking violation at offset {}", _buf.size()));
    }

    void writer::_element()
    {
        _check();
        _tracked(_track.element());
    }

    void writer::_finish(const frame_kind kind)
    {
        _check();
        _tracked(_track.pop(kind));
    }

    void writer::_start(const frame_kind kind, const uint64_t count)
    {
        _tracked(_track.push(kind, count));
    }

    uint32_t writer::_length(const uint64_t len, const frame_kind kind)
    {
        if (len > std::numeric_limits<uint32_t>::max()) [[unlikely]]
            _fail(error_kind::invalid, fmt::format("a {} of {} is too big for MessagePack", kind, len));
        return static_cast<uint32_t>(len);
    }
}
