/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_WRITER_HPP
#define PACKTRACK_MPACK_WRITER_HPP

#include <string_view>
#include <pt/common/bytes.hpp>
#include <pt/config.hpp>
#include <pt/mpack/error.hpp>
#include <pt/mpack/tag.hpp>
#include <pt/mpack/track.hpp>

namespace packtrack::mpack {
    /*
     * Encodes MessagePack into an owned byte vector always choosing the shortest encoding.
     * With write tracking enabled, the number of elements and bytes written into
     * every started compound value must match the declared one.
     */
    struct writer {
        explicit writer(const writer_config &cfg=writer_config::defaults());
        writer(const writer &) =delete;
        writer &operator=(const writer &) =delete;
        ~writer();

        writer &write_nil();
        writer &write_bool(bool val);
        writer &write_uint(uint64_t val);
        // non-negative values use the unsigned encodings
        writer &write_int(int64_t val);
        writer &write_float(float val);
        writer &write_double(double val);
        writer &write_str(std::string_view sv);
        writer &write_bin(buffer buf);
        // a compound tag only starts the value, its contents and the finish call are up to the caller
        writer &write_tag(const tag &t);

        writer &start_str(uint64_t len);
        writer &start_bin(uint64_t len);
        writer &start_ext(int8_t type_id, uint64_t len);
        writer &start_array(uint64_t count);
        writer &start_map(uint64_t count);
        // payload of the started str, bin, or ext
        writer &write_bytes(buffer buf);

        writer &finish_str();
        writer &finish_bin();
        writer &finish_ext();
        writer &finish_array();
        writer &finish_map();

        void destroy();

        const uint8_vector &bytes() const noexcept
        {
            return _buf;
        }

        error_kind error_info() const noexcept
        {
            return _err.get();
        }

        bool ok() const noexcept
        {
            return _err.ok();
        }

        size_t depth() const noexcept
        {
            return _track.depth();
        }
    private:
        uint8_vector _buf {};
        error_state _err {};
        tracking_stack _track;
        bool _destroyed = false;

        void _check() const;
        [[noreturn]] void _fail(error_kind kind, std::string_view msg);
        void _tracked(error_kind res);
        void _element();
        void _finish(frame_kind kind);
        void _start(frame_kind kind, uint64_t count);
        uint32_t _length(uint64_t len, frame_kind kind);

        template<typename T>
        void _encode(const uint8_t prefix, const T val)
        {
            _buf << prefix;
            _encode_data(val);
        }

        template<typename T>
        void _encode_data(const T val)
        {
            const auto net_val = host_to_net(val);
            _buf << buffer::from(net_val);
        }
    };
}

#endif // !PACKTRACK_MPACK_WRITER_HPP
