/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_READER_HPP
#define PACKTRACK_MPACK_READER_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <pt/common/bytes.hpp>
#include <pt/config.hpp>
#include <pt/mpack/error.hpp>
#include <pt/mpack/tag.hpp>
#include <pt/mpack/track.hpp>

namespace packtrack::mpack {
    /*
     * A streaming MessagePack reader over a borrowed buffer. The buffer must outlive the reader.
     *
     * The first failure is latched into the reader's error_state and reported with a reader_error.
     * Every later data operation reports the same kind without touching the buffer.
     * With read tracking enabled, every opened compound value must be fully consumed
     * and closed with the matching done_* call.
     */
    struct reader {
        // the longest candidate name accepted by expect_enum
        static constexpr size_t max_enum_name = 256;

        explicit reader(buffer data, const reader_config &cfg=reader_config::defaults());
        reader(const reader &) =delete;
        reader &operator=(const reader &) =delete;
        ~reader();

        // does not advance; returns the missing tag when the reader is faulted or the next header is malformed
        tag peek_tag();
        tag read_tag();

        void read_bytes_into(write_buffer dest);
        buffer read_bytes_inplace(size_t n);
        std::string_view read_utf8_inplace(size_t n);
        std::pmr::vector<uint8_t> read_bytes_alloc(size_t n, std::pmr::memory_resource *mr=std::pmr::get_default_resource());
        void skip_bytes(size_t n);
        void discard();

        void done_array();
        void done_map();
        void done_str();
        void done_bin();
        void done_ext();

        // true when the cursor has reached the end of the buffer
        bool done() const noexcept
        {
            return _pos == _data.size();
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        error_kind error_info() const noexcept
        {
            return _err.get();
        }

        bool ok() const noexcept
        {
            return _err.ok();
        }

        bool destroyed() const noexcept
        {
            return _destroyed;
        }

        size_t depth() const noexcept
        {
            return _track.depth();
        }

        const reader_config &config() const noexcept
        {
            return _cfg;
        }

        // lets layered code latch a fault of its own
        void flag_error(error_kind kind) noexcept;
        void destroy();

        uint8_t expect_u8();
        uint16_t expect_u16();
        uint32_t expect_u32();
        uint64_t expect_u64();
        int8_t expect_i8();
        int16_t expect_i16();
        int32_t expect_i32();
        int64_t expect_i64();
        uint64_t expect_uint_range(uint64_t min, uint64_t max);
        int64_t expect_int_range(int64_t min, int64_t max);
        bool expect_bool();
        void expect_nil();
        float expect_float();
        double expect_double();
        float expect_float_strict();
        double expect_double_strict();

        uint32_t expect_map();
        void expect_map_match(uint32_t count);
        uint32_t expect_map_max(uint32_t max_count);
        uint32_t expect_array();
        void expect_array_match(uint32_t count);
        uint32_t expect_array_max(uint32_t max_count);

        uint32_t expect_str_start();
        uint32_t expect_bin_start();
        void expect_str_length(uint32_t len);
        void expect_str_match(std::string_view expected);
        std::string_view expect_str_buf(write_buffer buf);
        std::pmr::string expect_str_alloc(size_t max_len, std::pmr::memory_resource *mr=std::pmr::get_default_resource());
        std::pmr::vector<uint8_t> expect_bin_alloc(size_t max_len, std::pmr::memory_resource *mr=std::pmr::get_default_resource());

        /*
         * Reads a str and returns the index of the equal candidate.
         * A str that matches no candidate is consumed and reported with an unexpected_name_error,
         * which leaves the reader usable.
         */
        size_t expect_enum(std::span<const std::string_view> names);
        void expect_tag(const tag &expected);
    private:
        buffer _data;
        size_t _pos = 0;
        reader_config _cfg;
        error_state _err {};
        tracking_stack _track;
        bool _destroyed = false;

        void _check() const;
        [[noreturn]] void _fail(error_kind kind, std::string_view msg);
        void _tracked(error_kind res);
        void _done(frame_kind kind);
        // consumes n payload bytes of the open str, bin, or ext
        buffer _take(size_t n);
    };
}

#endif // !PACKTRACK_MPACK_READER_HPP
