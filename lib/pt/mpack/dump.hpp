/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_DUMP_HPP
#define PACKTRACK_MPACK_DUMP_HPP

#include <iterator>
#include <limits>
#include <ostream>
#include <string>
#include <pt/mpack/reader.hpp>

namespace packtrack::mpack {
    // renders and consumes the next value of the reader
    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, reader &r, const size_t depth, const size_t max_seq_to_expand)
    {
        if (depth >= r.config().max_depth) [[unlikely]] {
            r.flag_error(error_kind::memory);
            throw reader_error(error_kind::memory, fmt::format("dump: the nesting depth limit of {} has been reached", r.config().max_depth));
        }
        const auto t = r.read_tag();
        switch (t.type()) {
            case type::nil: return fmt::format_to(out_it, "nil");
            case type::boolean: return fmt::format_to(out_it, "{}", t.as_bool());
            case type::uint: return fmt::format_to(out_it, "I {}", t.as_uint());
            case type::int_: return fmt::format_to(out_it, "I {}", t.as_int());
            case type::float32: return fmt::format_to(out_it, "F32 {}", t.as_float());
            case type::float64: return fmt::format_to(out_it, "F64 {}", t.as_double());
            case type::str: {
                const std::string_view s = r.read_bytes_inplace(t.str_length());
                r.done_str();
                return fmt::format_to(out_it, "T '{}'", s);
            }
            case type::bin: {
                const auto b = r.read_bytes_inplace(t.bin_length());
                r.done_bin();
                return fmt::format_to(out_it, "B #{}", b);
            }
            case type::ext: {
                const auto b = r.read_bytes_inplace(t.ext_length());
                r.done_ext();
                return fmt::format_to(out_it, "X {} #{}", static_cast<int>(t.ext_type()), b);
            }
            case type::array: {
                const size_t sz = t.array_count();
                out_it = fmt::format_to(out_it, "[");
                if (sz) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; i < sz; ++i) {
                        if (i < max_seq_to_expand) {
                            out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                            out_it = format_to(out_it, r, depth + 1, max_seq_to_expand);
                            out_it = fmt::format_to(out_it, "\n");
                        } else {
                            r.discard();
                        }
                    }
                    if (sz > max_seq_to_expand)
                        out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                r.done_array();
                return fmt::format_to(out_it, "](size: {})", sz);
            }
            case type::map: {
                const size_t sz = t.map_count();
                out_it = fmt::format_to(out_it, "{{");
                if (sz) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; i < sz; ++i) {
                        if (i < max_seq_to_expand) {
                            out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                            out_it = format_to(out_it, r, depth + 1, max_seq_to_expand);
                            out_it = fmt::format_to(out_it, ": ");
                            out_it = format_to(out_it, r, depth + 1, max_seq_to_expand);
                            out_it = fmt::format_to(out_it, "\n");
                        } else {
                            r.discard();
                            r.discard();
                        }
                    }
                    if (sz > max_seq_to_expand)
                        out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                r.done_map();
                return fmt::format_to(out_it, "}}(size: {})", sz);
            }
            [[unlikely]] default:
                throw error(fmt::format("unsupported MessagePack type {}", t.type()));
        }
    }

    extern template std::ostreambuf_iterator<char> format_to(std::ostreambuf_iterator<char> out_it, reader &r, const size_t depth, const size_t max_seq_to_expand);
    extern template std::back_insert_iterator<std::string> format_to(std::back_insert_iterator<std::string> out_it, reader &r, const size_t depth, const size_t max_seq_to_expand);

    // renders every top-level value of the buffer, one per line
    extern std::string dump(buffer data, size_t max_seq_to_expand=std::numeric_limits<size_t>::max(), const reader_config &cfg=reader_config::defaults());
    extern void dump(std::ostream &os, buffer data, size_t max_seq_to_expand=std::numeric_limits<size_t>::max(), const reader_config &cfg=reader_config::defaults());
}

#endif // !PACKTRACK_MPACK_DUMP_HPP
