/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/mpack/dump.hpp>

namespace packtrack::mpack {
    template std::ostreambuf_iterator<char> format_to(std::ostreambuf_iterator<char> out_it, reader &r, const size_t depth, const size_t max_seq_to_expand);
    template std::back_insert_iterator<std::string> format_to(std::back_insert_iterator<std::string> out_it, reader &r, const size_t depth, const size_t max_seq_to_expand);

    std::string dump(const buffer data, const size_t max_seq_to_expand, const reader_config &cfg)
    {
        std::string res {};
        reader r { data, cfg };
        while (!r.done()) {
            format_to(std::back_inserter(res), r, 0, max_seq_to_expand);
            res += '\n';
        }
        r.destroy();
        return res;
    }

    void dump(std::ostream &os, const buffer data, const size_t max_seq_to_expand, const reader_config &cfg)
    {
        reader r { data, cfg };
        while (!r.done()) {
            format_to(std::ostreambuf_iterator<char>(os), r, 0, max_seq_to_expand);
            os << '\n';
        }
        r.destroy();
    }
}
