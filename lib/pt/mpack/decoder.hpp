/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_DECODER_HPP
#define PACKTRACK_MPACK_DECODER_HPP

#include <pt/common/bytes.hpp>
#include <pt/mpack/tag.hpp>

namespace packtrack::mpack {
    struct decode_result {
        tag val {};
        size_t header_size = 0;
        error_kind err = error_kind::ok;
    };

    /*
     * The full size of the object header that starts with the given prefix byte including the prefix itself,
     * or 0 for the reserved 0xC1 byte.
     */
    extern size_t header_size(uint8_t prefix) noexcept;

    /*
     * Decodes the object header at the start of avail. Does not look at the payload of str, bin, and ext values.
     * On failure, val is missing and err is io for a truncated header or invalid for a reserved prefix.
     */
    extern decode_result decode_tag(buffer avail) noexcept;
}

#endif // !PACKTRACK_MPACK_DECODER_HPP
