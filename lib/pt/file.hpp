/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_FILE_HPP
#define PACKTRACK_FILE_HPP

#include <string>
#include <pt/common/bytes.hpp>

namespace packtrack::file {
    extern void read(const std::string &path, uint8_vector &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }
}

#endif // !PACKTRACK_FILE_HPP
