/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <pt/file.hpp>

namespace packtrack::file {
    struct stdio_file {
        stdio_file(const std::string &path, const char *mode):
            _f { std::fopen(path.c_str(), mode) }
        {
            if (!_f) [[unlikely]] {
                const int err = errno;
                throw error_sys(err, fmt::format("failed to open file {}", path));
            }
        }

        stdio_file(const stdio_file &) =delete;

        ~stdio_file()
        {
            std::fclose(_f);
        }

        std::FILE *get() const noexcept
        {
            return _f;
        }
    private:
        std::FILE *_f;
    };

    void read(const std::string &path, uint8_vector &buf)
    {
        const auto size = std::filesystem::file_size(path);
        buf.resize(size);
        stdio_file f { path, "rb" };
        if (size > 0 && std::fread(buf.data(), 1, size, f.get()) != size) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", size, path));
    }
}
