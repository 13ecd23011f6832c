/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <filesystem>
#include <fstream>
#include <pt/common/test.hpp>
#include <pt/file.hpp>

using namespace packtrack;

namespace {
    void write_file(const std::string &path, const buffer data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }
}

suite file_suite = [] {
    "file"_test = [] {
        const auto path = (std::filesystem::temp_directory_path() / "packtrack-file-test.bin").string();
        "read"_test = [&] {
            const auto data = uint8_vector::from_hex("93010203");
            write_file(path, data);
            test_same(size_t { 4 }, std::filesystem::file_size(path));
            test_same(data, file::read(path));
            std::filesystem::remove(path);
        };
        "empty"_test = [&] {
            write_file(path, buffer {});
            expect(file::read(path).empty());
            std::filesystem::remove(path);
        };
        "missing"_test = [&] {
            std::filesystem::remove(path);
            expect(throws([&] { file::read(path); }));
        };
    };
};
