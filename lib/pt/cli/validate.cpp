/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/cli.hpp>
#include <pt/file.hpp>
#include <pt/mpack/reader.hpp>

namespace packtrack::cli::validate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validate";
            cmd.desc = "check that <file> is a well-formed sequence of MessagePack values";
            cmd.args.expect({ "<file>" });
            add_reader_options(cmd);
        }

        int run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto data = file::read(path);
            timer t { fmt::format("validate {}", path) };
            t.processed(data.size());
            mpack::reader r { data, make_reader_config(opts) };
            size_t num_values = 0;
            try {
                while (!r.done()) {
                    r.discard();
                    ++num_values;
                }
                r.destroy();
            } catch (const mpack::reader_error &ex) {
                std::cout << fmt::format("{}: invalid: {} error at offset {} after {} values\n", path, ex.kind(), r.position(), num_values);
                logger::debug("validate {}: {}", path, ex.what());
                return 1;
            }
            std::cout << fmt::format("{}: valid: {} values in {} bytes\n", path, num_values, data.size());
            return 0;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
