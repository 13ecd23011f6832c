/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/cli.hpp>
#include <pt/file.hpp>
#include <pt/mpack/dump.hpp>

namespace packtrack::cli::dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "dump";
            cmd.desc = "print every MessagePack value stored in <file>";
            cmd.args.expect({ "<file>" });
            cmd.opts.try_emplace("max-items", option_config { "the maximum number of array elements and map pairs to print", {}, positive_size_validator() });
            add_reader_options(cmd);
        }

        int run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto data = file::read(path);
            size_t max_items = std::numeric_limits<size_t>::max();
            if (const auto it = opts.find("max-items"); it != opts.end() && it->second)
                max_items = *parse_size(*it->second);
            logger::debug("dump {} of {} bytes", path, data.size());
            mpack::dump(std::cout, data, max_items, make_reader_config(opts));
            std::cout.flush();
            return 0;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
