/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <charconv>
#include <pt/cli.hpp>

namespace packtrack::cli {
    std::optional<size_t> parse_size(const std::string_view sv)
    {
        size_t val = 0;
        const auto res = std::from_chars(sv.data(), sv.data() + sv.size(), val);
        if (res.ec != std::errc {} || res.ptr != sv.data() + sv.size())
            return {};
        return val;
    }

    option_validator positive_size_validator()
    {
        return [](const std::optional<std::string> &val) -> std::optional<std::string> {
            if (!val)
                return "a value is required";
            if (const auto sz = parse_size(*val); !sz || *sz == 0)
                return "must be a positive integer";
            return {};
        };
    }

    void argument_config::expect(const std::initializer_list<std::string> &args)
    {
        names = args;
        size_t required = 0;
        size_t optional = 0;
        bool variadic = false;
        for (const auto &a: args) {
            if (a.starts_with('[')) {
                ++optional;
                variadic |= a.ends_with("...]");
            } else {
                ++required;
            }
        }
        min = required;
        max = variadic ? std::numeric_limits<size_t>::max() : required + optional;
    }

    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            const auto eq_pos = arg.find('=', 2);
            const auto name = arg.substr(2, eq_pos == arg.npos ? arg.npos : eq_pos - 2);
            std::optional<std::string> val {};
            if (eq_pos != arg.npos)
                val = arg.substr(eq_pos + 1);
            if (!cfg.opts.contains(name))
                throw error(fmt::format("unknown option '--{}'", name));
            if (!pr.opts.try_emplace(name, std::move(val)).second)
                throw error(fmt::format("option '--{}' is specified more than once", name));
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            auto it = pr.opts.find(name);
            if (it == pr.opts.end()) {
                if (!opt_cfg.default_value)
                    continue;
                it = pr.opts.emplace(name, *opt_cfg.default_value).first;
            }
            if (opt_cfg.validator) {
                if (const auto err = (*opt_cfg.validator)(it->second); err)
                    throw error(fmt::format("value {} is invalid for '--{}': {}", it->second, name, *err));
            }
        }
        if ((cfg.args.min && pr.args.size() < *cfg.args.min) || (cfg.args.max && pr.args.size() > *cfg.args.max))
            _throw_usage(cfg);
        return pr;
    }

    void command::_throw_usage(const config &cmd) const
    {
        std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
        if (!cmd.opts.empty())
            usage += fmt::format("\n{} supports the following options:", cmd.name);
        for (const auto &[name, opt_cfg]: cmd.opts) {
            usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
            if (opt_cfg.default_value)
                usage += fmt::format(" ({} by default)", *opt_cfg.default_value);
        }
        throw error(usage);
    }

    void add_reader_options(config &cmd)
    {
        cmd.opts.try_emplace("no-tracking", option_config { "disable read tracking" });
        cmd.opts.try_emplace("strict", option_config { "treat read tracking violations as programming errors" });
        cmd.opts.try_emplace("max-depth", option_config { "the maximum nesting depth of compound values",
            std::to_string(reader_config::defaults().max_depth), positive_size_validator() });
    }

    reader_config make_reader_config(const options &opts)
    {
        reader_config cfg { reader_config::defaults() };
        if (opts.contains("no-tracking"))
            cfg.read_tracking = false;
        if (opts.contains("strict"))
            cfg.strict_debug_asserts = true;
        if (const auto it = opts.find("max-depth"); it != opts.end() && it->second) {
            if (const auto sz = parse_size(*it->second); sz)
                cfg.max_depth = *sz;
        }
        return cfg;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        std::ios_base::sync_with_stdio(false);
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { *cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: pt <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {} {}\n", cmd.cfg.name, cmd.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::debug };
            const auto pr = meta.cmd.parse(meta.cfg, args);
            return meta.cmd.run(pr.args, pr.opts);
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        }
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
