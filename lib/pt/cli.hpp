/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_CLI_HPP
#define PACKTRACK_CLI_HPP

#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <pt/config.hpp>
#include <pt/logger.hpp>
#include <pt/timer.hpp>

namespace packtrack::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    using option_validator = std::function<std::optional<std::string>(const std::optional<std::string> &)>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
        std::optional<option_validator> validator {};
    };
    using option_config_map = std::map<std::string, option_config>;

    // positional arguments: <name> is required, [name] is optional, and [name...] takes any number of values
    struct argument_config {
        std::optional<size_t> min {};
        std::optional<size_t> max {};
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args);
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &name: args.names)
                arg_info += fmt::format(" {}", name);
            const std::string opt_info { opts.empty() ? "" : "[options]" };
            return fmt::format("{}{} - {}", opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    extern std::optional<size_t> parse_size(std::string_view sv);
    extern option_validator positive_size_validator();

    // the reader settings shared by the commands: --no-tracking, --strict, and --max-depth=<n>
    extern void add_reader_options(config &cmd);
    extern reader_config make_reader_config(const options &opts);

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        // returns the process exit code
        virtual int run(const arguments &args, const options &opts) const =0;

        parse_result parse(const config &cfg, const arguments &args) const;
    protected:
        [[noreturn]] void _throw_usage(const config &cmd) const;
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        const command &cmd;
        config cfg {};
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !PACKTRACK_CLI_HPP
