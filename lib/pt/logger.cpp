/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <pt/logger.hpp>

namespace packtrack::logger {
    static std::mutex last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr.reset();
    }

    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("PT_DEBUG") != nullptr;
        return enabled;
    }

    static std::optional<std::string> log_path()
    {
        if (const char *env_log_path = std::getenv("PT_LOG"); env_log_path)
            return env_log_path;
        return {};
    }

    static bool console_enabled()
    {
        return !std::getenv("PT_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::optional<std::string> &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (path) {
            {
                std::ofstream os { *path, std::ios_base::app };
                if (!os) {
                    std::cerr << fmt::format("PT_INIT: Unable to write to the log file: {}; terminating.\n", *path);
                    std::terminate();
                }
            }
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        spdlog::logger logger { "pt", sinks.begin(), sinks.end() };
        if (tracing_enabled())
            logger.set_level(spdlog::level::trace);
        else if (path)
            logger.set_level(spdlog::level::debug);
        else
            logger.set_level(spdlog::level::info);
        logger.flush_on(spdlog::level::debug);
        if (path)
            logger.debug("log path: {}", *path);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    static spdlog::level::level_enum spdlog_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw packtrack::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    bool enabled(const level lev)
    {
        return get().should_log(spdlog_level(lev));
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(spdlog_level(lev), msg);
        if (lev == level::error) {
            std::scoped_lock lk { last_error_mutex };
            last_error_ptr = std::make_shared<std::string>(msg);
        }
    }
}
