/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <pt/config.hpp>
#include <pt/logger.hpp>

namespace packtrack {
    std::optional<bool> parse_flag(const std::string_view val)
    {
        std::string lc { val };
        std::transform(lc.begin(), lc.end(), lc.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lc == "1" || lc == "true" || lc == "yes" || lc == "on")
            return true;
        if (lc == "0" || lc == "false" || lc == "no" || lc == "off")
            return false;
        return {};
    }

    static void apply_flag(bool &dst, const char *name)
    {
        const char *env_val = std::getenv(name);
        if (!env_val)
            return;
        if (const auto val = parse_flag(env_val); val)
            dst = *val;
        else
            throw error(fmt::format("environment variable {} must be a boolean flag but got: '{}'", name, env_val));
    }

    config config::from_env(const config &base)
    {
        config cfg { base };
        if (std::getenv("PT_TRACKING")) {
            apply_flag(cfg.read_tracking, "PT_TRACKING");
            cfg.write_tracking = cfg.read_tracking;
        }
        apply_flag(cfg.strict_debug_asserts, "PT_STRICT");
        if (const char *env_val = std::getenv("PT_MAX_DEPTH"); env_val) {
            const std::string_view sv { env_val };
            size_t depth = 0;
            const auto res = std::from_chars(sv.data(), sv.data() + sv.size(), depth);
            if (res.ec != std::errc {} || res.ptr != sv.data() + sv.size() || depth == 0)
                throw error(fmt::format("environment variable PT_MAX_DEPTH must be a positive integer but got: '{}'", env_val));
            cfg.max_depth = depth;
        }
        return cfg;
    }

    // Must be called before any multi-threading code is executed
    const config &config::defaults()
    {
        static config cfg = [] {
            auto c = from_env(config {});
            logger::debug("default config: {}", c);
            return c;
        }();
        return cfg;
    }
}
