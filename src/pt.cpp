/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <pt/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace packtrack;
    int rc = 1;
    // errors escaping the command layer, such as conflicting command registrations
    logger::run_log_errors([&] {
        rc = cli::run(argc, argv);
    });
    return rc;
}
