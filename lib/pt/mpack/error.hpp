/* This file is part of Packtrack project
 * Copyright (c) 2024-2025 Packtrack contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef PACKTRACK_MPACK_ERROR_HPP
#define PACKTRACK_MPACK_ERROR_HPP

#include <pt/common/error.hpp>
#include <pt/common/format.hpp>
#include <pt/mpack/types.hpp>

namespace packtrack::mpack {
    // A sticky fault register: the first error wins and is never cleared.
    struct error_state {
        void set(const error_kind kind) noexcept
        {
            if (_kind == error_kind::ok)
                _kind = kind;
        }

        error_kind get() const noexcept
        {
            return _kind;
        }

        bool ok() const noexcept
        {
            return _kind == error_kind::ok;
        }
    private:
        error_kind _kind = error_kind::ok;
    };

    struct kind_error: error {
        explicit kind_error(const error_kind kind, const std::string_view msg):
            error { msg }, _kind { kind }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };

    struct reader_error: kind_error {
        using kind_error::kind_error;
    };

    struct writer_error: kind_error {
        using kind_error::kind_error;
    };

    // a tag accessor was called for a different alternative
    struct tag_type_error: kind_error {
        explicit tag_type_error(const std::string_view msg):
            kind_error { error_kind::type, msg }
        {
        }
    };

    // expect_enum found no candidate; the reader stays usable
    struct unexpected_name_error: error {
        using error::error;
    };
}

#endif // !PACKTRACK_MPACK_ERROR_HPP
