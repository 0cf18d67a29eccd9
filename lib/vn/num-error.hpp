/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_NUM_ERROR_HPP
#define VERINUM_NUM_ERROR_HPP

#include <vn/common/error.hpp>
#include <vn/common/format.hpp>

namespace verinum {
    // the input string does not match the expected grammar
    struct invalid_syntax_error: error {
        using error::error;
    };

    // a bit width or a digit budget is not positive or too small
    struct size_out_of_range_error: error {
        using error::error;
    };

    struct exponent_out_of_range_error: error {
        using error::error;
    };

    struct significand_overflow_error: error {
        using error::error;
    };

    // operands of a binary operation use different (significand, exponent) sizes
    struct format_mismatch_error: error {
        using error::error;
    };

    // the operation is not defined for NaN and infinities
    struct special_value_error: error {
        using error::error;
    };

    // an internal consistency check failed
    struct invariant_error: error {
        using error::error;
    };
}

#endif // !VERINUM_NUM_ERROR_HPP
