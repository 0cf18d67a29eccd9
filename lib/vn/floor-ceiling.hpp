/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_FLOOR_CEILING_HPP
#define VERINUM_FLOOR_CEILING_HPP

#include <vn/big-int.hpp>

namespace verinum {
    // the nearest integers below and above a value, equal when the value is an integer
    struct floor_ceiling_result {
        cpp_int floor {};
        cpp_int ceiling {};

        bool operator==(const floor_ceiling_result &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<verinum::floor_ceiling_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[{}, {}]", v.floor, v.ceiling);
        }
    };
}

#endif // !VERINUM_FLOOR_CEILING_HPP
