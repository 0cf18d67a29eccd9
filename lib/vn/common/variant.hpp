/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_COMMON_VARIANT_HPP
#define VERINUM_COMMON_VARIANT_HPP

#include <typeinfo>
#include <variant>
#include <vn/common/error.hpp>
#include <vn/common/format.hpp>

namespace verinum::variant {
    // Throws a verinum::error naming both types instead of std::bad_variant_access
    template<typename TO, typename FROM>
    const TO &get_nice(const FROM &v)
    {
        return std::visit([&](const auto &vo) -> const TO & {
            using T = decltype(vo);
            if constexpr (std::is_same_v<std::decay_t<T>, std::decay_t<TO>>) {
                return vo;
            } else {
                throw error(fmt::format("expected type {} but got {}", typeid(TO).name(), typeid(T).name()));
            }
        }, v);
    }
}

#endif // !VERINUM_COMMON_VARIANT_HPP
