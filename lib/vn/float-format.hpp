/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_FLOAT_FORMAT_HPP
#define VERINUM_FLOAT_FORMAT_HPP

#include <string>
#include <string_view>
#include <vn/big-int.hpp>

namespace verinum {
    /*
     * Bit widths of a binary floating-point format.
     * The significand size includes the hidden bit, so IEEE binary32 is 24/8
     * and a value stores significand_size - 1 significand bits.
     */
    struct float_format {
        static float_format binary16()
        {
            return float_format { 11, 5 };
        }

        static float_format binary32()
        {
            return float_format { 24, 8 };
        }

        static float_format binary64()
        {
            return float_format { 53, 11 };
        }

        static float_format binary128()
        {
            return float_format { 113, 15 };
        }

        // parses the decimal size fields of the "<sig>e<exp>" suffix
        static float_format from_sizes(std::string_view significand_size, std::string_view exponent_size);

        explicit float_format(uint64_t significand_size, uint64_t exponent_size);

        uint32_t significand_size() const noexcept
        {
            return _significand_size;
        }

        uint32_t exponent_size() const noexcept
        {
            return _exponent_size;
        }

        // the number of explicitly stored significand bits
        uint32_t field_size() const noexcept
        {
            return _significand_size - 1;
        }

        cpp_int bias() const;
        cpp_int hidden_bit() const;
        // the smallest biased exponent reserved for infinities and NaN
        cpp_int max_exponent() const;

        bool operator==(const float_format &o) const noexcept =default;

        // "<sig>e<exp>" as used by the string grammar
        std::string to_string() const;
    private:
        uint32_t _significand_size;
        uint32_t _exponent_size;
    };
}

namespace fmt {
    template<>
    struct formatter<verinum::float_format>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !VERINUM_FLOAT_FORMAT_HPP
