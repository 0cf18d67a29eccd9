/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_BIG_DECIMAL_HPP
#define VERINUM_BIG_DECIMAL_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vn/big-int.hpp>
#include <vn/floor-ceiling.hpp>

namespace verinum {
    /*
     * An exact decimal value mantissa * 10^exponent.
     * The pair is kept normalized: a non-zero mantissa is never divisible by ten and zero always has exponent 0,
     * so the pair equality matches the numeric equality.
     */
    struct big_decimal {
        // parses [-]<digits>[.<digits>][e<int>], the integral digits may be omitted when a fraction follows
        static big_decimal from_string(std::string_view s);

        static big_decimal from_int(const cpp_int &v)
        {
            return big_decimal { v, 0 };
        }

        static big_decimal zero()
        {
            return big_decimal {};
        }

        big_decimal() =default;
        big_decimal(cpp_int mantissa, int64_t exponent);

        const cpp_int &mantissa() const noexcept
        {
            return _mantissa;
        }

        int64_t exponent() const noexcept
        {
            return _exponent;
        }

        bool is_zero() const noexcept
        {
            return _mantissa.is_zero();
        }

        bool is_positive() const noexcept
        {
            return _mantissa.sign() > 0;
        }

        bool is_negative() const noexcept
        {
            return _mantissa.sign() < 0;
        }

        big_decimal negate() const;
        big_decimal abs() const;
        // throws size_out_of_range_error when the exponents differ by more than 2^32
        big_decimal add(const big_decimal &y) const;
        big_decimal subtract(const big_decimal &y) const;
        big_decimal multiply(const big_decimal &y) const;

        int compare(const big_decimal &that) const;

        bool eq(const big_decimal &o) const
        {
            return compare(o) == 0;
        }

        bool ne(const big_decimal &o) const
        {
            return compare(o) != 0;
        }

        bool lt(const big_decimal &o) const
        {
            return compare(o) < 0;
        }

        bool gt(const big_decimal &o) const
        {
            return compare(o) > 0;
        }

        bool le(const big_decimal &o) const
        {
            return compare(o) <= 0;
        }

        bool ge(const big_decimal &o) const
        {
            return compare(o) >= 0;
        }

        bool operator==(const big_decimal &o) const =default;

        floor_ceiling_result floor_ceiling() const;

        // <mantissa>e<exponent>
        std::string to_string() const;
        std::string to_decimal_string() const;
        // at most max_digits digits after the point (truncated), values with more integral digits are clamped to +-10^max_digits
        std::string to_decimal_string(int64_t max_digits) const;
    private:
        cpp_int _mantissa {};
        int64_t _exponent = 0;
    };
}

namespace fmt {
    template<>
    struct formatter<verinum::big_decimal>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_decimal_string());
        }
    };
}

#endif // !VERINUM_BIG_DECIMAL_HPP
