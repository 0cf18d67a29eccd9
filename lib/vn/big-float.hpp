/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_BIG_FLOAT_HPP
#define VERINUM_BIG_FLOAT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vn/big-int.hpp>
#include <vn/float-format.hpp>
#include <vn/floor-ceiling.hpp>

namespace verinum {
    enum class special_value: uint8_t {
        nan, pos_inf, neg_inf
    };

    /*
     * An immutable binary floating-point value with caller-chosen significand and exponent bit widths.
     *
     * Values of different formats can be neither combined nor compared: such operations throw format_mismatch_error.
     *
     * The string grammar is:
     *   finite:  [-]0x<hex>.<hex>e<int>f<sig>e<exp> meaning <hex>.<hex> * 16^<int>
     *   special: 0NaN<sig>e<exp>, 0+oo<sig>e<exp>, 0-oo<sig>e<exp> (case-insensitive)
     *
     * compare() is a total order in which NaN equals NaN and sorts above +oo.
     * The predicates eq, ne, lt, gt, le, ge instead follow the IEEE convention:
     * every predicate but ne is false when an operand is NaN.
     */
    struct big_float {
        struct finite {
            bool sign = false;
            cpp_int significand {};
            cpp_int exponent {};

            bool operator==(const finite &o) const =default;
        };
        using value_type = std::variant<finite, special_value>;

        static big_float from_string(std::string_view s);
        // exact conversion of an integer, throws when the format cannot hold it
        static big_float from_int(const cpp_int &v, const float_format &fmt);
        // raw fields, the widths of significand and exponent are checked
        static big_float make(bool sign, const cpp_int &significand, const cpp_int &exponent, const float_format &fmt);

        static big_float zero(const float_format &fmt, const bool sign=false)
        {
            return big_float { finite { sign, 0, 0 }, fmt };
        }

        static big_float from_special(const special_value v, const float_format &fmt)
        {
            return big_float { v, fmt };
        }

        static big_float nan(const float_format &fmt)
        {
            return from_special(special_value::nan, fmt);
        }

        static big_float pos_inf(const float_format &fmt)
        {
            return from_special(special_value::pos_inf, fmt);
        }

        static big_float neg_inf(const float_format &fmt)
        {
            return from_special(special_value::neg_inf, fmt);
        }

        const float_format &format() const noexcept
        {
            return _format;
        }

        uint32_t significand_size() const noexcept
        {
            return _format.significand_size();
        }

        uint32_t exponent_size() const noexcept
        {
            return _format.exponent_size();
        }

        std::optional<special_value> special() const noexcept
        {
            if (const auto *sv = std::get_if<special_value>(&_val); sv)
                return *sv;
            return {};
        }

        bool is_special() const noexcept
        {
            return std::holds_alternative<special_value>(_val);
        }

        bool is_finite() const noexcept
        {
            return std::holds_alternative<finite>(_val);
        }

        bool is_nan() const noexcept
        {
            return special() == special_value::nan;
        }

        bool is_infinite() const noexcept
        {
            const auto sv = special();
            return sv == special_value::pos_inf || sv == special_value::neg_inf;
        }

        bool is_zero() const noexcept;
        // true for negative values including -0 and -oo, false for NaN
        bool sign() const noexcept;
        // the stored significand field without the hidden bit, 0 for special values
        cpp_int significand() const;
        // the biased exponent field, 0 for special values
        cpp_int exponent() const;

        big_float negate() const;
        big_float add(const big_float &y) const;
        big_float subtract(const big_float &y) const;
        big_float multiply(const big_float &y) const;

        int compare(const big_float &that) const;
        bool eq(const big_float &o) const;
        bool ne(const big_float &o) const;
        bool lt(const big_float &o) const;
        bool gt(const big_float &o) const;
        bool le(const big_float &o) const;
        bool ge(const big_float &o) const;

        // total-order equality: unlike eq() this treats two NaNs as equal
        bool operator==(const big_float &o) const
        {
            return compare(o) == 0;
        }

        // throws size_out_of_range_error when the integer result would need a shift beyond 2^32 bits
        floor_ceiling_result floor_ceiling() const;

        // the exact hexadecimal representation accepted by from_string
        std::string to_string() const;
    private:
        value_type _val;
        float_format _format;

        big_float(value_type &&val, const float_format &fmt): _val { std::move(val) }, _format { fmt }
        {
        }

        const finite &_finite() const;
        void _check_format(const big_float &o, std::string_view op) const;
    };
}

namespace fmt {
    template<>
    struct formatter<verinum::big_float>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !VERINUM_BIG_FLOAT_HPP
