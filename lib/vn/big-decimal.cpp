/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <vn/big-decimal.hpp>

namespace verinum {
    namespace {
        int64_t to_exponent(const cpp_int &v, const std::string_view origin)
        {
            if (v < std::numeric_limits<int64_t>::min() || v > std::numeric_limits<int64_t>::max()) [[unlikely]]
                throw exponent_out_of_range_error(fmt::format("decimal exponent {} of {} is outside of the 64-bit range", v, origin));
            return static_cast<int64_t>(v);
        }

        bool all_digits(const std::string_view s)
        {
            return std::all_of(s.begin(), s.end(), [](const char c) { return c >= '0' && c <= '9'; });
        }

        std::string clamped(const bool neg, const int64_t max_digits)
        {
            std::string res { neg ? "-1" : "1" };
            res.append(static_cast<size_t>(max_digits), '0');
            res += ".0";
            return res;
        }
    }

    big_decimal::big_decimal(cpp_int mantissa, int64_t exponent)
    {
        if (mantissa.is_zero()) {
            _exponent = 0;
            return;
        }
        cpp_int q {}, r {};
        for (;;) {
            boost::multiprecision::divide_qr(mantissa, cpp_int { 10 }, q, r);
            if (!r.is_zero())
                break;
            if (exponent == std::numeric_limits<int64_t>::max()) [[unlikely]]
                throw exponent_out_of_range_error(fmt::format("normalizing {}e{} moves the exponent out of the 64-bit range", mantissa, exponent));
            mantissa.swap(q);
            ++exponent;
        }
        _mantissa = std::move(mantissa);
        _exponent = exponent;
    }

    big_decimal big_decimal::from_string(const std::string_view s)
    {
        auto body = s;
        bool neg = false;
        if (!body.empty() && body.front() == '-') {
            neg = true;
            body.remove_prefix(1);
        }
        cpp_int exp {};
        if (const auto pos_e = body.find('e'); pos_e != body.npos) {
            const auto exp_text = body.substr(pos_e + 1);
            const auto parsed = big_int_from_dec(exp_text);
            if (!parsed)
                throw invalid_syntax_error(fmt::format("the exponent of a decimal must be an integer: '{}'", s));
            exp = *parsed;
            body = body.substr(0, pos_e);
        }
        auto int_text = body;
        std::string_view frac_text {};
        if (const auto pos_dot = body.find('.'); pos_dot != body.npos) {
            int_text = body.substr(0, pos_dot);
            frac_text = body.substr(pos_dot + 1);
            if (frac_text.empty())
                throw invalid_syntax_error(fmt::format("a decimal point must be followed by digits: '{}'", s));
        }
        if (int_text.empty() && frac_text.empty())
            throw invalid_syntax_error(fmt::format("a decimal must have at least one digit: '{}'", s));
        if (!all_digits(int_text) || !all_digits(frac_text))
            throw invalid_syntax_error(fmt::format("invalid character in decimal: '{}'", s));

        cpp_int mantissa {};
        for (const char c: int_text) {
            mantissa *= 10;
            mantissa += c - '0';
        }
        for (const char c: frac_text) {
            mantissa *= 10;
            mantissa += c - '0';
        }
        exp -= frac_text.size();
        if (neg)
            mantissa = -mantissa;
        return big_decimal { std::move(mantissa), to_exponent(exp, s) };
    }

    big_decimal big_decimal::negate() const
    {
        return big_decimal { -_mantissa, _exponent };
    }

    big_decimal big_decimal::abs() const
    {
        return big_decimal { boost::multiprecision::abs(_mantissa), _exponent };
    }

    big_decimal big_decimal::add(const big_decimal &y) const
    {
        const big_decimal *lo = this;
        const big_decimal *hi = &y;
        if (hi->_exponent < lo->_exponent)
            std::swap(lo, hi);
        // unsigned arithmetic cannot overflow for any pair of int64_t values
        const uint64_t diff = static_cast<uint64_t>(hi->_exponent) - static_cast<uint64_t>(lo->_exponent);
        cpp_int sum = hi->_mantissa * pow10(diff);
        sum += lo->_mantissa;
        return big_decimal { std::move(sum), lo->_exponent };
    }

    big_decimal big_decimal::subtract(const big_decimal &y) const
    {
        return add(y.negate());
    }

    big_decimal big_decimal::multiply(const big_decimal &y) const
    {
        const cpp_int exp = cpp_int { _exponent } + y._exponent;
        cpp_int prod = _mantissa * y._mantissa;
        return big_decimal { std::move(prod), to_exponent(exp, fmt::format("{} * {}", to_string(), y.to_string())) };
    }

    int big_decimal::compare(const big_decimal &that) const
    {
        if (*this == that)
            return 0;
        return subtract(that).is_negative() ? -1 : 1;
    }

    floor_ceiling_result big_decimal::floor_ceiling() const
    {
        floor_ceiling_result res {};
        if (is_zero())
            return res;
        if (_exponent >= 0) {
            res.floor = _mantissa * pow10(static_cast<uint64_t>(_exponent));
            res.ceiling = res.floor;
            return res;
        }
        const uint64_t frac_digits = static_cast<uint64_t>(-(_exponent + 1)) + 1;
        cpp_int q {}, r {};
        if (frac_digits > digit_count(_mantissa)) {
            // |value| < 1
            r = _mantissa;
        } else {
            boost::multiprecision::divide_qr(_mantissa, pow10(frac_digits), q, r);
        }
        const bool exact = r.is_zero();
        if (_mantissa.sign() >= 0) {
            res.floor = q;
            res.ceiling = exact ? q : cpp_int { q + 1 };
        } else {
            res.ceiling = q;
            res.floor = exact ? q : cpp_int { q - 1 };
        }
        if (res.floor > res.ceiling) [[unlikely]]
            throw invariant_error(fmt::format("floor_ceiling of {} produced floor {} > ceiling {}", to_string(), res.floor, res.ceiling));
        return res;
    }

    std::string big_decimal::to_string() const
    {
        return fmt::format("{}e{}", _mantissa, _exponent);
    }

    std::string big_decimal::to_decimal_string() const
    {
        const auto digits = cpp_int { boost::multiprecision::abs(_mantissa) }.str();
        std::string res { is_negative() ? "-" : "" };
        if (_exponent >= 0) {
            res += digits;
            res.append(static_cast<size_t>(_exponent), '0');
            res += ".0";
            return res;
        }
        const uint64_t frac_digits = static_cast<uint64_t>(-(_exponent + 1)) + 1;
        if (frac_digits < digits.size()) {
            const auto int_digits = digits.size() - frac_digits;
            res.append(digits, 0, int_digits);
            res += '.';
            res.append(digits, int_digits);
        } else {
            res += "0.";
            res.append(static_cast<size_t>(frac_digits - digits.size()), '0');
            res += digits;
        }
        return res;
    }

    std::string big_decimal::to_decimal_string(const int64_t max_digits) const
    {
        if (max_digits <= 0)
            throw size_out_of_range_error(fmt::format("the number of decimal digits must be positive but got {}", max_digits));
        const auto digits = cpp_int { boost::multiprecision::abs(_mantissa) }.str();
        const uint64_t max = static_cast<uint64_t>(max_digits);
        const bool neg = is_negative();
        std::string res { neg ? "-" : "" };
        if (_exponent >= 0) {
            const uint64_t exp = static_cast<uint64_t>(_exponent);
            if (max < digits.size() || max - digits.size() < exp)
                return clamped(neg, max_digits);
            res += digits;
            res.append(static_cast<size_t>(exp), '0');
            res += ".0";
            return res;
        }
        const uint64_t frac_digits = static_cast<uint64_t>(-(_exponent + 1)) + 1;
        if (frac_digits < digits.size()) {
            const auto int_digits = digits.size() - frac_digits;
            if (max < int_digits)
                return clamped(neg, max_digits);
            res.append(digits, 0, int_digits);
            res += '.';
            res.append(digits, int_digits, static_cast<size_t>(std::min(max, frac_digits)));
            return res;
        }
        // purely fractional: leading zeros, then the digits, cut at max_digits
        const uint64_t lead = frac_digits - digits.size();
        if (lead >= max)
            return "0." + std::string(static_cast<size_t>(max), '0');
        res += "0.";
        res.append(static_cast<size_t>(lead), '0');
        res.append(digits, 0, static_cast<size_t>(std::min<uint64_t>(max - lead, digits.size())));
        return res;
    }
}
