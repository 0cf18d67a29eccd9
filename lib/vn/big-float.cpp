/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <vn/big-float.hpp>
#include <vn/common/variant.hpp>
#include <vn/logger.hpp>

namespace verinum {
    namespace {
        constexpr std::string_view hex_digits { "0123456789abcdef" };

        bool iequals(const std::string_view a, const std::string_view b)
        {
            if (a.size() != b.size())
                return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                    return false;
            }
            return true;
        }

        int hex_value(const char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        // position in the total order: -oo < finite < +oo < NaN
        int order_rank(const big_float &v)
        {
            const auto sv = v.special();
            if (!sv)
                return 1;
            switch (*sv) {
                case special_value::neg_inf: return 0;
                case special_value::pos_inf: return 2;
                case special_value::nan: return 3;
                default: throw error(fmt::format("unsupported special value: {}", static_cast<int>(*sv)));
            }
        }

        int sign_of(const int cmp)
        {
            return (cmp > 0) - (cmp < 0);
        }

        /*
         * Brings a non-negative magnitude with its biased exponent back into [hidden, 2 * hidden)
         * or into the subnormal range. Bits shifted out on the right are truncated.
         * The returned exponent may reach format.max_exponent(): the caller converts that into an infinity.
         */
        big_float::finite renormalize(cpp_int mag, cpp_int exp, const bool sign, const float_format &format)
        {
            const uint64_t sig_size = format.significand_size();
            // halve while mag >= 2 * hidden or exp <= 0
            {
                const uint64_t width = bit_length(mag);
                cpp_int shift {};
                if (width > sig_size)
                    shift = width - sig_size;
                if (exp <= 0 && 1 - exp > shift)
                    shift = 1 - exp;
                if (shift > 0) {
                    if (shift >= width)
                        mag = 0;
                    else
                        mag >>= static_cast<uint64_t>(shift);
                    exp += shift;
                }
            }
            // double while mag < hidden and exp > 1
            const cpp_int hidden = format.hidden_bit();
            if (mag < hidden && exp > 1) {
                cpp_int shift = exp - 1;
                if (mag != 0) {
                    const uint64_t room = sig_size - bit_length(mag);
                    if (shift > room)
                        shift = room;
                    mag <<= static_cast<uint64_t>(shift);
                }
                exp -= shift;
            }
            if (mag < hidden)
                exp = 0;
            else
                mag -= hidden;
            return big_float::finite { sign, std::move(mag), std::move(exp) };
        }
    }

    big_float big_float::from_string(const std::string_view s)
    {
        const auto pos_last_e = s.rfind('e');
        if (pos_last_e == s.npos)
            throw invalid_syntax_error(fmt::format("a float must end with e<exponent size> but got: '{}'", s));
        const auto exp_size_text = s.substr(pos_last_e + 1);

        if (s.size() >= 4 && s[0] == '0') {
            const auto tag = s.substr(1, 3);
            std::optional<special_value> sv {};
            if (iequals(tag, "nan"))
                sv = special_value::nan;
            else if (iequals(tag, "+oo"))
                sv = special_value::pos_inf;
            else if (iequals(tag, "-oo"))
                sv = special_value::neg_inf;
            if (sv) {
                if (pos_last_e < 4)
                    throw invalid_syntax_error(fmt::format("a special float value must have a significand size: '{}'", s));
                return from_special(*sv, float_format::from_sizes(s.substr(4, pos_last_e - 4), exp_size_text));
            }
        }

        const auto pos_f = s.rfind('f', pos_last_e);
        if (pos_f == s.npos)
            throw invalid_syntax_error(fmt::format("a finite float must have an f<significand size> suffix: '{}'", s));
        const auto format = float_format::from_sizes(s.substr(pos_f + 1, pos_last_e - pos_f - 1), exp_size_text);

        auto body = s.substr(0, pos_f);
        bool sign = false;
        if (!body.empty() && body.front() == '-') {
            sign = true;
            body.remove_prefix(1);
        }
        if (body.size() < 2 || body[0] != '0' || (body[1] != 'x' && body[1] != 'X'))
            throw invalid_syntax_error(fmt::format("a finite float must start with 0x: '{}'", s));
        body.remove_prefix(2);
        const auto pos_exp = body.rfind('e');
        if (pos_exp == body.npos)
            throw invalid_syntax_error(fmt::format("a finite float must have an e<exponent> part: '{}'", s));
        const auto stored_exp = big_int_from_dec(body.substr(pos_exp + 1));
        if (!stored_exp)
            throw invalid_syntax_error(fmt::format("the exponent of a float must be a decimal integer: '{}'", s));
        const auto hex = body.substr(0, pos_exp);
        const auto pos_dot = hex.find('.');
        if (pos_dot == hex.npos)
            throw invalid_syntax_error(fmt::format("the significand of a float must contain a '.': '{}'", s));

        cpp_int digits {};
        uint64_t num_digits = 0;
        for (size_t i = 0; i < hex.size(); ++i) {
            if (i == pos_dot)
                continue;
            const auto v = hex_value(hex[i]);
            if (v < 0)
                throw invalid_syntax_error(fmt::format("invalid hexadecimal digit '{}' in '{}'", hex[i], s));
            digits <<= 4;
            digits |= v;
            ++num_digits;
        }
        if (num_digits == 0)
            throw invalid_syntax_error(fmt::format("the significand of a float must have at least one digit: '{}'", s));
        if (digits == 0)
            return zero(format, sign);

        const uint64_t point_pos = 4 * pos_dot;
        const uint64_t first_one = 4 * num_digits - bit_length(digits);
        cpp_int window = digits >> boost::multiprecision::lsb(digits);
        uint64_t width = bit_length(window);
        cpp_int exp = *stored_exp * 4 + format.bias();
        exp += static_cast<int64_t>(point_pos) - static_cast<int64_t>(first_one) - 1;

        const uint64_t field = format.field_size();
        cpp_int sig {};
        if (exp <= 0) {
            // subnormal: no hidden bit, the leading one moves right by -exp positions
            const cpp_int shift = -exp;
            if (width > field)
                throw significand_overflow_error(fmt::format("the significand of '{}' cannot fit in {} bits", s, field));
            if (shift > field - width)
                throw exponent_out_of_range_error(fmt::format("the exponent of '{}' cannot fit in {} bits", s, format.exponent_size()));
            sig = window << (field - width - static_cast<uint64_t>(shift));
            exp = 0;
        } else {
            if (exp >= format.max_exponent())
                throw exponent_out_of_range_error(fmt::format("the exponent of '{}' cannot fit in {} bits", s, format.exponent_size()));
            window -= pow2(width - 1);
            --width;
            if (width > field)
                throw significand_overflow_error(fmt::format("the significand of '{}' cannot fit in {} bits", s, field));
            sig = window << (field - width);
        }
        return big_float { finite { sign, std::move(sig), std::move(exp) }, format };
    }

    big_float big_float::from_int(const cpp_int &v, const float_format &format)
    {
        if (v == 0)
            return zero(format);
        const bool sign = v < 0;
        cpp_int mag = boost::multiprecision::abs(v);
        const uint64_t width = bit_length(mag);
        cpp_int exp = format.bias() + (width - 1);
        if (exp >= format.max_exponent())
            throw exponent_out_of_range_error(fmt::format("integer {} is too big for format {}", v, format));
        mag -= pow2(width - 1);
        const uint64_t field = format.field_size();
        cpp_int sig {};
        if (width - 1 > field) {
            const uint64_t drop = width - 1 - field;
            if (mag != 0 && boost::multiprecision::lsb(mag) < drop)
                throw significand_overflow_error(fmt::format("integer {} needs more than {} significand bits", v, format.significand_size()));
            sig = mag >> drop;
        } else {
            sig = mag << (field - (width - 1));
        }
        return big_float { finite { sign, std::move(sig), std::move(exp) }, format };
    }

    big_float big_float::make(const bool sign, const cpp_int &significand, const cpp_int &exponent, const float_format &format)
    {
        if (significand < 0 || significand >= format.hidden_bit())
            throw significand_overflow_error(fmt::format("significand {} does not fit in {} bits", significand, format.field_size()));
        if (exponent < 0 || exponent >= format.max_exponent())
            throw exponent_out_of_range_error(fmt::format("biased exponent {} is outside of the finite range of format {}", exponent, format));
        return big_float { finite { sign, significand, exponent }, format };
    }

    const big_float::finite &big_float::_finite() const
    {
        return variant::get_nice<finite>(_val);
    }

    void big_float::_check_format(const big_float &o, const std::string_view op) const
    {
        if (_format != o._format) [[unlikely]]
            throw format_mismatch_error(fmt::format("cannot {} floats of different formats: {} and {}", op, _format, o._format));
    }

    bool big_float::is_zero() const noexcept
    {
        const auto *f = std::get_if<finite>(&_val);
        return f && f->significand == 0 && f->exponent == 0;
    }

    bool big_float::sign() const noexcept
    {
        if (const auto *f = std::get_if<finite>(&_val); f)
            return f->sign;
        return special() == special_value::neg_inf;
    }

    cpp_int big_float::significand() const
    {
        if (const auto *f = std::get_if<finite>(&_val); f)
            return f->significand;
        return 0;
    }

    cpp_int big_float::exponent() const
    {
        if (const auto *f = std::get_if<finite>(&_val); f)
            return f->exponent;
        return 0;
    }

    big_float big_float::negate() const
    {
        if (const auto sv = special(); sv) {
            switch (*sv) {
                case special_value::pos_inf: return neg_inf(_format);
                case special_value::neg_inf: return pos_inf(_format);
                default: return nan(_format);
            }
        }
        const auto &f = _finite();
        return big_float { finite { !f.sign, f.significand, f.exponent }, _format };
    }

    big_float big_float::add(const big_float &y) const
    {
        _check_format(y, "add");
        if (is_special() || y.is_special()) {
            const auto xs = special();
            const auto ys = y.special();
            if (xs == special_value::nan || ys == special_value::nan
                    || (xs == special_value::pos_inf && ys == special_value::neg_inf)
                    || (xs == special_value::neg_inf && ys == special_value::pos_inf)) {
                logger::trace("{} + {} is NaN", *this, y);
                return nan(_format);
            }
            return is_special() ? *this : y;
        }

        // a is the operand with the smaller biased exponent
        const big_float *a = this;
        const big_float *b = &y;
        if (a->_finite().exponent > b->_finite().exponent)
            std::swap(a, b);
        const auto &af = a->_finite();
        const auto &bf = b->_finite();
        // a cannot influence the result
        if (bf.exponent - af.exponent > significand_size())
            return *b;

        const cpp_int hidden = _format.hidden_bit();
        cpp_int asig = af.significand;
        cpp_int aexp = af.exponent;
        cpp_int bsig = bf.significand;
        cpp_int bexp = bf.exponent;
        if (aexp > 0)
            asig += hidden;
        else
            aexp += 1;
        if (bexp > 0)
            bsig += hidden;
        else
            bexp += 1;
        if (af.sign)
            asig = -asig;
        if (bf.sign)
            bsig = -bsig;
        asig = shift_right_floor(asig, to_shift(bexp - aexp));

        cpp_int sum = bsig + asig;
        if (sum == 0)
            return zero(_format, af.sign && bf.sign);
        const bool neg = sum < 0;
        if (neg)
            sum = -sum;
        auto res = renormalize(std::move(sum), std::move(bexp), neg, _format);
        if (res.exponent >= _format.max_exponent()) {
            logger::trace("{} + {} overflows to infinity", *this, y);
            return neg ? neg_inf(_format) : pos_inf(_format);
        }
        return big_float { std::move(res), _format };
    }

    big_float big_float::subtract(const big_float &y) const
    {
        return add(y.negate());
    }

    big_float big_float::multiply(const big_float &y) const
    {
        _check_format(y, "multiply");
        if (is_nan() || y.is_nan() || (is_infinite() && y.is_zero()) || (y.is_infinite() && is_zero())) {
            if (is_special() || y.is_special())
                logger::trace("{} * {} is NaN", *this, y);
            return nan(_format);
        }
        const bool neg = sign() != y.sign();
        if (is_special() || y.is_special())
            return neg ? neg_inf(_format) : pos_inf(_format);

        const auto &xf = _finite();
        const auto &yf = y._finite();
        const cpp_int hidden = _format.hidden_bit();
        cpp_int xsig = xf.significand;
        cpp_int xexp = xf.exponent;
        cpp_int ysig = yf.significand;
        cpp_int yexp = yf.exponent;
        if (xexp > 0)
            xsig += hidden;
        else
            xexp += 1;
        if (yexp > 0)
            ysig += hidden;
        else
            yexp += 1;

        cpp_int prod = xsig * ysig;
        cpp_int exp = xexp + yexp - _format.bias();
        exp -= significand_size() - 1;
        auto res = renormalize(std::move(prod), std::move(exp), neg, _format);
        if (res.exponent >= _format.max_exponent()) {
            logger::trace("{} * {} overflows to infinity", *this, y);
            return neg ? neg_inf(_format) : pos_inf(_format);
        }
        return big_float { std::move(res), _format };
    }

    int big_float::compare(const big_float &that) const
    {
        _check_format(that, "compare");
        if (is_finite() && that.is_finite()) {
            const auto &x = _finite();
            const auto &y = that._finite();
            // zeros of both signs form their own class
            const int cmp_this = is_zero() ? 0 : (x.sign ? -1 : 1);
            const int cmp_that = that.is_zero() ? 0 : (y.sign ? -1 : 1);
            if (cmp_this == cmp_that) {
                if (x.exponent == y.exponent)
                    return cmp_this * sign_of(x.significand.compare(y.significand));
                return cmp_this * sign_of(x.exponent.compare(y.exponent));
            }
            if (cmp_this == 0)
                return -cmp_that;
            return cmp_this;
        }
        return sign_of(order_rank(*this) - order_rank(that));
    }

    bool big_float::eq(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return false;
        return compare(o) == 0;
    }

    bool big_float::ne(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return true;
        return compare(o) != 0;
    }

    bool big_float::lt(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return false;
        return compare(o) < 0;
    }

    bool big_float::gt(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return false;
        return compare(o) > 0;
    }

    bool big_float::le(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return false;
        return compare(o) <= 0;
    }

    bool big_float::ge(const big_float &o) const
    {
        _check_format(o, "compare");
        if (is_nan() || o.is_nan())
            return false;
        return compare(o) >= 0;
    }

    floor_ceiling_result big_float::floor_ceiling() const
    {
        if (is_special())
            throw special_value_error(fmt::format("floor_ceiling cannot be computed for a special value: {}", to_string()));
        const auto &f = _finite();
        cpp_int sig = f.significand;
        cpp_int exp = f.exponent;
        if (exp > 0)
            sig += _format.hidden_bit();
        else
            exp += 1;
        // the power of two of the integer sig
        exp -= _format.bias();
        exp -= significand_size() - 1;

        floor_ceiling_result res {};
        if (exp >= 0) {
            sig <<= to_shift(exp);
            if (f.sign)
                sig = -sig;
            res.floor = sig;
            res.ceiling = sig;
        } else if (-exp > significand_size()) {
            // the value lies strictly between -1 and 1
            if (sig != 0) {
                res.ceiling = f.sign ? 0 : 1;
                res.floor = res.ceiling - 1;
            }
        } else {
            const uint64_t frac_bits = to_shift(-exp);
            const cpp_int frac = sig & (pow2(frac_bits) - 1);
            sig >>= frac_bits;
            if (f.sign)
                sig = -sig;
            if (frac == 0) {
                res.floor = sig;
                res.ceiling = sig;
            } else {
                res.ceiling = f.sign ? sig : cpp_int { sig + 1 };
                res.floor = res.ceiling - 1;
            }
        }
        if (res.floor > res.ceiling) [[unlikely]]
            throw invariant_error(fmt::format("floor_ceiling of {} produced floor {} > ceiling {}", to_string(), res.floor, res.ceiling));
        return res;
    }

    std::string big_float::to_string() const
    {
        if (const auto sv = special(); sv) {
            switch (*sv) {
                case special_value::nan: return fmt::format("0NaN{}", _format);
                case special_value::pos_inf: return fmt::format("0+oo{}", _format);
                case special_value::neg_inf: return fmt::format("0-oo{}", _format);
                default: throw error(fmt::format("unsupported special value: {}", static_cast<int>(*sv)));
            }
        }
        const auto &f = _finite();
        const std::string_view sign_str { f.sign ? "-" : "" };
        if (is_zero())
            return fmt::format("{}0x0.0e0f{}", sign_str, _format);

        // value = m * 2^(e - field)
        const uint64_t field = _format.field_size();
        cpp_int m = f.significand;
        cpp_int e {};
        if (f.exponent > 0) {
            m += _format.hidden_bit();
            e = f.exponent - _format.bias();
        } else {
            e = 1 - _format.bias();
        }
        // e = 4 * k + r with r in [0, 4): the r extra bits go to the integer hex digit
        cpp_int r_big = e % 4;
        if (r_big < 0)
            r_big += 4;
        const cpp_int k = (e - r_big) / 4;
        const auto r = static_cast<uint64_t>(r_big);
        const uint64_t frac_bits = field + (4 - field % 4) % 4;
        m <<= r + frac_bits - field;
        const cpp_int int_part = m >> frac_bits;
        const cpp_int frac = m & (pow2(frac_bits) - 1);

        std::string frac_hex {};
        for (uint64_t i = frac_bits / 4; i > 0; --i) {
            const cpp_int nibble = (frac >> (4 * (i - 1))) & 0xF;
            frac_hex += hex_digits[static_cast<unsigned>(nibble)];
        }
        while (frac_hex.size() > 1 && frac_hex.back() == '0')
            frac_hex.pop_back();
        return fmt::format("{}0x{}.{}e{}f{}", sign_str, hex_digits[static_cast<unsigned>(int_part)], frac_hex, k, _format);
    }
}
