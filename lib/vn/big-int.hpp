/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_BIG_INT_HPP
#define VERINUM_BIG_INT_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <vn/common/format.hpp>
#include <vn/num-error.hpp>

namespace verinum {
    using boost::multiprecision::cpp_int;

    inline cpp_int pow2(const uint64_t n)
    {
        cpp_int val { 1 };
        val <<= n;
        return val;
    }

    inline cpp_int pow10(const uint64_t n)
    {
        if (n > std::numeric_limits<uint32_t>::max()) [[unlikely]]
            throw size_out_of_range_error(fmt::format("a power of ten with exponent {} is outside of the supported range", n));
        return boost::multiprecision::pow(cpp_int { 10 }, static_cast<unsigned>(n));
    }

    // the number of bits needed to represent the magnitude of v, 0 for 0
    inline uint64_t bit_length(const cpp_int &v)
    {
        if (v == 0)
            return 0;
        return boost::multiprecision::msb(cpp_int { boost::multiprecision::abs(v) }) + 1;
    }

    // the number of decimal digits in the magnitude of v, 1 for 0
    inline uint64_t digit_count(const cpp_int &v)
    {
        const auto s = cpp_int { boost::multiprecision::abs(v) }.str();
        return s.size();
    }

    // converts a big shift or repetition count to a machine word
    inline uint64_t to_shift(const cpp_int &v)
    {
        if (v < 0 || v > std::numeric_limits<uint32_t>::max()) [[unlikely]]
            throw size_out_of_range_error(fmt::format("a shift by {} bits is outside of the supported range", v.str()));
        return static_cast<uint64_t>(v);
    }

    // arithmetic right shift: rounds toward negative infinity for negative values
    inline cpp_int shift_right_floor(const cpp_int &v, const uint64_t n)
    {
        if (v >= 0)
            return v >> n;
        cpp_int mag = -v;
        mag += pow2(n) - 1;
        mag >>= n;
        return -mag;
    }

    // parses an optionally signed decimal integer, nullopt if the text is not one
    inline std::optional<cpp_int> big_int_from_dec(std::string_view text)
    {
        bool neg = false;
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            neg = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty())
            return {};
        cpp_int val {};
        for (const char c: text) {
            if (c < '0' || c > '9')
                return {};
            val *= 10;
            val += c - '0';
        }
        if (neg)
            val = -val;
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !VERINUM_BIG_INT_HPP
