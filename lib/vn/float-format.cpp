/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <vn/float-format.hpp>

namespace verinum {
    static uint64_t parse_size(const std::string_view text, const std::string_view name)
    {
        uint64_t val = 0;
        const auto *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, val);
        if (text.empty() || ptr != end)
            throw invalid_syntax_error(fmt::format("the {} size must be a decimal integer but got: '{}'", name, text));
        if (ec == std::errc::result_out_of_range)
            throw size_out_of_range_error(fmt::format("the {} size is too big: {}", name, text));
        return val;
    }

    float_format float_format::from_sizes(const std::string_view significand_size, const std::string_view exponent_size)
    {
        const auto exp_size = parse_size(exponent_size, "exponent");
        const auto sig_size = parse_size(significand_size, "significand");
        return float_format { sig_size, exp_size };
    }

    float_format::float_format(const uint64_t significand_size, const uint64_t exponent_size)
    {
        if (exponent_size <= 1 || exponent_size > std::numeric_limits<uint32_t>::max())
            throw size_out_of_range_error(fmt::format("exponent size must be greater than 1 but got: {}", exponent_size));
        if (significand_size <= 1 || significand_size > std::numeric_limits<uint32_t>::max())
            throw size_out_of_range_error(fmt::format("significand size must be greater than 1 but got: {}", significand_size));
        _significand_size = static_cast<uint32_t>(significand_size);
        _exponent_size = static_cast<uint32_t>(exponent_size);
    }

    cpp_int float_format::bias() const
    {
        return pow2(_exponent_size - 1) - 1;
    }

    cpp_int float_format::hidden_bit() const
    {
        return pow2(_significand_size - 1);
    }

    cpp_int float_format::max_exponent() const
    {
        return pow2(_exponent_size) - 1;
    }

    std::string float_format::to_string() const
    {
        return fmt::format("{}e{}", _significand_size, _exponent_size);
    }
}
