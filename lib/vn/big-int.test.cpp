/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <vn/common/test.hpp>
#include <vn/big-int.hpp>

using namespace verinum;

suite big_int_suite = [] {
    "big_int"_test = [] {
        "powers"_test = [] {
            test_same(cpp_int { 1 }, pow2(0));
            test_same(cpp_int { 1024 }, pow2(10));
            test_same(std::string { "18446744073709551616" }, pow2(64).str());
            test_same(cpp_int { 1000 }, pow10(3));
            expect(throws<size_out_of_range_error>([] { pow10(uint64_t { 1 } << 40); }));
        };
        "bit_length"_test = [] {
            test_same(uint64_t { 0 }, bit_length(0));
            test_same(uint64_t { 1 }, bit_length(1));
            test_same(uint64_t { 4 }, bit_length(8));
            test_same(uint64_t { 4 }, bit_length(-8));
            test_same(uint64_t { 65 }, bit_length(pow2(64)));
            test_same(uint64_t { 71 }, bit_length(cpp_int { -pow2(70) }));
        };
        "digit_count"_test = [] {
            test_same(uint64_t { 1 }, digit_count(0));
            test_same(uint64_t { 3 }, digit_count(-123));
            test_same(uint64_t { 21 }, digit_count(pow10(20)));
            test_same(uint64_t { 41 }, digit_count(cpp_int { -pow10(40) }));
        };
        "to_shift"_test = [] {
            test_same(uint64_t { 17 }, to_shift(17));
            expect(throws<size_out_of_range_error>([] { to_shift(-1); }));
            expect(throws<size_out_of_range_error>([] { to_shift(pow2(40)); }));
        };
        "shift_right_floor"_test = [] {
            test_same(cpp_int { 2 }, shift_right_floor(5, 1));
            test_same(cpp_int { -3 }, shift_right_floor(-5, 1));
            test_same(cpp_int { -2 }, shift_right_floor(-4, 1));
            test_same(cpp_int { -1 }, shift_right_floor(-1, 10));
            test_same(cpp_int { 0 }, shift_right_floor(1, 10));
        };
        "from_dec"_test = [] {
            test_same(cpp_int { -42 }, *big_int_from_dec("-42"));
            test_same(cpp_int { 7 }, *big_int_from_dec("+7"));
            test_same(std::string { "123456789012345678901234567890" }, big_int_from_dec("123456789012345678901234567890")->str());
            expect(!big_int_from_dec(""));
            expect(!big_int_from_dec("-"));
            expect(!big_int_from_dec("1a"));
            expect(!big_int_from_dec(" 1"));
        };
        "format"_test = [] {
            test_same(std::string { "-12" }, fmt::format("{}", cpp_int { -12 }));
            test_same(std::string { "x=1024" }, fmt::format("x={}", pow2(10)));
            test_same(std::string { "-42" }, fmt::format("{}", big_int_from_dec("-42")));
            test_same(std::string { "std::nullopt" }, fmt::format("{}", big_int_from_dec("4x2")));
        };
    };
};
