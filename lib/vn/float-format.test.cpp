/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <vn/common/test.hpp>
#include <vn/float-format.hpp>

using namespace verinum;

suite float_format_suite = [] {
    "float_format"_test = [] {
        "binary32"_test = [] {
            const auto f = float_format::binary32();
            test_same(uint32_t { 24 }, f.significand_size());
            test_same(uint32_t { 8 }, f.exponent_size());
            test_same(uint32_t { 23 }, f.field_size());
            test_same(cpp_int { 127 }, f.bias());
            test_same(cpp_int { 1 << 23 }, f.hidden_bit());
            test_same(cpp_int { 255 }, f.max_exponent());
            test_same(std::string { "24e8" }, f.to_string());
            test_same(std::string { "24e8" }, fmt::format("{}", f));
        };
        "presets"_test = [] {
            test_same(cpp_int { 15 }, float_format::binary16().bias());
            test_same(cpp_int { 1023 }, float_format::binary64().bias());
            test_same(cpp_int { 16383 }, float_format::binary128().bias());
        };
        "from_sizes"_test = [] {
            expect(float_format::from_sizes("53", "11") == float_format::binary64());
            expect(float_format::from_sizes("53", "11") != float_format::binary32());
            expect(throws<invalid_syntax_error>([] { float_format::from_sizes("x", "8"); }));
            expect(throws<invalid_syntax_error>([] { float_format::from_sizes("24", ""); }));
            expect(throws<invalid_syntax_error>([] { float_format::from_sizes("-24", "8"); }));
            expect(throws<size_out_of_range_error>([] { float_format::from_sizes("1", "8"); }));
            expect(throws<size_out_of_range_error>([] { float_format::from_sizes("24", "99999999999999999999999"); }));
        };
        "bounds"_test = [] {
            expect(throws<size_out_of_range_error>([] { float_format { 24, 1 }; }));
            expect(throws<size_out_of_range_error>([] { float_format { 0, 8 }; }));
            expect(throws<size_out_of_range_error>([] { float_format { uint64_t { 1 } << 33, 8 }; }));
            expect(nothrow([] { float_format { 2, 2 }; }));
            test_same(uint32_t { 1 }, float_format(2, 2).field_size());
            test_same(cpp_int { 3 }, float_format(2, 2).max_exponent());
        };
    };
};
