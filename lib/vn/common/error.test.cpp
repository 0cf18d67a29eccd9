/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <optional>
#include <vn/common/test.hpp>
#include <vn/common/error.hpp>
#include <vn/num-error.hpp>

using namespace verinum;

template<typename E=error, typename F>
void expect_throws_msg(const F &f, const std::string &prefix, const std::source_location &src_loc=std::source_location::current())
{
    const auto msg = thrown_msg<E>(f);
    expect(static_cast<bool>(msg)) << "no exception has been thrown";
    if (msg) {
        const auto descr = fmt::format("'{}' does not start with '{}' from {}:{}", *msg, prefix, src_loc.file_name(), src_loc.line());
        test_same(descr, true, msg->starts_with(prefix));
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
        };
        "integers"_test = [] {
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", 123)); }, "Hello 123!");
        };
        "nested"_test = [] {
            expect_throws_msg([] {
                try {
                    throw std::runtime_error("inner");
                } catch (const std::exception &ex) {
                    throw error("outer", ex);
                }
            }, "outer caused by ");
        };
        "numeric errors"_test = [] {
            expect_throws_msg<invalid_syntax_error>([] { throw invalid_syntax_error("bad digit"); }, "bad digit");
            expect_throws_msg<error>([] { throw format_mismatch_error("24e8 vs 53e11"); }, "24e8 vs 53e11");
            expect(throws<std::exception>([] { throw invariant_error("broken"); }));
            expect(!thrown_msg<size_out_of_range_error>([] { }));
        };
    };
};
