/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vn/common/test.hpp>
#include <vn/big-float.hpp>
#include <vn/config.hpp>

using namespace verinum;

namespace {
    static void my_setenv(const char *name, const char *val)
    {
        if (name == nullptr)
            throw error("my_setenv: name cannot be null!");
        if (val != nullptr)
            setenv(name, val, 1);
        else
            unsetenv(name);
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "presets"_test = [] {
            const format_registry reg {};
            test_same(size_t { 4 }, reg.formats().size());
            expect(reg.at("binary16") == float_format::binary16());
            expect(reg.at("binary32") == float_format::binary32());
            expect(reg.at("binary64") == float_format::binary64());
            expect(reg.at("binary128") == float_format::binary128());
            expect(!reg.contains("binary256"));
            expect(throws<error>([&] { reg.at("binary256"); }));
        };
        "load_json"_test = [] {
            format_registry reg {};
            reg.load_json(R"({ "bfloat16": { "significand": 8, "exponent": 8 }, "binary32": { "significand": 24, "exponent": 9 } })");
            expect(reg.at("bfloat16") == float_format { 8, 8 });
            // existing entries are replaced
            expect(reg.at("binary32") == float_format { 24, 9 });
            test_same(size_t { 5 }, reg.formats().size());
            const auto one = big_float::from_int(1, reg.at("bfloat16"));
            test_same(std::string { "0x1.0e0f8e8" }, one.to_string());
        };
        "load_json errors"_test = [] {
            format_registry reg {};
            expect(throws<error>([&] { reg.load_json("{"); }));
            expect(throws<error>([&] { reg.load_json("[]"); }));
            expect(throws<error>([&] { reg.load_json(R"({ "x": 1 })"); }));
            expect(throws<error>([&] { reg.load_json(R"({ "x": { "significand": 8 } })"); }));
            expect(throws<error>([&] { reg.load_json(R"({ "x": { "significand": "8", "exponent": 8 } })"); }));
            expect(throws<error>([&] { reg.load_json(R"({ "": { "significand": 8, "exponent": 8 } })"); }));
            expect(throws<size_out_of_range_error>([&] { reg.load_json(R"({ "x": { "significand": -8, "exponent": 8 } })"); }));
            expect(throws<size_out_of_range_error>([&] { reg.load_json(R"({ "x": { "significand": 1, "exponent": 8 } })"); }));
            expect(!reg.contains("x"));
        };
        "load_file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "vn-config-test-formats.json").string();
            {
                std::ofstream os { path, std::ios::binary };
                os << R"({ "tiny": { "significand": 4, "exponent": 3 } })";
            }
            format_registry reg {};
            reg.load_file(path);
            expect(reg.at("tiny") == float_format { 4, 3 });
            {
                std::ofstream os { path, std::ios::binary };
                os << R"({ "bad": { "significand": 1, "exponent": 3 } })";
            }
            const auto msg = thrown_msg<error>([&] { reg.load_file(path); });
            expect(msg && msg->starts_with("failed to load float formats from " + path + " caused by ")) << msg.value_or("");
            expect(!reg.contains("bad"));
            std::filesystem::remove(path);
            expect(throws<error>([&] { reg.load_file(path); }));
        };
        "default_path"_test = [] {
            const char *prev = std::getenv("VN_FORMATS");
            const std::optional<std::string> saved = prev ? std::optional<std::string> { prev } : std::nullopt;
            my_setenv("VN_FORMATS", "./formats-missing.json");
            test_same(std::string { "./formats-missing.json" }, *format_registry::default_path());
            my_setenv("VN_FORMATS", nullptr);
            expect(!format_registry::default_path());
            if (saved)
                my_setenv("VN_FORMATS", saved->c_str());
        };
    };
};
