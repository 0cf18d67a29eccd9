/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef VERINUM_CONFIG_HPP
#define VERINUM_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vn/float-format.hpp>

namespace verinum {
    /*
     * Named floating-point formats. Starts with the IEEE binary16/32/64/128 presets
     * and can be extended with a JSON object of the form:
     * { "name": { "significand": 24, "exponent": 8 }, ... }
     */
    struct format_registry {
        using map_type = std::map<std::string, float_format, std::less<>>;

        // the process-wide registry, extended with the file named by VN_FORMATS if set
        static const format_registry &get();
        static std::optional<std::string> default_path();

        explicit format_registry();

        void load_json(std::string_view json_text);
        void load_file(const std::string &path);
        void add(const std::string &name, const float_format &fmt);

        [[nodiscard]] const float_format &at(std::string_view name) const;

        [[nodiscard]] bool contains(const std::string_view name) const
        {
            return _formats.find(name) != _formats.end();
        }

        [[nodiscard]] const map_type &formats() const
        {
            return _formats;
        }
    private:
        map_type _formats {};
    };
}

#endif // !VERINUM_CONFIG_HPP
