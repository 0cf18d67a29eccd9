/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <boost/json.hpp>
#include <vn/config.hpp>
#include <vn/logger.hpp>

namespace verinum {
    namespace json = boost::json;

    static uint64_t size_from_json(const json::object &obj, const std::string_view name, const std::string_view key)
    {
        const auto it = obj.find(key);
        if (it == obj.end())
            throw error(fmt::format("format {} does not have the element {}!", name, key));
        const auto &v = it->value();
        if (v.is_uint64())
            return v.get_uint64();
        if (v.is_int64()) {
            if (v.get_int64() < 0)
                throw size_out_of_range_error(fmt::format("format {} has a negative {} size: {}", name, key, v.get_int64()));
            return static_cast<uint64_t>(v.get_int64());
        }
        throw error(fmt::format("format {} element {} must be an integer but got: {}", name, key, json::serialize(v)));
    }

    const format_registry &format_registry::get()
    {
        static format_registry reg = [] {
            format_registry r {};
            if (const auto path = default_path(); path)
                r.load_file(*path);
            return r;
        }();
        return reg;
    }

    std::optional<std::string> format_registry::default_path()
    {
        if (const char *env_path = std::getenv("VN_FORMATS"); env_path && *env_path)
            return env_path;
        return {};
    }

    format_registry::format_registry()
    {
        add("binary16", float_format::binary16());
        add("binary32", float_format::binary32());
        add("binary64", float_format::binary64());
        add("binary128", float_format::binary128());
    }

    void format_registry::add(const std::string &name, const float_format &fmt)
    {
        if (name.empty())
            throw error("a format name must not be empty!");
        const auto [it, created] = _formats.insert_or_assign(name, fmt);
        logger::debug("float format {}: {}{}", name, it->second, created ? "" : " (replaced)");
    }

    void format_registry::load_json(const std::string_view json_text)
    {
        json::error_code ec {};
        const auto parsed = json::parse(json_text, ec);
        if (ec)
            throw error(fmt::format("failed to parse format configuration: {}", ec.message()));
        if (!parsed.is_object())
            throw error("format configuration must be a JSON object!");
        for (const auto &[key, val]: parsed.get_object()) {
            const std::string name { key };
            if (!val.is_object())
                throw error(fmt::format("format {} must be a JSON object but got: {}", name, json::serialize(val)));
            const auto &obj = val.get_object();
            add(name, float_format { size_from_json(obj, name, "significand"), size_from_json(obj, name, "exponent") });
        }
    }

    void format_registry::load_file(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error(fmt::format("cannot open format configuration file: {}", path));
        const std::string text { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        logger::debug("loading float formats from {}", path);
        try {
            load_json(text);
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load float formats from {}", path), ex);
        }
    }

    const float_format &format_registry::at(const std::string_view name) const
    {
        const auto it = _formats.find(name);
        if (it == _formats.end())
            throw error(fmt::format("there is no float format named {}!", name));
        return it->second;
    }
}
