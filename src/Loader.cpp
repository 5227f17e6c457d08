/**
 * @file Loader.cpp
 * @brief JSON and TOML source loading
 */

#include "morph/Loader.hpp"
#include "morph/Errors.hpp"
#include "morph/Log.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace morph {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief 1-based line and column of byte offset @p pos in @p text
 */
std::pair<int, int> locate(const std::string& text, std::size_t pos) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(pos, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

template <typename T>
Value to_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return Value(ss.str());
}

/**
 * @brief Convert a toml++ node to a Value
 */
Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return to_text(node.as_date()->get());

        case toml::node_type::time:
            return to_text(node.as_time()->get());

        case toml::node_type::date_time:
            return to_text(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

Value parse_json(const std::string& text, const std::string& source) {
    try {
        return Value::parse(text);
    } catch (const Value::parse_error& e) {
        // byte is 1-based: the position of the offending character
        const auto [line, column] = locate(text, e.byte > 0 ? e.byte - 1 : 0);
        throw ParseError(source, line, column, e.what());
    }
}

Value parse_toml(const std::string& text, const std::string& source) {
    try {
        return toml_to_value(toml::parse(text, source));
    } catch (const toml::parse_error& e) {
        throw ParseError(
            source,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    logger()->debug("loading JSON source {}", path);
    return parse_json(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    logger()->debug("loading TOML source {}", path);
    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_to_value(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormat(ext);
}

} // namespace morph
