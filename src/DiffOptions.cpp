/**
 * @file DiffOptions.cpp
 * @brief Diff options lookup and file loading
 *
 * Loads options from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "jpatch/DiffOptions.hpp"
#include "jpatch/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jpatch {

std::optional<std::string> DiffOptions::identity_key_for(const std::string& pointer) const {
    auto it = list_identity_by_pointer.find(pointer);
    if (it == list_identity_by_pointer.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Get file extension (lowercase), including the dot.
 */
std::string file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw OptionsError("Cannot open diff options file: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to a document Value.
 *
 * Dates and times have no JSON counterpart and become strings.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value load_json_options(const std::string& path) {
    std::string content = read_file(path);
    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        throw OptionsError("Parse error in '" + path + "': " + e.what());
    }
}

Value load_toml_options(const std::string& path) {
    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Parse error in '" << path << "' at line " << e.source().begin.line
            << ", column " << e.source().begin.column << ": " << e.description();
        throw OptionsError(oss.str());
    }
    return toml_value_to_json(table);
}

} // anonymous namespace

// ============================================================================
// Options from values and files
// ============================================================================

DiffOptions diff_options_from_value(const Value& value) {
    if (!value.is_object()) {
        throw OptionsError("Diff options must be an object, got " + type_name(value));
    }

    DiffOptions options;

    auto identity = value.find("identity");
    if (identity != value.end()) {
        if (!identity->is_object()) {
            throw OptionsError("'identity' must map pointers to key names, got " +
                               type_name(*identity));
        }
        for (auto it = identity->begin(); it != identity->end(); ++it) {
            if (!it.value().is_string()) {
                throw OptionsError("Identity key for '" + it.key() + "' must be a string, got " +
                                   type_name(it.value()));
            }
            options.list_identity_by_pointer[it.key()] = it.value().get<std::string>();
        }
    }

    auto use_lcs = value.find("use_lcs");
    if (use_lcs != value.end()) {
        if (!use_lcs->is_boolean()) {
            throw OptionsError("'use_lcs' must be a boolean, got " + type_name(*use_lcs));
        }
        options.use_lcs = use_lcs->get<bool>();
    }

    auto max_depth = value.find("max_depth");
    if (max_depth != value.end()) {
        if (!max_depth->is_number_integer() ||
            (!max_depth->is_number_unsigned() && max_depth->get<std::int64_t>() < 0)) {
            throw OptionsError("'max_depth' must be a non-negative integer, got " +
                               max_depth->dump());
        }
        options.max_depth = max_depth->get<std::size_t>();
    }

    return options;
}

DiffOptions load_diff_options(const std::string& path) {
    if (!file_exists(path)) {
        throw OptionsError("Diff options file not found: " + path);
    }

    const std::string ext = file_extension(path);
    if (ext == ".json") {
        return diff_options_from_value(load_json_options(path));
    }
    if (ext == ".toml") {
        return diff_options_from_value(load_toml_options(path));
    }

    throw OptionsError("Unsupported diff options format '" + ext + "' (expected .json or .toml)");
}

} // namespace jpatch
