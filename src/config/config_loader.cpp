#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace shapesql {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Substitute ${NAME} with the environment value, or nothing when unset.
 * @throws std::runtime_error on an unterminated ${
 */
std::string expand_env_vars(const std::string& input) {
    size_t open = input.find("${");
    if (open == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (open != std::string::npos) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        result.append(input, pos, open - pos);
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        pos = close + 1;
        open = input.find("${", pos);
    }
    result.append(input, pos, std::string::npos);
    return result;
}

// Walk tables and arrays, expanding every string value in place
void expand_env_vars_in_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        auto expanded = expand_env_vars(str->get());
        if (expanded != str->get()) {
            *str = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_vars_in_node(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_vars_in_node(child);
    }
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    cfg.format = utils::to_lower(o["format"].value_or("sql"s));
    cfg.schema = o["schema"].value_or(""s);
    cfg.if_not_exists = o["if_not_exists"].value_or(false);
    cfg.file = o["file"].value_or(""s);
    return cfg;
}

std::vector<std::string> extract_shape_paths(const toml::table& root) {
    std::vector<std::string> result;
    const auto* arr = root["shapes"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        result.push_back((*tbl)["path"].value_or(""s));
    }
    return result;
}

ShapesqlConfig extract_all_sections(const toml::table& root) {
    ShapesqlConfig config;
    config.logging = extract_logging(root);
    config.output = extract_output(root);
    config.shape_paths = extract_shape_paths(root);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ShapesqlConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_in_node(tbl);
        auto config = extract_all_sections(tbl);

        namespace fs = std::filesystem;
        const fs::path base_dir = fs::path(config_path).parent_path();
        for (auto& path : config.shape_paths) {
            if (!path.empty() && fs::path(path).is_relative()) {
                path = (base_dir / path).lexically_normal().string();
            }
        }
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_in_node(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ShapesqlConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.output.format != "sql" && config.output.format != "json") {
        errors.push_back(std::format(
            "output.format must be 'sql' or 'json', got '{}'", config.output.format));
    }

    for (size_t i = 0; i < config.shape_paths.size(); ++i) {
        if (config.shape_paths[i].empty()) {
            errors.push_back(std::format("shapes[{}].path must not be empty", i));
        }
    }

    return errors;
}

} // namespace shapesql
