#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace shapesql {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShapesqlConfig config;

        static LoadResult ok(ShapesqlConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to shapesql.toml
     * @return LoadResult with parsed config or error
     *
     * Relative [[shapes]] paths are resolved against the config file's directory.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // All validation failures, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ShapesqlConfig& config);

private:
    static LoadResult validate_and_return(ShapesqlConfig config);
};

} // namespace shapesql
