#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace ormcost {

// ============================================================================
// ConfigLoader - Extract typed engine config from TOML
// ============================================================================

/**
 * @brief Loads EngineConfig from TOML (toml++), with ${ENV} expansion
 *
 * Recognized sections: [logging], [correlator], [capture], [tracker].
 * Unknown keys are ignored; missing keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
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
     * @param config_path Path to ormcost.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config for values the engine cannot run with
     * @return One message per problem; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace ormcost
