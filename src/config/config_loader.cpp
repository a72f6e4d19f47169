#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>

using namespace std::string_literals;

namespace ormcost {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace each ${NAME} in `text` with the variable's value (empty when unset)
 * @throws std::runtime_error on a "${" with no closing brace
 */
std::string substitute_env(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    for (;;) {
        const size_t open = text.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            return out;
        }
        out.append(text.substr(pos, open - pos));

        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
}

// Walks tables and arrays alike; only string leaves are rewritten
void substitute_env(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = substitute_env(std::string_view{str->get()});
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, child] : *tbl) substitute_env(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env(child);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    substitute_env(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    substitute_env(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

size_t toml_size(const toml::table& tbl, const std::string_view key,
                 const std::string_view section, const size_t default_val) {
    const int64_t raw = tbl[key].value_or(static_cast<int64_t>(default_val));
    if (raw < 0) {
        throw std::runtime_error(
            std::format("{}.{} must not be negative, got {}", section, key, raw));
    }
    return static_cast<size_t>(raw);
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CorrelatorConfig extract_correlator(const toml::table& root) {
    CorrelatorConfig cfg;
    const auto* correlator = root["correlator"].as_table();
    if (!correlator) return cfg;

    cfg.internal_prefixes = toml_string_array(*correlator, "internal_prefixes");
    return cfg;
}

CaptureConfig extract_capture(const toml::table& root) {
    CaptureConfig cfg;
    const auto* capture = root["capture"].as_table();
    if (!capture) return cfg;
    const auto& c = *capture;

    cfg.record_parameters = c["record_parameters"].value_or(false);
    cfg.max_statement_length = toml_size(c, "max_statement_length", "capture",
                                         cfg.max_statement_length);
    cfg.max_events_per_unit = toml_size(c, "max_events_per_unit", "capture",
                                        cfg.max_events_per_unit);
    return cfg;
}

TrackerConfig extract_tracker(const toml::table& root) {
    TrackerConfig cfg;
    const auto* tracker = root["tracker"].as_table();
    if (!tracker) return cfg;

    cfg.retain_read_counts = (*tracker)["retain_read_counts"].value_or(true);
    return cfg;
}

EngineConfig extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    config.logging = extract_logging(tbl);
    config.correlator = extract_correlator(tbl);
    config.capture = extract_capture(tbl);
    config.tracker = extract_tracker(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
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
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            config.logging.level));
    }

    for (size_t i = 0; i < config.correlator.internal_prefixes.size(); ++i) {
        if (config.correlator.internal_prefixes[i].empty()) {
            errors.push_back(std::format(
                "correlator.internal_prefixes[{}] must not be empty", i));
        }
    }

    if (config.capture.max_events_per_unit == 0) {
        errors.push_back("capture.max_events_per_unit must be > 0");
    }

    return errors;
}

} // namespace ormcost
