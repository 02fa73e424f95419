#ifndef AIPACS_CONFIG_CONFIG_LOADER_H
#define AIPACS_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief Configuration file loader with YAML and JSON support
 *
 * Loads and validates pipeline configuration files. Features include:
 *   - Automatic format detection by file extension
 *   - Environment variable substitution (${VAR} syntax)
 *   - Durations with unit suffix (500ms, 30s, 5m, 1h, 2d; bare numbers
 *     are seconds)
 *   - Validation with per-field error details
 *
 * Supported environment variable syntax:
 *   - ${VAR} - Required variable (error if not set)
 *   - ${VAR:-default} - Optional with default value
 *
 * The YAML reader covers the subset configuration files use: nested
 * mappings, scalars, block lists of scalars and flow lists ([a, b]).
 *
 * @example Loading Configuration
 * ```cpp
 * auto result = config_loader::load("/etc/ai_pacs/config.yaml");
 * if (!result) {
 *     std::cerr << result.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto config = std::move(result.value());
 * ```
 */

#include "aipacs/config/pipeline_config.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::config {

// =============================================================================
// Load Result Types
// =============================================================================

/**
 * @brief Detailed error information from configuration loading
 */
struct config_load_error {
    config_error code;

    /** Human-readable error message */
    std::string message;

    /** File path where error occurred (if applicable) */
    std::optional<std::filesystem::path> file_path;

    /** Line number where error occurred (if applicable) */
    std::optional<size_t> line_number;

    /** Validation errors (if validation failed) */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Get formatted error message with location
     */
    [[nodiscard]] std::string to_string() const;
};

using config_result = std::expected<pipeline_config, config_load_error>;

// =============================================================================
// Configuration Loader
// =============================================================================

/**
 * @brief Configuration file loader
 *
 * Static class providing configuration loading and validation functions.
 */
class config_loader {
public:
    // =========================================================================
    // File Loading
    // =========================================================================

    /**
     * @brief Load configuration from file (auto-detect format)
     *
     *   - .yaml, .yml -> YAML format
     *   - .json -> JSON format
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_yaml(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_json(const std::filesystem::path& path);

    // =========================================================================
    // String Loading
    // =========================================================================

    [[nodiscard]] static config_result load_yaml_string(
        std::string_view yaml_content,
        std::string_view source_name = "<string>");

    [[nodiscard]] static config_result load_json_string(
        std::string_view json_content,
        std::string_view source_name = "<string>");

    // =========================================================================
    // Validation
    // =========================================================================

    [[nodiscard]] static std::vector<validation_error_info> validate(
        const pipeline_config& config);

    // =========================================================================
    // Saving
    // =========================================================================

    [[nodiscard]] static std::expected<void, config_load_error> save_yaml(
        const pipeline_config& config, const std::filesystem::path& path);

    [[nodiscard]] static std::expected<void, config_load_error> save_json(
        const pipeline_config& config, const std::filesystem::path& path);

    // =========================================================================
    // Serialization
    // =========================================================================

    /**
     * @brief Serialize configuration to YAML
     *
     * The output loads back into an equal configuration.
     */
    [[nodiscard]] static std::string to_yaml(const pipeline_config& config);

    [[nodiscard]] static std::string to_json(const pipeline_config& config,
                                             bool pretty = true);

    // =========================================================================
    // Value Parsing
    // =========================================================================

    /**
     * @brief Expand environment variables in a string
     *
     * @return Expanded string or error if a required variable is missing
     */
    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    [[nodiscard]] static bool needs_env_expansion(std::string_view value);

    /**
     * @brief Parse a duration ("500ms", "30s", "5m", "1h", "2d", "45")
     */
    [[nodiscard]] static std::optional<std::chrono::milliseconds> parse_duration(
        std::string_view value);

    [[nodiscard]] static pipeline_config get_default_config();

private:
    config_loader() = delete;
    ~config_loader() = delete;
    config_loader(const config_loader&) = delete;
    config_loader& operator=(const config_loader&) = delete;
};

}  // namespace aipacs::config

#endif  // AIPACS_CONFIG_CONFIG_LOADER_H
