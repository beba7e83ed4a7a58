// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the PolicyMiner CLI
// Allows loading extraction and output defaults from YAML configuration files

#ifndef POLICYMINER_CLI_CONFIG_HPP
#define POLICYMINER_CLI_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>

namespace policyminer {

/// Configuration structure for the PolicyMiner CLI
struct CliConfig {
    // === Extraction Settings ===
    struct Extraction {
        double min_support = 0.05;
        double min_confidence = 0.6;
        double min_lift = 1.0;
        std::string name = "Mined Policy Set";
        size_t num_threads = 1;
    } extraction;

    // === Output Settings ===
    struct Output {
        std::string format = "text";     // text, markdown or json
        size_t max_policies = 50;        // Policies rendered by `format`
        size_t summary_policies = 10;    // Policies echoed after `extract`
    } output;

    // === Interface Settings ===
    struct Interface {
        bool verbose = false;
    } interface;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    /// @return YAML representation of configuration
    std::string ToYamlString() const;

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace policyminer

#endif // POLICYMINER_CLI_CONFIG_HPP
