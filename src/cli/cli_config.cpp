// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the PolicyMiner CLI

#include "cli/cli_config.hpp"
#include "mining/policy_extractor.hpp"
#include "mining/value_coercion.hpp"
#include <yaml.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace policyminer {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Helper to quote a string as a double-quoted YAML scalar
static std::string QuoteYaml(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20 || byte == 0x7f) {
            char escape[8];
            std::snprintf(escape, sizeof(escape), "\\x%02x", byte);
            out += escape;
        } else {
            out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

// Whole-string numeric conversions; throw std::invalid_argument on trailing
// text and, for counts, on a sign
static double ParseReal(const std::string& value) {
    size_t consumed = 0;
    double result = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

static size_t ParseCount(const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw std::invalid_argument("not an unsigned integer");
    }
    size_t consumed = 0;
    unsigned long result = std::stoul(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return static_cast<size_t>(result);
}

// Apply one section/key/value triple; throws std::logic_error on bad numbers
static void ApplySetting(CliConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "extraction") {
        if (key == "min_support") config.extraction.min_support = ParseReal(value);
        else if (key == "min_confidence") config.extraction.min_confidence = ParseReal(value);
        else if (key == "min_lift") config.extraction.min_lift = ParseReal(value);
        else if (key == "name") config.extraction.name = value;
        else if (key == "num_threads") config.extraction.num_threads = ParseCount(value);
    }
    else if (section == "output") {
        if (key == "format") config.output.format = value;
        else if (key == "max_policies") config.output.max_policies = ParseCount(value);
        else if (key == "summary_policies") config.output.summary_policies = ParseCount(value);
    }
    else if (section == "interface") {
        if (key == "verbose") config.interface.verbose = ParseBool(value);
    }
}

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem != nullptr) {
                std::cerr << ": " << parser.problem
                          << " (line " << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::logic_error&) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# PolicyMiner CLI Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "extraction:\n";
    ss << "  min_support: " << FormatReal(extraction.min_support) << "\n";
    ss << "  min_confidence: " << FormatReal(extraction.min_confidence) << "\n";
    ss << "  min_lift: " << FormatReal(extraction.min_lift) << "\n";
    ss << "  name: " << QuoteYaml(extraction.name) << "\n";
    ss << "  num_threads: " << extraction.num_threads << "\n\n";

    ss << "output:\n";
    ss << "  format: " << QuoteYaml(output.format) << "\n";
    ss << "  max_policies: " << output.max_policies << "\n";
    ss << "  summary_policies: " << output.summary_policies << "\n\n";

    ss << "interface:\n";
    ss << "  verbose: " << (interface.verbose ? "true" : "false") << "\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate extraction thresholds
    if (!std::isfinite(extraction.min_support)) {
        errors.push_back("min_support must be a finite number");
    }
    if (!std::isfinite(extraction.min_confidence)) {
        errors.push_back("min_confidence must be a finite number");
    }
    if (!std::isfinite(extraction.min_lift)) {
        errors.push_back("min_lift must be a finite number");
    }
    if (extraction.num_threads == 0) {
        errors.push_back("num_threads must be greater than 0");
    }
    if (extraction.num_threads > PolicyExtractor::kMaxThreads) {
        errors.push_back("num_threads must be at most " +
                         std::to_string(PolicyExtractor::kMaxThreads));
    }

    // Validate output
    if (output.format != "text" &&
        output.format != "markdown" &&
        output.format != "json") {
        errors.push_back("format must be one of: text, markdown, json");
    }
    if (output.max_policies == 0) {
        errors.push_back("max_policies must be greater than 0");
    }

    return errors;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace policyminer
