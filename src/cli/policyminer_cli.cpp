// File: src/cli/policyminer_cli.cpp
//
// PolicyMiner command-line interface
//
// Features:
// - extract: JSONL logs -> mined policy set saved as JSON
// - format: saved policy set -> text, Markdown or JSON
// - YAML configuration file for defaults, overridden by flags

#include "cli/policyminer_cli.hpp"
#include "io/log_parser.hpp"
#include "io/policy_formatter.hpp"
#include "io/policy_serializer.hpp"
#include "mining/policy_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace policyminer {

namespace po = boost::program_options;

namespace {

const char* kExtractSummary = "Extract governance policies from a JSONL behavior log file.";
const char* kFormatSummary = "Render a JSON policy set as text, Markdown, or JSON.";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

PolicyMinerCli::PolicyMinerCli(std::ostream& out, std::ostream& err)
    : out_(out),
      err_(err)
{
}

int PolicyMinerCli::Run(const std::vector<std::string>& args) {
    if (args.empty()) {
        ShowHelp(err_);
        return kExitUsage;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h") {
        ShowHelp(out_);
        return kExitSuccess;
    }
    if (command == "--version") {
        out_ << "policyminer, version " << kVersion << "\n";
        return kExitSuccess;
    }

    if (command == "extract" || command == "format") {
        bool extract = command == "extract";
        po::options_description desc = extract ? ExtractOptions() : FormatOptions();
        po::variables_map vm;

        if (!ParseOptions(command, rest, desc, vm)) {
            return kExitUsage;
        }
        if (vm.count("help")) {
            ShowCommandHelp(out_, command, extract ? kExtractSummary : kFormatSummary, desc);
            return kExitSuccess;
        }
        return extract ? RunExtract(vm) : RunFormat(vm);
    }

    err_ << "Error: No such command '" << command << "'.\n";
    ShowHelp(err_);
    return kExitUsage;
}

// ============================================================================
// Commands
// ============================================================================

int PolicyMinerCli::RunExtract(const po::variables_map& vm) {
    std::filesystem::path logs_path(vm["logs"].as<std::string>());
    if (!std::filesystem::exists(logs_path)) {
        return UsageError("extract", "Path '" + logs_path.string() + "' does not exist.");
    }

    auto config = ResolveConfig(vm);
    if (!config) {
        return kExitFailure;
    }

    PolicyExtractor::Config extractor_config;
    extractor_config.min_support = config->extraction.min_support;
    extractor_config.min_confidence = config->extraction.min_confidence;
    extractor_config.min_lift = config->extraction.min_lift;
    extractor_config.num_threads = config->extraction.num_threads;
    std::string name = config->extraction.name;

    // Flags override the configuration file
    if (vm.count("min-support")) extractor_config.min_support = vm["min-support"].as<double>();
    if (vm.count("min-confidence")) extractor_config.min_confidence = vm["min-confidence"].as<double>();
    if (vm.count("min-lift")) extractor_config.min_lift = vm["min-lift"].as<double>();
    if (vm.count("name")) name = vm["name"].as<std::string>();
    if (vm.count("threads")) {
        long long threads = vm["threads"].as<long long>();
        if (threads < 0 || threads > static_cast<long long>(PolicyExtractor::kMaxThreads)) {
            return UsageError("extract", "Invalid value for '--threads': must be between 0 and " +
                              std::to_string(PolicyExtractor::kMaxThreads) + ".");
        }
        extractor_config.num_threads = static_cast<size_t>(threads);
    }

    LogParser::Config parser_config;
    parser_config.verbose = config->interface.verbose;
    LogParser parser(parser_config);

    auto logs = parser.ParseFile(logs_path.string());
    out_ << "Parsed " << logs.size() << " valid log entries.\n";
    if (parser.GetSkippedCount() > 0) {
        out_ << "Skipped " << parser.GetSkippedCount() << " malformed lines.\n";
    }

    PolicyExtractor extractor(extractor_config);
    PolicySet policy_set = extractor.Extract(logs, name);
    out_ << "Mined " << policy_set.Size() << " policies.\n";

    std::filesystem::path dest = vm.count("output")
        ? std::filesystem::path(vm["output"].as<std::string>())
        : logs_path.parent_path() / "policies.json";

    PolicySerializer::SaveToFile(policy_set, dest.string());
    out_ << "Saved policy set to " << dest.string() << "\n";

    PolicyFormatter formatter;
    out_ << formatter.ToText(policy_set, config->output.summary_policies) << "\n";

    return kExitSuccess;
}

int PolicyMinerCli::RunFormat(const po::variables_map& vm) {
    const std::string& policies_path = vm["policies"].as<std::string>();
    if (!std::filesystem::exists(policies_path)) {
        return UsageError("format", "Path '" + policies_path + "' does not exist.");
    }

    auto config = ResolveConfig(vm);
    if (!config) {
        return kExitFailure;
    }

    std::string output_format = config->output.format;
    size_t max_policies = config->output.max_policies;

    if (vm.count("output-format")) {
        const std::string& requested = vm["output-format"].as<std::string>();
        output_format = ToLower(requested);
        if (output_format != "text" && output_format != "markdown" && output_format != "json") {
            return UsageError("format", "Invalid value for '--output-format': '" +
                              requested + "' is not one of 'text', 'markdown', 'json'.");
        }
    }
    if (vm.count("max-policies")) {
        long long requested = vm["max-policies"].as<long long>();
        if (requested < 0) {
            return UsageError("format", "Invalid value for '--max-policies': must not be negative.");
        }
        max_policies = static_cast<size_t>(requested);
    }

    PolicySet policy_set;
    try {
        policy_set = PolicySerializer::LoadFromFile(policies_path);
    } catch (const std::exception& e) {
        err_ << "ERROR loading policy set: " << e.what() << "\n";
        return kExitFailure;
    }

    PolicyFormatter formatter;
    if (output_format == "text") {
        out_ << formatter.ToText(policy_set, max_policies) << "\n";
    } else if (output_format == "markdown") {
        out_ << formatter.ToMarkdown(policy_set, max_policies) << "\n";
    } else {
        out_ << PolicySerializer::ToJsonString(policy_set) << "\n";
    }

    return kExitSuccess;
}

// ============================================================================
// Option Handling
// ============================================================================

po::options_description PolicyMinerCli::ExtractOptions() {
    po::options_description desc("Options");
    desc.add_options()
        ("logs", po::value<std::string>()->required()->value_name("PATH"),
            "Path to a JSONL behavior log file.")
        ("output", po::value<std::string>()->value_name("PATH"),
            "Output JSON path. Defaults to policies.json in the same directory.")
        ("min-support", po::value<double>()->value_name("FLOAT"),
            "Minimum support threshold (0.0 - 1.0). Default 0.05.")
        ("min-confidence", po::value<double>()->value_name("FLOAT"),
            "Minimum confidence threshold (0.0 - 1.0). Default 0.6.")
        ("min-lift", po::value<double>()->value_name("FLOAT"),
            "Minimum lift threshold. Default 1.0.")
        ("name", po::value<std::string>()->value_name("TEXT"),
            "Policy set name. Default \"Mined Policy Set\".")
        ("threads", po::value<long long>()->value_name("INTEGER"),
            "Counting threads. Default 1.")
        ("config", po::value<std::string>()->value_name("PATH"),
            "YAML configuration file.")
        ("help", "Show this message and exit.")
        ;
    return desc;
}

po::options_description PolicyMinerCli::FormatOptions() {
    po::options_description desc("Options");
    desc.add_options()
        ("policies", po::value<std::string>()->required()->value_name("PATH"),
            "Path to a JSON policies file.")
        ("output-format", po::value<std::string>()->value_name("text|markdown|json"),
            "Output format. Default text.")
        ("max-policies", po::value<long long>()->value_name("INTEGER"),
            "Maximum number of policies to render. Default 50.")
        ("config", po::value<std::string>()->value_name("PATH"),
            "YAML configuration file.")
        ("help", "Show this message and exit.")
        ;
    return desc;
}

bool PolicyMinerCli::ParseOptions(const std::string& command,
                                  const std::vector<std::string>& args,
                                  const po::options_description& desc,
                                  po::variables_map& vm) {
    try {
        po::parsed_options parsed = po::command_line_parser(args)
            .options(desc)
            .style(po::command_line_style::unix_style ^ po::command_line_style::allow_guessing)
            .run();

        auto extra = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!extra.empty()) {
            UsageError(command, "Got unexpected extra argument (" + extra.front() + ")");
            return false;
        }

        po::store(parsed, vm);
        if (vm.count("help")) {
            return true;
        }
        po::notify(vm);
    } catch (const po::required_option& e) {
        UsageError(command, "Missing option '" + e.get_option_name() + "'.");
        return false;
    } catch (const po::unknown_option& e) {
        UsageError(command, "No such option: " + e.get_option_name());
        return false;
    } catch (const po::error& e) {
        UsageError(command, e.what());
        return false;
    }

    return true;
}

std::optional<CliConfig> PolicyMinerCli::ResolveConfig(const po::variables_map& vm) {
    if (!vm.count("config")) {
        return CliConfig::Default();
    }

    const std::string& path = vm["config"].as<std::string>();
    auto config = CliConfig::LoadFromFile(path);
    if (!config) {
        err_ << "ERROR loading config: " << path << "\n";
    }
    return config;
}

int PolicyMinerCli::UsageError(const std::string& command, const std::string& message) {
    err_ << "Usage: policyminer " << command << " [OPTIONS]\n"
         << "Try 'policyminer " << command << " --help' for help.\n\n"
         << "Error: " << message << "\n";
    return kExitUsage;
}

// ============================================================================
// Help
// ============================================================================

void PolicyMinerCli::ShowHelp(std::ostream& os) const {
    os << "Usage: policyminer [OPTIONS] COMMAND [ARGS]...\n\n"
       << "  PolicyMiner -- governance policy extraction CLI.\n\n"
       << "Options:\n"
       << "  --version  Show the version and exit.\n"
       << "  --help     Show this message and exit.\n\n"
       << "Commands:\n"
       << "  extract  " << kExtractSummary << "\n"
       << "  format   " << kFormatSummary << "\n";
}

void PolicyMinerCli::ShowCommandHelp(std::ostream& os, const std::string& command,
                                     const std::string& summary,
                                     const po::options_description& desc) const {
    os << "Usage: policyminer " << command << " [OPTIONS]\n\n"
       << "  " << summary << "\n\n"
       << desc << "\n";
}

} // namespace policyminer
