// File: src/cli/policyminer_cli.hpp
//
// PolicyMiner command-line interface
// Extracted from main() for testability

#ifndef POLICYMINER_CLI_HPP
#define POLICYMINER_CLI_HPP

#include "cli/cli_config.hpp"
#include <boost/program_options.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace policyminer {

/// Command-line front end for policy mining
///
/// Commands:
///   extract  mine policies from a JSONL behavior log file
///   format   render a saved JSON policy set as text, Markdown or JSON
///
/// Exit codes: 0 success, 1 runtime failure, 2 usage error.
class PolicyMinerCli {
public:
    static constexpr const char* kVersion = "0.1.0";

    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    PolicyMinerCli(std::ostream& out, std::ostream& err);

    /// Run one command
    /// @param args Arguments without the program name
    /// @return Process exit code
    int Run(const std::vector<std::string>& args);

private:
    std::ostream& out_;
    std::ostream& err_;

    // Commands
    int RunExtract(const boost::program_options::variables_map& vm);
    int RunFormat(const boost::program_options::variables_map& vm);

    // Option declarations
    static boost::program_options::options_description ExtractOptions();
    static boost::program_options::options_description FormatOptions();

    // Help
    void ShowHelp(std::ostream& os) const;
    void ShowCommandHelp(std::ostream& os, const std::string& command,
                         const std::string& summary,
                         const boost::program_options::options_description& desc) const;

    // Option handling
    /// Parse args against desc into vm; returns false after reporting a usage error
    bool ParseOptions(const std::string& command,
                      const std::vector<std::string>& args,
                      const boost::program_options::options_description& desc,
                      boost::program_options::variables_map& vm);
    std::optional<CliConfig> ResolveConfig(const boost::program_options::variables_map& vm);
    int UsageError(const std::string& command, const std::string& message);
};

} // namespace policyminer

#endif // POLICYMINER_CLI_HPP
