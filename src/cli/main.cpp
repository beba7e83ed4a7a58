// File: src/cli/main.cpp
//
// PolicyMiner command-line entry point

#include "cli/policyminer_cli.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace policyminer;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        PolicyMinerCli cli(std::cout, std::cerr);
        return cli.Run(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return PolicyMinerCli::kExitFailure;
    }
}
