//
// Created by gregorian-rayne on 10/9/26.
//

#include "syswalk/cli/commands/command.hpp"

#include <iostream>
#include <exception>
#include <string>
#include <vector>

int main(const int argc, char** argv) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);
        return syswalk::cli::run(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return syswalk::cli::exit_code::RuntimeFailure;
    }
}
