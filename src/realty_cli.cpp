/**
 * @file realty_cli.cpp
 * @brief `realty` executable: interactive listing catalog on stdin/stdout
 */

#include "cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return realty::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
