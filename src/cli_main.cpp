#include <iostream>
#include "confmerge/Cli.hpp"

int main(int argc, char** argv) {
    return confmerge::run_cli(argc, argv, std::cout, std::cerr);
}
