#include "socksget/cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return socksget::runCli(argc, argv, std::cerr);
}
