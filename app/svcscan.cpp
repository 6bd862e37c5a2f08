#include "svcscan/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        return svcscan::cli::run(argc, argv, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
