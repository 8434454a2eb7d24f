#include "cli/pnginfo.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return pdfimg::run_pnginfo(argc, argv, std::cout, std::cerr);
}
